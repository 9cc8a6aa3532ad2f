#pragma once

#include <string>

#include "models.hpp"
#include "utils.hpp"

namespace mrp {
namespace fixtures {
	///2024-03-01
	inline int today() { return Utils::daysFromCivil(2024, 3, 1); }

	ScenarioParams params(double saturationFactor = 1.0, bool extraShift = false, int horizonDays = 30);

	///every table present and empty
	Snapshot emptySnapshot();

	/**
	 * Three articles over three centers:
	 *  - A100: 100 due in 3 days, stock 20, wip 10, lot 50, one step on 910
	 *  - B200: 40 due in 10 days, no lot, steps 20@920 and 10@910
	 *  - C300: 5 due in 60 days, fully covered by stock
	 * Center 930 has no capacity row; 910 has 120h, 920 has 0h.
	 */
	Snapshot plantSnapshot();

	///unique scratch directory under the gtest temp dir
	std::string scratchDir(const std::string& name);
	void writeFile(const std::string& path, const std::string& content);
}
}

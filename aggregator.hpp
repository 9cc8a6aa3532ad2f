#pragma once

#include <vector>

#include "context.hpp"
#include "result.hpp"

namespace mrp {
	struct Aggregator {
		///Merge the partial results of all units into one scenario result.
		///@units is indexed by dispatch position, so the merge does not depend
		///on which worker finished first; the sequence is re-sorted canonically
		///before numbering anyway.
		static ScenarioResult aggregate(const std::vector<UnitResult>& units, const std::vector<UnitFailure>& failures, const Context& context);

		static SaturationRecord saturationOf(const std::string& center, double requiredHours, double availableHours);

		///days remaining, then article, center, phase and order reference
		static bool before(const ManufacturingOrder& lhs, const ManufacturingOrder& rhs);

		static std::string makeId(const ManufacturingOrder& mo);
	};
}

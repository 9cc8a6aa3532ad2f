#pragma once

#include <map>
#include <string>
#include <vector>

namespace mrp {
	///orders due within this many days (inclusive) are urgent
	const int URGENT_DAYS = 7;

	///required hours of a routing step whose hourly rate is zero
	const double ZERO_RATE_HOURS = 1.0e6;

	///upper bound of a saturation percentage, also used for zero-capacity centers
	const double SATURATION_CAP = 9999.0;

	///saturation above this percentage flags a bottleneck
	const double BOTTLENECK_PCT = 100.0;

	///default additional hours granted to every center by an extra shift
	const double DEFAULT_EXTRA_SHIFT_HOURS = 8.0;

	const char* const STATUS_URGENT = "URGENT";
	const char* const STATUS_NORMAL = "NORMAL";

	///center id -> hours
	typedef std::map<std::string, double> CenterLoad, * PCenterLoad;
}

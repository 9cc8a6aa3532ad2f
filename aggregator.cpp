#include "common.hpp"
#include "aggregator.hpp"

#include <algorithm>
#include <cstdio>
#include <map>

using namespace mrp;

bool
Aggregator::before(const ManufacturingOrder& lhs, const ManufacturingOrder& rhs) {
	if (lhs.daysRemaining != rhs.daysRemaining) return lhs.daysRemaining < rhs.daysRemaining;
	if (lhs.article != rhs.article) return lhs.article < rhs.article;
	if (lhs.center != rhs.center) return lhs.center < rhs.center;
	if (lhs.phase != rhs.phase) return lhs.phase < rhs.phase;
	return lhs.orderRef < rhs.orderRef;
}

std::string
Aggregator::makeId(const ManufacturingOrder& mo) {
	char number[16];
	std::snprintf(number, sizeof(number), "%05d", mo.number);
	return "MO-" + std::string(number) + "-" + mo.article + "-" + std::to_string(mo.phase);
}

SaturationRecord
Aggregator::saturationOf(const std::string& center, double requiredHours, double availableHours) {
	SaturationRecord record;
	record.center = center;
	record.requiredHours = requiredHours;
	record.availableHours = availableHours;
	if (availableHours <= 0) {
		///no capacity at all: any load saturates the center
		record.saturationPct = requiredHours > 0 ? SATURATION_CAP : 0.;
		record.bottleneck = requiredHours > 0;
		return record;
	}
	record.saturationPct = (std::min)(requiredHours / availableHours * 100, SATURATION_CAP);
	record.bottleneck = record.saturationPct > BOTTLENECK_PCT;
	return record;
}

ScenarioResult
Aggregator::aggregate(const std::vector<UnitResult>& units, const std::vector<UnitFailure>& failures, const Context& context) {
	ScenarioResult result;
	result.failures = failures;

	///1. concatenate, summing loads in dispatch order keeps the floating point sums reproducible
	std::map<std::string/*center*/, double/*hours*/> load;
	for (auto& unit : units) {
		if (unit.unrouted) result.unroutedOrders++;
		result.sequence.insert(result.sequence.end(), unit.orders.begin(), unit.orders.end());
		for (auto& e : unit.load) load[e.first] += e.second;
	}

	///2. canonical order and numbering
	std::stable_sort(result.sequence.begin(), result.sequence.end(), &Aggregator::before);
	for (size_t i = 0; i < result.sequence.size(); i++) {
		auto& mo = result.sequence[i];
		mo.number = (int)i + 1;
		mo.id = makeId(mo);
		if (mo.urgent) result.kpis.urgentArticles++;
	}

	///3. saturation per loaded center, ordered by center id
	double sumOfSaturation = 0.;
	for (auto& e : load) {
		auto record = saturationOf(e.first, e.second, context.capacityOf(e.first));
		result.saturation.push_back(record);
		result.kpis.totalRequiredHours += record.requiredHours;
		if (record.requiredHours > 0) {
			result.kpis.activeCenters++;
			sumOfSaturation += record.saturationPct;
		}
		if (record.bottleneck) result.bottlenecks.push_back(record);
	}

	std::sort(result.bottlenecks.begin(), result.bottlenecks.end(), [](const SaturationRecord& lhs, const SaturationRecord& rhs) {
		if (lhs.saturationPct != rhs.saturationPct) return lhs.saturationPct > rhs.saturationPct;
		return lhs.center < rhs.center;
	});

	result.kpis.totalOrders = (int)result.sequence.size();
	result.kpis.bottleneckCount = (int)result.bottlenecks.size();
	result.kpis.averageSaturation = result.kpis.activeCenters > 0 ? sumOfSaturation / result.kpis.activeCenters : 0.;
	return result;
}

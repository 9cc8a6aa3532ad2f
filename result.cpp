#include "utils.hpp"
#include "result.hpp"

#include <cmath>

using namespace mrp;

double
mrp::roundTo(double value, int digits) {
	double scale = std::pow(10., digits);
	return std::round(value * scale) / scale;
}

Json::Value
mrp::toJson(const ManufacturingOrder& mo) {
	Json::Value e;
	e["orderNumber"] = mo.number;
	e["moId"] = mo.id;
	e["article"] = mo.article;
	e["center"] = mo.center;
	e["phase"] = mo.phase;
	e["quantity"] = mo.quantity;
	e["status"] = mo.status();
	e["daysRemaining"] = mo.daysRemaining;
	e["requiredHours"] = roundTo(mo.requiredHours, 2);
	e["dueDate"] = Utils::formatDate(mo.dueDate);
	e["orderRef"] = mo.orderRef;
	return e;
}

Json::Value
mrp::toJson(const SaturationRecord& record) {
	Json::Value e;
	e["center"] = record.center;
	e["requiredHours"] = roundTo(record.requiredHours, 1);
	e["availableHours"] = roundTo(record.availableHours, 1);
	e["saturationPct"] = roundTo(record.saturationPct, 1);
	e["bottleneck"] = record.bottleneck;
	return e;
}

Json::Value
mrp::toJson(const Kpis& kpis) {
	Json::Value e;
	e["urgentArticles"] = kpis.urgentArticles;
	e["totalOrders"] = kpis.totalOrders;
	e["averageSaturation"] = roundTo(kpis.averageSaturation, 1);
	e["bottleneckCount"] = kpis.bottleneckCount;
	e["totalRequiredHours"] = roundTo(kpis.totalRequiredHours, 1);
	e["activeCenters"] = kpis.activeCenters;
	return e;
}

Json::Value
mrp::toJson(const ScenarioResult& result) {
	Json::Value root;
	root["sequence"] = Json::Value(Json::arrayValue);
	for (auto& mo : result.sequence) root["sequence"].append(toJson(mo));

	root["saturation"] = Json::Value(Json::arrayValue);
	for (auto& e : result.saturation) root["saturation"].append(toJson(e));

	root["kpis"] = toJson(result.kpis);

	root["bottlenecks"] = Json::Value(Json::arrayValue);
	for (auto& e : result.bottlenecks) root["bottlenecks"].append(toJson(e));

	Json::Value warnings;
	warnings["failedUnits"] = (int)result.failures.size();
	warnings["unroutedOrders"] = result.unroutedOrders;
	root["warnings"] = warnings;

	root["failures"] = Json::Value(Json::arrayValue);
	for (auto& f : result.failures) {
		Json::Value e;
		e["unit"] = (Json::UInt64)f.unit;
		e["article"] = f.article;
		e["message"] = f.message;
		root["failures"].append(e);
	}
	return root;
}

int
mrp::writeCsv(const ScenarioResult& result, const std::string& directory) {
	std::string base = directory.empty() || directory.back() == '/' ? directory : directory + "/";
	CSVWriter sequence(base + "sequence.csv",
		{ "ORDER", "MO", "ARTICLE", "CENTER", "PHASE", "QUANTITY", "STATUS", "DAYS", "HOURS", "DUE", "REF" }, false);
	if (!sequence.good()) return -1;
	for (auto& mo : result.sequence) {
		sequence.write({
			std::to_string(mo.number),
			mo.id,
			mo.article,
			mo.center,
			std::to_string(mo.phase),
			std::to_string(mo.quantity),
			mo.status(),
			std::to_string(mo.daysRemaining),
			std::to_string(roundTo(mo.requiredHours, 2)),
			Utils::formatDate(mo.dueDate),
			mo.orderRef
			});
	}

	CSVWriter saturation(base + "saturation.csv", { "CENTER", "REQUIRED", "AVAILABLE", "SATURATION", "BOTTLENECK" }, false);
	if (!saturation.good()) return -2;
	for (auto& e : result.saturation) {
		saturation.write({
			e.center,
			std::to_string(roundTo(e.requiredHours, 1)),
			std::to_string(roundTo(e.availableHours, 1)),
			std::to_string(roundTo(e.saturationPct, 1)),
			e.bottleneck ? "1" : "0"
			});
	}
	return 0;
}

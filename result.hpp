#pragma once

#include <string>
#include <vector>

#include <json/json.h>

#include "common.hpp"

namespace mrp {
	typedef struct ManufacturingOrder {
		int number = 0;	///assigned by the aggregator, 1 based
		std::string id;
		std::string article;
		std::string center;
		int phase = 0;	///routing sequence position
		double quantity = 0;
		double requiredHours = 0;
		int dueDate = 0;
		bool urgent = false;
		int daysRemaining = 0;
		std::string orderRef;

		const char* status() const { return urgent ? STATUS_URGENT : STATUS_NORMAL; }
	} *PManufacturingOrder;

	typedef struct SaturationRecord {
		std::string center;
		double requiredHours = 0;
		double availableHours = 0;
		double saturationPct = 0;
		bool bottleneck = false;
	} *PSaturationRecord;

	typedef struct Kpis {
		int urgentArticles = 0;
		int totalOrders = 0;
		double averageSaturation = 0;
		int bottleneckCount = 0;
		double totalRequiredHours = 0;
		int activeCenters = 0;
	} *PKpis;

	typedef struct UnitFailure {
		size_t unit = 0;	///index of the order in the dispatched list
		std::string article;
		std::string message;
	} *PUnitFailure;

	///what one worker returns for one order
	typedef struct UnitResult {
		std::vector<ManufacturingOrder> orders;
		CenterLoad load;
		bool skipped = false;	///outside the horizon
		bool unrouted = false;	///net requirement but no routing
	} *PUnitResult;

	typedef struct ScenarioResult {
		std::vector<ManufacturingOrder> sequence;
		std::vector<SaturationRecord> saturation;
		Kpis kpis;
		std::vector<SaturationRecord> bottlenecks;
		std::vector<UnitFailure> failures;
		int unroutedOrders = 0;
		int consideredOrders = 0;	///orders inside the horizon
	} *PScenarioResult;

	Json::Value toJson(const ManufacturingOrder& mo);
	Json::Value toJson(const SaturationRecord& record);
	Json::Value toJson(const Kpis& kpis);
	Json::Value toJson(const ScenarioResult& result);

	///sequence.csv and saturation.csv in @directory
	///@return: 0 on success, <0 when a file cannot be written
	int writeCsv(const ScenarioResult& result, const std::string& directory);

	///round half away from zero to @digits decimals
	double roundTo(double value, int digits);
}

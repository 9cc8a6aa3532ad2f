#pragma once

#include <string>
#include <vector>
#include <memory>
#include <utility>

namespace mrp {
	typedef struct Order {
		std::string article;
		double quantity = 0;
		int dueDate = 0;	///days since 1970-01-01
		std::string ref;	///customer order number, may be empty

		Order() {}
		Order(const std::string& article, double quantity, int dueDate, const std::string& ref = "")
			: article(article), quantity(quantity), dueDate(dueDate), ref(ref) {}
	} *POrder;

	typedef struct RoutingStep {
		std::string article;
		int sequence = 0;	///phase, 10, 20, 30...
		std::string center;
		double setupTime = 0;
		double hourlyRate = 0;	///units per hour

		RoutingStep() {}
		RoutingStep(const std::string& article, int sequence, const std::string& center, double setupTime, double hourlyRate)
			: article(article), sequence(sequence), center(center), setupTime(setupTime), hourlyRate(hourlyRate) {}
	} *PRoutingStep;

	typedef struct StockLevel {
		std::string article;
		double quantity = 0;
	} *PStockLevel;

	typedef struct WipRecord {
		std::string article;
		double quantity = 0;
	} *PWipRecord;

	typedef struct LotRule {
		std::string article;
		double lotSize = 0;
	} *PLotRule;

	typedef struct CenterCapacity {
		std::string center;
		double hours = 0;
	} *PCenterCapacity;

	///a table which may be absent from the source altogether
	template<typename T>
	struct Table {
		bool present = false;
		std::vector<T> rows;

		Table() {}
		Table(std::vector<T> rows) : present(true), rows(std::move(rows)) {}

		void push_back(const T& row) { present = true; rows.push_back(row); }
		size_t size() const { return rows.size(); }
		bool empty() const { return rows.empty(); }
	};

	///one immutable load of the six input tables
	typedef struct Snapshot {
		Table<Order> orders;
		Table<RoutingStep> routingSteps;
		Table<StockLevel> stock;
		Table<WipRecord> wip;
		Table<LotRule> lotRules;
		Table<CenterCapacity> centerCapacity;
		std::string source;	///file or directory it was read from
	} *PSnapshot;

	typedef std::shared_ptr<const Snapshot> SnapshotPtr;

	typedef struct ScenarioParams {
		double saturationFactor = 1.0;
		bool extraShift = false;
		int horizonDays = 30;
		///reference day, <0 means the current date
		int today = -1;
	} *PScenarioParams;
}

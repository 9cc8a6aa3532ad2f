#include "common.hpp"
#include "utils.hpp"
#include "models.hpp"
#include "loader.hpp"
#include "globlecontext.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>

#include <json/json.h>

using namespace mrp;

//static
PGlobleContextManager GlobleContextManager::instance = nullptr;

void
Columns::index(const Row& header) {
	clear();
	for (int i = 0; i < (int)header.size(); i++) {
		std::string name = Utils::trim(header[i]);
		std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) { return (char)std::tolower(c); });
		if (count(name) == 0) (*this)[name] = i;
	}
}

int
Columns::find(std::initializer_list<const char*> names) const {
	for (auto name : names) {
		auto it = std::map<std::string, int>::find(name);
		if (it != end()) return it->second;
	}
	return -1;
}

///column names accept the english headers and the ones of the planning workbook
bool
OrdersLoader::bind(const Columns& columns) {
	article = columns.find({ "article", "articulo" });
	quantity = columns.find({ "quantity", "cantidad" });
	dueDate = columns.find({ "due_date", "duedate", "fecha_entrega" });
	ref = columns.find({ "order", "ref", "pedido" });
	return article >= 0 && quantity >= 0 && dueDate >= 0;
}

bool
OrdersLoader::parse(const Row& row, Order& value) {
	std::string date;
	if (!cell(row, article, value.article)) return false;
	if (!number(row, quantity, value.quantity)) return false;
	if (!cell(row, dueDate, date) || !Utils::parseDate(date, value.dueDate)) return false;
	cell(row, ref, value.ref);
	return true;
}

bool
RoutingLoader::bind(const Columns& columns) {
	article = columns.find({ "article", "articulo" });
	sequence = columns.find({ "sequence", "phase", "fase" });
	center = columns.find({ "center", "centro" });
	setupTime = columns.find({ "setup_time", "setup", "t_prep" });
	hourlyRate = columns.find({ "hourly_rate", "rate", "prod_horaria" });
	return article >= 0 && sequence >= 0 && center >= 0 && hourlyRate >= 0;
}

bool
RoutingLoader::parse(const Row& row, RoutingStep& value) {
	double position = 0;
	if (!cell(row, article, value.article)) return false;
	if (!cell(row, center, value.center)) return false;
	if (!number(row, sequence, position)) return false;
	value.sequence = (int)position;
	///an empty rate or setup is a zero, not a malformed row
	if (!number(row, setupTime, value.setupTime)) value.setupTime = 0;
	if (!number(row, hourlyRate, value.hourlyRate)) value.hourlyRate = 0;
	return value.setupTime >= 0 && value.hourlyRate >= 0;
}

bool
StockLoader::bind(const Columns& columns) {
	article = columns.find({ "article", "articulo" });
	quantity = columns.find({ "quantity", "stock" });
	return article >= 0 && quantity >= 0;
}

bool
StockLoader::parse(const Row& row, StockLevel& value) {
	if (!cell(row, article, value.article)) return false;
	if (!number(row, quantity, value.quantity)) value.quantity = 0;
	return value.quantity >= 0;
}

bool
WipLoader::bind(const Columns& columns) {
	article = columns.find({ "article", "articulo" });
	quantity = columns.find({ "quantity", "cantidad_total", "cantidad" });
	return article >= 0 && quantity >= 0;
}

bool
WipLoader::parse(const Row& row, WipRecord& value) {
	if (!cell(row, article, value.article)) return false;
	if (!number(row, quantity, value.quantity)) value.quantity = 0;
	return value.quantity >= 0;
}

bool
LotRulesLoader::bind(const Columns& columns) {
	article = columns.find({ "article", "articulo" });
	lotSize = columns.find({ "lot_size", "lot", "lote_produccion", "lote" });
	return article >= 0 && lotSize >= 0;
}

bool
LotRulesLoader::parse(const Row& row, LotRule& value) {
	if (!cell(row, article, value.article)) return false;
	if (!number(row, lotSize, value.lotSize)) value.lotSize = 0;
	return true;
}

bool
CapacityLoader::bind(const Columns& columns) {
	center = columns.find({ "center", "centro" });
	hours = columns.find({ "hours", "available_hours", "capacidad_horas" });
	return center >= 0 && hours >= 0;
}

bool
CapacityLoader::parse(const Row& row, CenterCapacity& value) {
	if (!cell(row, center, value.center)) return false;
	if (!number(row, hours, value.hours)) value.hours = 0;
	return value.hours >= 0;
}

int
SnapshotLoader::load(Snapshot& snapshot, const std::string& directory) {
	std::string base = directory.empty() || directory.back() == '/' ? directory : directory + "/";
	int loaded = 0;
	auto count = [&](int ok, const char* name) {
		if (ok == 0) loaded++;
		else Utils::log(2, "table %s not loaded from %s (%d)\n", name, directory.data(), ok);
	};
	count(OrdersLoader().load(snapshot.orders, base + "orders.csv"), "orders");
	count(RoutingLoader().load(snapshot.routingSteps, base + "routing.csv"), "routing");
	count(StockLoader().load(snapshot.stock, base + "stock.csv"), "stock");
	count(WipLoader().load(snapshot.wip, base + "wip.csv"), "wip");
	count(LotRulesLoader().load(snapshot.lotRules, base + "lots.csv"), "lots");
	count(CapacityLoader().load(snapshot.centerCapacity, base + "capacity.csv"), "capacity");
	snapshot.source = directory;
	if (loaded == 0) {
		Utils::log(-1, "no table found in %s\n", directory.data());
		return -1;
	}
	return 0;
}

namespace {
	///jsoncpp values may carry numbers as strings, as the spreadsheet export does
	bool asNumber(const Json::Value& value, double& result) {
		if (value.isNumeric()) {
			result = value.asDouble();
			return true;
		}
		if (value.isString()) return Utils::parseNumber(value.asString(), result);
		return false;
	}

	std::string asText(const Json::Value& value) {
		if (value.isString()) return Utils::trim(value.asString());
		if (value.isIntegral()) return std::to_string(value.asLargestInt());
		if (value.isNumeric()) return Utils::trim(value.asString());
		return "";
	}

	template<typename T, typename Parse>
	void readTable(const Json::Value& root, const char* name, Table<T>& table, Parse parse) {
		const Json::Value& rows = root[name];
		if (!rows.isArray()) {
			Utils::log(2, "table %s absent from snapshot document\n", name);
			return;
		}
		std::vector<T> loaded;
		int skipped = 0;
		for (auto& row : rows) {
			T value;
			if (row.isObject() && parse(row, value)) loaded.push_back(value);
			else skipped++;
		}
		if (skipped > 0) Utils::log(2, "table %s: %d of %u rows skipped\n", name, skipped, rows.size());
		table = Table<T>(loaded);
	}
}

int
SnapshotJsonLoader::load(Snapshot& snapshot, const std::string& filename) {
	std::ifstream is(filename);
	if (!is) {
		Utils::log(-1, "failed to open snapshot file: %s\n", filename.data());
		return -1;
	}
	Json::CharReaderBuilder builder;
	Json::Value root;
	JSONCPP_STRING errs;
	if (!Json::parseFromStream(builder, is, &root, &errs)) {
		Utils::log(-1, "failed to parse %s: %s\n", filename.data(), errs.data());
		return -2;
	}
	if (!root.isObject()) {
		Utils::log(-1, "%s: snapshot document must be an object\n", filename.data());
		return -3;
	}

	readTable(root, "orders", snapshot.orders, [](const Json::Value& row, Order& value) {
		value.article = asText(row["article"]);
		value.ref = asText(row["ref"]);
		return !value.article.empty()
			&& asNumber(row["quantity"], value.quantity)
			&& Utils::parseDate(asText(row["dueDate"]), value.dueDate);
	});
	readTable(root, "routingSteps", snapshot.routingSteps, [](const Json::Value& row, RoutingStep& value) {
		double position = 0;
		value.article = asText(row["article"]);
		value.center = asText(row["center"]);
		if (value.article.empty() || value.center.empty() || !asNumber(row["sequence"], position)) return false;
		value.sequence = (int)position;
		if (!asNumber(row["setupTime"], value.setupTime)) value.setupTime = 0;
		if (!asNumber(row["hourlyRate"], value.hourlyRate)) value.hourlyRate = 0;
		return value.setupTime >= 0 && value.hourlyRate >= 0;
	});
	readTable(root, "stock", snapshot.stock, [](const Json::Value& row, StockLevel& value) {
		value.article = asText(row["article"]);
		return !value.article.empty() && asNumber(row["quantity"], value.quantity) && value.quantity >= 0;
	});
	readTable(root, "wip", snapshot.wip, [](const Json::Value& row, WipRecord& value) {
		value.article = asText(row["article"]);
		return !value.article.empty() && asNumber(row["quantity"], value.quantity) && value.quantity >= 0;
	});
	readTable(root, "lotRules", snapshot.lotRules, [](const Json::Value& row, LotRule& value) {
		value.article = asText(row["article"]);
		return !value.article.empty() && asNumber(row["lotSize"], value.lotSize);
	});
	readTable(root, "centerCapacity", snapshot.centerCapacity, [](const Json::Value& row, CenterCapacity& value) {
		value.center = asText(row["center"]);
		return !value.center.empty() && asNumber(row["hours"], value.hours) && value.hours >= 0;
	});
	snapshot.source = filename;
	return 0;
}

int
GlobleContextLoader::load(GlobleContextManager& context, const std::string& filename) {
	int result = CSVLoader(filename).load([&](int, Row& row) {
		auto value = [&](size_t i, const std::string& fallback) {
			return (i < row.size() && !Utils::trim(row[i]).empty()) ? Utils::trim(row[i]) : fallback;
		};
		if (row[0] == "MQInfo") {
			context.mqHost = value(1, "127.0.0.1");
			context.mqUsername = value(2, "");
			context.mqPassword = value(3, "");
			context.mqQueueName = value(4, "mrp.core");
			Utils::parseInt(value(5, "5672"), context.port);
		}
		else if (row[0] == "mrp.mq.enabled") {
			Utils::parseInt(value(1, "0"), context.mqEnabled);
		}
		else if (row[0] == "mrp.orchestrator.workers") {
			Utils::parseInt(value(1, "0"), context.workers);	///0 = one per hardware thread
			if (context.workers < 0) context.workers = 0;
		}
		else if (row[0] == "mrp.capacity.extra-shift-hours") {
			double hours = DEFAULT_EXTRA_SHIFT_HOURS;
			if (Utils::parseNumber(value(1, "8"), hours) && hours >= 0) context.extraShiftHours = hours;
			else Utils::log(2, "ignored extra shift hours: %s\n", row.size() > 1 ? row[1].data() : "");
		}
		else if (row[0] == "mrp.output.csv") {
			Utils::parseInt(value(1, "0"), context.isResultExported);
		}
		else if (row[0] == "mrp.output.dir") {
			context.outputDir = value(1, ".");
		}
		else {
			Utils::log(2, "unknown setting: %s\n", row[0].data());
		}
	});
	return result;
}

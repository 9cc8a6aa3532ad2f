#include <iostream>
#include <string>
#include <ctime>

#include "common.hpp"
#include "utils.hpp"
#include "errors.hpp"
#include "models.hpp"
#include "loader.hpp"
#include "context.hpp"
#include "datastore.hpp"
#include "orchestrator.hpp"
#include "result.hpp"
#include "mq.hpp"
#include "globlecontext.hpp"

#include <json/json.h>

using namespace mrp;

void printHelp() {
	std::cout << "mrp-core <data-dir|snapshot.json> [saturationFactor=1.0] [extraShift=0] [horizonDays=30] [settings.csv]\n";
}

void printStartupInfo() {
	std::cout << "mrp-core starting ...\n";
}

static bool endsWith(const std::string& s, const std::string& suffix) {
	return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

int publish(const std::string& message) {
	GlobleContextManager& gContext = *GlobleContextManager::getGlobleContextManager();
	MQ mq(gContext.mqHost, gContext.mqUsername, gContext.mqPassword, gContext.mqQueueName, gContext.port);
	int sc = mq.init();
	if (0 != sc) {
		Utils::log(-1, "init mq fail: %d\n", sc);
		return sc;
	}
	Utils::log(1, "connected to mq {host: %s, user: %s, queue: %s, port: %d}\n",
		gContext.mqHost.data(),
		gContext.mqUsername.data(),
		gContext.mqQueueName.data(),
		gContext.port);
	sc = mq.send(message);
	mq.deinit();
	return sc;
}

int main(int argc, char* argv[]) {
	GlobleContextManager& gContext = *GlobleContextManager::getGlobleContextManager();
	printStartupInfo();
	if (argc < 2) {
		printHelp();
		return 0;
	}

	std::string input = argv[1];
	ScenarioParams params;
	if ((argc > 2 && !Utils::parseNumber(argv[2], params.saturationFactor))
		|| (argc > 4 && !Utils::parseInt(argv[4], params.horizonDays))) {
		Utils::log(-1, "invalid scenario arguments\n");
		printHelp();
		return -3;
	}
	if (argc > 3) params.extraShift = std::string(argv[3]) == "1" || std::string(argv[3]) == "true";

	if (argc > 5) {
		int ok = GlobleContextLoader().load(gContext, argv[5]);
		if (0 != ok) {
			Utils::log(-1, "Failed to load settings from %s\n", argv[5]);
			return -6;
		}
	}

	Utils::log(0, "- input: %s\n", input.data());
	Snapshot snapshot;
	int ok = endsWith(input, ".json")
		? SnapshotJsonLoader().load(snapshot, input)
		: SnapshotLoader().load(snapshot, input);
	if (0 != ok) {
		Utils::log(-1, "Failed to load snapshot: %d\n", ok);
		return -1;
	}

	try {
		loadContext(std::move(snapshot));
	}
	catch (const SchemaError& e) {
		Utils::log(-1, "%s\n", e.what());
		return -2;
	}

	auto t0 = std::time(0);
	ScenarioResult result;
	try {
		result = calculateScenario(params);
	}
	catch (const ScenarioValidationError& e) {
		Utils::log(-1, "%s\n", e.what());
		return -4;
	}
	catch (const EmptyScenarioError& e) {
		Utils::log(-1, "%s\n", e.what());
		return -5;
	}
	catch (const Error& e) {
		Utils::log(-1, "%s\n", e.what());
		return -7;
	}

	Json::StreamWriterBuilder builder;
	builder["indentation"] = "  ";
	const std::string document = Json::writeString(builder, toJson(result));
	std::cout << document << "\n";

	int state = 0;
	if (gContext.isResultExported) {
		if (0 != writeCsv(result, gContext.outputDir)) {
			Utils::log(-1, "failed to export csv to %s\n", gContext.outputDir.data());
			state = -9;
		}
	}
	if (gContext.mqEnabled) {
		if (0 != publish(document)) state = -8;
	}

	Utils::log(1, "finished in %ld s, %d manufacturing orders, %d bottlenecks\n",
		(long)(std::time(0) - t0), result.kpis.totalOrders, result.kpis.bottleneckCount);
	std::cout << "stopped with state: " << state << "\n";
	return state;
}

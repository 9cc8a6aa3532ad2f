#include "fixtures.hpp"

#include <fstream>
#include <sys/stat.h>

#include <gtest/gtest.h>

namespace mrp {
namespace fixtures {

ScenarioParams params(double saturationFactor, bool extraShift, int horizonDays) {
	ScenarioParams p;
	p.saturationFactor = saturationFactor;
	p.extraShift = extraShift;
	p.horizonDays = horizonDays;
	p.today = today();
	return p;
}

Snapshot emptySnapshot() {
	Snapshot snapshot;
	snapshot.orders.present = true;
	snapshot.routingSteps.present = true;
	snapshot.stock.present = true;
	snapshot.wip.present = true;
	snapshot.lotRules.present = true;
	snapshot.centerCapacity.present = true;
	return snapshot;
}

Snapshot plantSnapshot() {
	Snapshot snapshot = emptySnapshot();
	snapshot.orders.push_back(Order("A100", 100, today() + 3, "P-1"));
	snapshot.orders.push_back(Order("B200", 40, today() + 10, "P-2"));
	snapshot.orders.push_back(Order("C300", 5, today() + 60, "P-3"));

	snapshot.routingSteps.push_back(RoutingStep("A100", 10, "910", 0.0833, 60));
	snapshot.routingSteps.push_back(RoutingStep("B200", 20, "920", 1, 20));
	snapshot.routingSteps.push_back(RoutingStep("B200", 10, "910", 0.5, 40));
	snapshot.routingSteps.push_back(RoutingStep("C300", 10, "930", 0, 10));

	snapshot.stock.push_back(StockLevel{ "A100", 20 });
	snapshot.stock.push_back(StockLevel{ "C300", 10 });
	snapshot.wip.push_back(WipRecord{ "A100", 10 });

	snapshot.lotRules.push_back(LotRule{ "A100", 50 });

	snapshot.centerCapacity.push_back(CenterCapacity{ "910", 120 });
	snapshot.centerCapacity.push_back(CenterCapacity{ "920", 0 });
	return snapshot;
}

std::string scratchDir(const std::string& name) {
	static int counter = 0;
	std::string dir = ::testing::TempDir() + "mrp_" + name + "_" + std::to_string(counter++);
	::mkdir(dir.c_str(), 0755);
	return dir;
}

void writeFile(const std::string& path, const std::string& content) {
	std::ofstream os(path, std::ofstream::out | std::ofstream::trunc);
	os << content;
}

}
}

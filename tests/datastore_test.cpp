#include <gtest/gtest.h>

#include <thread>
#include <vector>

#include "errors.hpp"
#include "globlecontext.hpp"
#include "datastore.hpp"
#include "orchestrator.hpp"
#include "fixtures.hpp"

using namespace mrp;

namespace {
	struct DataStoreTest : public ::testing::Test {
		DataStore& store = *DataStore::getDataStore();

		void SetUp() override {
			store.clear();
			GlobleContextManager::getGlobleContextManager()->reset();
		}
		void TearDown() override {
			store.clear();
		}
	};
}

TEST_F(DataStoreTest, EmptyBeforeFirstLoad) {
	EXPECT_FALSE(store.loaded());
	EXPECT_FALSE(store.context());
	EXPECT_FALSE(store.snapshot());
	EXPECT_THROW(Orchestrator(1, 8).calculateScenario(fixtures::params()), Error);
}

TEST_F(DataStoreTest, LoadInstallsSnapshotAndContext) {
	long before = store.version();
	auto context = loadContext(fixtures::plantSnapshot());

	ASSERT_TRUE(store.loaded());
	EXPECT_EQ(context, store.context());
	EXPECT_EQ(before + 1, store.version());
	EXPECT_EQ(store.version(), context->version);
	EXPECT_EQ(3u, store.snapshot()->orders.size());
	EXPECT_DOUBLE_EQ(20, context->stockOf("A100"));
}

TEST_F(DataStoreTest, FailedLoadKeepsPreviousSnapshot) {
	auto first = loadContext(fixtures::plantSnapshot());
	long version = store.version();

	Snapshot broken = fixtures::plantSnapshot();
	broken.routingSteps = Table<RoutingStep>();
	EXPECT_THROW(loadContext(broken), SchemaError);

	EXPECT_EQ(first, store.context());
	EXPECT_EQ(version, store.version());
}

TEST_F(DataStoreTest, ReloadLeavesHeldContextIntact) {
	auto first = loadContext(fixtures::plantSnapshot());
	SnapshotPtr held;
	ContextPtr heldContext;
	store.acquire(held, heldContext);

	Snapshot next = fixtures::emptySnapshot();
	next.stock.push_back(StockLevel{ "A100", 999 });
	auto second = loadContext(next);

	EXPECT_NE(first, second);
	EXPECT_EQ(first, heldContext);
	EXPECT_EQ(3u, held->orders.size());
	EXPECT_DOUBLE_EQ(20, heldContext->stockOf("A100"));
	EXPECT_DOUBLE_EQ(999, store.context()->stockOf("A100"));
	EXPECT_GT(second->version, first->version);
}

TEST_F(DataStoreTest, ScenarioRunsOverInstalledSnapshot) {
	loadContext(fixtures::plantSnapshot());
	GlobleContextManager::getGlobleContextManager()->workers = 2;

	auto result = calculateScenario(fixtures::params());
	EXPECT_EQ(3, result.kpis.totalOrders);
	EXPECT_EQ(2, result.kpis.bottleneckCount);

	///global extra shift hours apply to the free function
	GlobleContextManager::getGlobleContextManager()->extraShiftHours = 40;
	result = calculateScenario(fixtures::params(1.0, true));
	ASSERT_EQ(2u, result.saturation.size());
	EXPECT_DOUBLE_EQ(160, result.saturation[0].availableHours);
	EXPECT_DOUBLE_EQ(40, result.saturation[1].availableHours);
}

TEST_F(DataStoreTest, OneInstanceAcrossThreads) {
	std::vector<PDataStore> seen(8, nullptr);
	std::vector<std::thread> threads;
	for (size_t i = 0; i < seen.size(); i++) {
		threads.emplace_back([&seen, i]() { seen[i] = DataStore::getDataStore(); });
	}
	for (auto& t : threads) t.join();
	for (auto e : seen) EXPECT_EQ(&store, e);
}

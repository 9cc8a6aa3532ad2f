#include <gtest/gtest.h>

#include "errors.hpp"
#include "globlecontext.hpp"
#include "loader.hpp"
#include "context.hpp"
#include "fixtures.hpp"

using namespace mrp;

namespace {
	void writePlant(const std::string& dir) {
		fixtures::writeFile(dir + "/orders.csv",
			"# open customer orders\n"
			"Article,Quantity,Due_Date,Order\n"
			"A100,100,2024-03-04,P-1\n"
			"B200, 40 ,2024-03-11 00:00:00,P-2\n"
			"\n"
			"C300,abc,2024-04-30,P-3\n"
			"D400,5,not-a-date,P-4\n"
			"E500,5,2024-02-30,P-5\n"
			"F600,5,2024-03-04xyz,P-6\n");
		fixtures::writeFile(dir + "/routing.csv",
			"articulo,fase,centro,t_prep,prod_horaria\r\n"
			"A100,10,910,0.0833,60\r\n"
			"B200,20,920,1,20\r\n"
			"B200,10,910,,40\r\n");
		fixtures::writeFile(dir + "/stock.csv", "article,stock\nA100,12\nA100,8\n");
		fixtures::writeFile(dir + "/wip.csv", "articulo,cantidad_total\nA100,10\n");
		fixtures::writeFile(dir + "/lots.csv", "articulo,lote_produccion\nA100,50\n");
		fixtures::writeFile(dir + "/capacity.csv", "centro,capacidad_horas\n910,120\n920,0\n");
	}
}

TEST(Loader, ColumnsAreMatchedByName) {
	Columns columns;
	columns.index({ " Quantity", "ARTICLE", "article" });
	EXPECT_EQ(1, columns.find({ "article" }));
	EXPECT_EQ(0, columns.find({ "cantidad", "quantity" }));
	EXPECT_EQ(-1, columns.find({ "due_date" }));
}

TEST(Loader, LoadsSnapshotDirectory) {
	std::string dir = fixtures::scratchDir("plant");
	writePlant(dir);

	Snapshot snapshot;
	ASSERT_EQ(0, SnapshotLoader().load(snapshot, dir));
	EXPECT_EQ(dir, snapshot.source);

	///the unparsable quantity and date rows are skipped, impossible days included
	ASSERT_EQ(2u, snapshot.orders.size());
	EXPECT_EQ("A100", snapshot.orders.rows[0].article);
	EXPECT_EQ(fixtures::today() + 3, snapshot.orders.rows[0].dueDate);
	EXPECT_EQ("P-1", snapshot.orders.rows[0].ref);
	EXPECT_DOUBLE_EQ(40, snapshot.orders.rows[1].quantity);
	EXPECT_EQ(fixtures::today() + 10, snapshot.orders.rows[1].dueDate);

	ASSERT_EQ(3u, snapshot.routingSteps.size());
	EXPECT_DOUBLE_EQ(0, snapshot.routingSteps.rows[2].setupTime);
	EXPECT_DOUBLE_EQ(40, snapshot.routingSteps.rows[2].hourlyRate);

	auto context = ContextBuilder::build(snapshot);
	EXPECT_DOUBLE_EQ(20, context->stockOf("A100"));
	EXPECT_DOUBLE_EQ(10, context->wipOf("A100"));
	EXPECT_DOUBLE_EQ(50, context->lotSizeOf("A100"));
	EXPECT_DOUBLE_EQ(120, context->capacityOf("910"));
	EXPECT_EQ("910", context->routingOf("B200")[0].center);
}

TEST(Loader, MissingFileLeavesTableAbsent) {
	std::string dir = fixtures::scratchDir("partial");
	writePlant(dir);
	std::remove((dir + "/wip.csv").c_str());

	Snapshot snapshot;
	ASSERT_EQ(0, SnapshotLoader().load(snapshot, dir));
	EXPECT_FALSE(snapshot.wip.present);
	EXPECT_TRUE(snapshot.stock.present);
	try {
		ContextBuilder::build(snapshot);
		FAIL() << "expected SchemaError";
	}
	catch (const SchemaError& e) {
		EXPECT_EQ("wip", e.table);
	}
}

TEST(Loader, HeaderWithoutRequiredColumnsIsRejected) {
	std::string dir = fixtures::scratchDir("header");
	fixtures::writeFile(dir + "/capacity.csv", "center,comment\n910,none\n");

	Table<CenterCapacity> table;
	EXPECT_EQ(-2, CapacityLoader().load(table, dir + "/capacity.csv"));
	EXPECT_FALSE(table.present);
	EXPECT_EQ(-1, CapacityLoader().load(table, dir + "/absent.csv"));
}

TEST(Loader, EmptyDirectoryFails) {
	Snapshot snapshot;
	EXPECT_EQ(-1, SnapshotLoader().load(snapshot, fixtures::scratchDir("empty")));
}

TEST(Loader, LoadsSnapshotDocument) {
	std::string dir = fixtures::scratchDir("json");
	fixtures::writeFile(dir + "/snapshot.json", R"({
		"orders": [
			{ "article": "A100", "quantity": 100, "dueDate": "2024-03-04", "ref": "P-1" },
			{ "article": "B200", "quantity": "40", "dueDate": "2024-03-11" },
			{ "article": "", "quantity": 1, "dueDate": "2024-03-11" }
		],
		"routingSteps": [
			{ "article": "A100", "sequence": 10, "center": 910, "setupTime": 0.0833, "hourlyRate": 60 }
		],
		"stock": [ { "article": "A100", "quantity": 20 } ],
		"wip": [],
		"lotRules": [ { "article": "A100", "lotSize": 50 } ],
		"centerCapacity": [ { "center": "910", "hours": 120 } ]
	})");

	Snapshot snapshot;
	ASSERT_EQ(0, SnapshotJsonLoader().load(snapshot, dir + "/snapshot.json"));
	ASSERT_EQ(2u, snapshot.orders.size());
	EXPECT_DOUBLE_EQ(40, snapshot.orders.rows[1].quantity);
	EXPECT_EQ(fixtures::today() + 10, snapshot.orders.rows[1].dueDate);
	ASSERT_EQ(1u, snapshot.routingSteps.size());
	EXPECT_EQ("910", snapshot.routingSteps.rows[0].center);
	EXPECT_TRUE(snapshot.wip.present);
	EXPECT_TRUE(snapshot.wip.empty());

	auto context = ContextBuilder::build(snapshot);
	EXPECT_DOUBLE_EQ(120, context->capacityOf("910"));
}

TEST(Loader, RejectsBadSnapshotDocument) {
	std::string dir = fixtures::scratchDir("badjson");
	fixtures::writeFile(dir + "/broken.json", "{ \"orders\": [ ");
	fixtures::writeFile(dir + "/array.json", "[1, 2, 3]");
	fixtures::writeFile(dir + "/partial.json", "{ \"orders\": [] }");

	Snapshot snapshot;
	EXPECT_EQ(-1, SnapshotJsonLoader().load(snapshot, dir + "/absent.json"));
	EXPECT_EQ(-2, SnapshotJsonLoader().load(snapshot, dir + "/broken.json"));
	EXPECT_EQ(-3, SnapshotJsonLoader().load(snapshot, dir + "/array.json"));

	Snapshot partial;
	ASSERT_EQ(0, SnapshotJsonLoader().load(partial, dir + "/partial.json"));
	EXPECT_TRUE(partial.orders.present);
	EXPECT_FALSE(partial.routingSteps.present);
	EXPECT_THROW(ContextBuilder::build(partial), SchemaError);
}

TEST(Loader, ReadsSettings) {
	std::string dir = fixtures::scratchDir("settings");
	fixtures::writeFile(dir + "/Settings.csv",
		"MQInfo,10.0.0.5,planner,secret,mrp.results,5673\n"
		"mrp.mq.enabled,1\n"
		"mrp.orchestrator.workers,6\n"
		"mrp.capacity.extra-shift-hours,12\n"
		"mrp.output.csv,1\n"
		"mrp.output.dir,/tmp/out\n"
		"mrp.unknown,1\n");

	GlobleContextManager& gContext = *GlobleContextManager::getGlobleContextManager();
	gContext.reset();
	ASSERT_EQ(0, GlobleContextLoader().load(gContext, dir + "/Settings.csv"));
	EXPECT_EQ("10.0.0.5", gContext.mqHost);
	EXPECT_EQ("planner", gContext.mqUsername);
	EXPECT_EQ("secret", gContext.mqPassword);
	EXPECT_EQ("mrp.results", gContext.mqQueueName);
	EXPECT_EQ(5673, gContext.port);
	EXPECT_EQ(1, gContext.mqEnabled);
	EXPECT_EQ(6, gContext.workers);
	EXPECT_DOUBLE_EQ(12, gContext.extraShiftHours);
	EXPECT_EQ(1, gContext.isResultExported);
	EXPECT_EQ("/tmp/out", gContext.outputDir);

	gContext.reset();
	EXPECT_EQ(0, gContext.workers);
	EXPECT_DOUBLE_EQ(DEFAULT_EXTRA_SHIFT_HOURS, gContext.extraShiftHours);
	EXPECT_EQ(-1, GlobleContextLoader().load(gContext, dir + "/absent.csv"));
}

#include "schema/incremental_schema_scanner.hpp"
#include <gtest/gtest.h>
#include <chrono>
#include <future>
#include <stop_token>
#include <string>
#include <thread>
#include "test_helpers.hpp"

using namespace tabula;
using tabula::test::repeatLine;
using tabula::test::TempDirTest;

class IncrementalSchemaScannerTest : public TempDirTest {
protected:
    static constexpr auto timeout_ = std::chrono::seconds(10);

    SchemaPtr await(std::future<SchemaPtr>& future) {
        EXPECT_EQ(future.wait_for(timeout_), std::future_status::ready) << "background scan did not finish";
        return future.get();
    }
};

TEST_F(IncrementalSchemaScannerTest, BlankPathThrows) {
    EXPECT_THROW(IncrementalSchemaScanner("  ", DataFormat::Csv), ArgumentException);
}

TEST_F(IncrementalSchemaScannerTest, JsonLinesColumnDiscoveredInBackgroundIsNullable) {
    auto path = writeFile("data.jsonl", repeatLine(R"({"a":1})", 200) + R"({"a":2,"b":"extra"})" + "\n");
    IncrementalSchemaScanner scanner(path, DataFormat::JsonLines);

    auto initial = scanner.initialScan();
    ASSERT_TRUE(initial.has_value()) << initial.error().message;
    ASSERT_EQ((*initial)->getColumnCount(), 1u);
    EXPECT_EQ((*initial)->getColumn(0).name, "a");
    EXPECT_EQ(scanner.current(), *initial);

    std::stop_source stop;
    auto future = scanner.startBackgroundScan(*initial, stop.get_token());
    auto refined = await(future);

    ASSERT_NE(refined, nullptr);
    ASSERT_EQ(refined->getColumnCount(), 2u);
    ASSERT_NE(refined->findColumn("b"), nullptr);
    EXPECT_TRUE(refined->findColumn("b")->nullable);
    EXPECT_EQ(refined->findColumn("a")->type, ColumnType::WholeNumber);

    EXPECT_EQ(scanner.current(), refined);
    EXPECT_EQ((*initial)->getColumnCount(), 1u);
}

TEST_F(IncrementalSchemaScannerTest, CsvBackgroundScanWidensTypes) {
    std::string content = "id,value\n";
    for (int i = 0; i < 250; ++i) {
        content += std::to_string(i) + "," + std::to_string(i) + "\n";
    }
    content += "250,not a number\n";
    content += "251,\n";
    auto path = writeFile("data.csv", content);

    EngineConfig config;
    config.backgroundBatchSize = 16;
    IncrementalSchemaScanner scanner(path, DataFormat::Csv, config);

    auto initial = scanner.initialScan();
    ASSERT_TRUE(initial.has_value()) << initial.error().message;
    EXPECT_EQ((*initial)->findColumn("value")->type, ColumnType::WholeNumber);
    EXPECT_FALSE((*initial)->findColumn("value")->nullable);

    std::stop_source stop;
    auto future = scanner.startBackgroundScan(*initial, stop.get_token());
    auto refined = await(future);

    ASSERT_NE(refined, nullptr);
    EXPECT_EQ(refined->findColumn("id")->type, ColumnType::WholeNumber);
    EXPECT_EQ(refined->findColumn("value")->type, ColumnType::Text);
    EXPECT_TRUE(refined->findColumn("value")->nullable);
}

TEST_F(IncrementalSchemaScannerTest, UnparsableRecordsAreSkipped) {
    auto path = writeFile("data.csv", "a,b\n1,2\n1,2,3\n4,5\n");
    EngineConfig config;
    config.initialScanCount = 1;
    IncrementalSchemaScanner scanner(path, DataFormat::Csv, config);

    auto initial = scanner.initialScan();
    ASSERT_TRUE(initial.has_value());

    std::stop_source stop;
    auto future = scanner.startBackgroundScan(*initial, stop.get_token());
    auto refined = await(future);

    ASSERT_NE(refined, nullptr);
    EXPECT_EQ(refined->getColumnCount(), 2u);
    EXPECT_EQ(refined->findColumn("a")->type, ColumnType::WholeNumber);
}

TEST_F(IncrementalSchemaScannerTest, CancelledBeforeStartReturnsGivenSchema) {
    auto path = writeFile("data.jsonl", repeatLine(R"({"a":1})", 200) + repeatLine(R"({"a":"x","b":1})", 500));
    IncrementalSchemaScanner scanner(path, DataFormat::JsonLines);

    auto initial = scanner.initialScan();
    ASSERT_TRUE(initial.has_value());

    std::stop_source stop;
    stop.request_stop();
    auto future = scanner.startBackgroundScan(*initial, stop.get_token());
    auto result = await(future);

    ASSERT_NE(result, nullptr);
    EXPECT_EQ(*result, **initial);
    EXPECT_EQ(scanner.current(), *initial);
}

TEST_F(IncrementalSchemaScannerTest, CancelledMidScanReturnsLastPublishedSchema) {
    // every record after the first adds one column, so each batch publishes a new schema
    std::string content = "{\"a\":1}\n";
    for (int i = 1; i <= 2000; ++i) {
        content += "{\"a\":1,\"c" + std::to_string(i) + "\":1}\n";
    }
    auto path = writeFile("data.jsonl", content);

    EngineConfig config;
    config.initialScanCount = 1;
    config.backgroundBatchSize = 1;
    IncrementalSchemaScanner scanner(path, DataFormat::JsonLines, config);

    auto initial = scanner.initialScan();
    ASSERT_TRUE(initial.has_value());
    ASSERT_EQ((*initial)->getColumnCount(), 1u);

    std::stop_source stop;
    auto future = scanner.startBackgroundScan(*initial, stop.get_token());

    const auto deadline = std::chrono::steady_clock::now() + timeout_;
    while (scanner.current() == *initial && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    stop.request_stop();

    auto result = await(future);
    ASSERT_NE(result, nullptr);
    EXPECT_EQ(result, scanner.current());
    ASSERT_GE(result->getColumnCount(), 2u);

    // columns form a complete prefix of the file, never a partial record
    EXPECT_EQ(result->getColumn(0).name, "a");
    EXPECT_FALSE(result->getColumn(0).nullable);
    for (std::size_t i = 1; i < result->getColumnCount(); ++i) {
        const auto& column = result->getColumn(i);
        EXPECT_EQ(column.name, "c" + std::to_string(i));
        EXPECT_EQ(column.type, ColumnType::WholeNumber);
        EXPECT_TRUE(column.nullable);
    }
}

TEST_F(IncrementalSchemaScannerTest, CsvByteOrderMarkIsDroppedFromHeader) {
    auto path = writeFile("data.csv", "\xEF\xBB\xBFId,Name\n1,a\n2,b\n");
    IncrementalSchemaScanner scanner(path, DataFormat::Csv);

    auto initial = scanner.initialScan();
    ASSERT_TRUE(initial.has_value()) << initial.error().message;
    ASSERT_NE((*initial)->findColumn("Id"), nullptr);
    EXPECT_EQ((*initial)->getColumn(0).name, "Id");
}

TEST_F(IncrementalSchemaScannerTest, NoRecordsAfterSampleLeavesSchemaUnchanged) {
    auto path = writeFile("data.csv", "a,b\n1,x\n2,y\n");
    IncrementalSchemaScanner scanner(path, DataFormat::Csv);

    auto initial = scanner.initialScan();
    ASSERT_TRUE(initial.has_value());

    std::stop_source stop;
    auto future = scanner.startBackgroundScan(*initial, stop.get_token());
    EXPECT_EQ(await(future), *initial);
}

TEST_F(IncrementalSchemaScannerTest, InitialScanOfHeaderOnlyFileFails) {
    auto path = writeFile("data.csv", "a,b\n");
    IncrementalSchemaScanner scanner(path, DataFormat::Csv);

    auto initial = scanner.initialScan();
    ASSERT_FALSE(initial.has_value());
    EXPECT_EQ(initial.error().code, ErrorCode::EmptySample);
    EXPECT_EQ(scanner.current(), nullptr);
}

TEST_F(IncrementalSchemaScannerTest, InitialScanOfMissingFileFails) {
    IncrementalSchemaScanner scanner(tempDir_ / "missing.jsonl", DataFormat::JsonLines);

    auto initial = scanner.initialScan();
    ASSERT_FALSE(initial.has_value());
    EXPECT_EQ(initial.error().code, ErrorCode::NotFound);
}

TEST_F(IncrementalSchemaScannerTest, DestructorStopsRunningScan) {
    auto path = writeFile("data.jsonl", repeatLine(R"({"a":1,"b":"x"})", 20000));
    EngineConfig config;
    config.backgroundBatchSize = 10;

    std::future<SchemaPtr> future;
    {
        IncrementalSchemaScanner scanner(path, DataFormat::JsonLines, config);
        auto initial = scanner.initialScan();
        ASSERT_TRUE(initial.has_value());
        future = scanner.startBackgroundScan(*initial, std::stop_token{});
    }

    ASSERT_EQ(future.wait_for(std::chrono::seconds(0)), std::future_status::ready);
    EXPECT_NE(future.get(), nullptr);
}

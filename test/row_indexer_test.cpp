#include "storage/row_indexer.hpp"
#include <gtest/gtest.h>
#include <string>
#include "test_helpers.hpp"

using namespace tabula;
using tabula::test::TempDirTest;

class RowIndexerTest : public TempDirTest {
protected:
    // rows "r0\n" .. "r<n-1>\n", every row has its number so offsets are easy to verify
    std::string numberedRows(std::size_t count) {
        std::string content;
        for (std::size_t i = 0; i < count; ++i) {
            content += "r" + std::to_string(i) + "\n";
        }
        return content;
    }

    std::string rowAt(const std::string& content, std::uint64_t offset) {
        return content.substr(offset, content.find('\n', offset) - offset);
    }
};

TEST_F(RowIndexerTest, BlankPathThrows) {
    EXPECT_THROW(RowIndexer(""), ArgumentException);
    EXPECT_THROW(RowIndexer("  "), ArgumentException);
}

TEST_F(RowIndexerTest, ZeroCheckpointIntervalThrows) {
    RowIndexerOptions options;
    options.checkpointInterval = 0;
    EXPECT_THROW(RowIndexer(tempDir_ / "x.csv", options), ArgumentException);
}

TEST_F(RowIndexerTest, TotalRowsIsZeroUntilBuilt) {
    auto path = writeFile("data.csv", numberedRows(10));
    RowIndexer indexer(path);

    EXPECT_FALSE(indexer.isBuilt());
    EXPECT_EQ(indexer.totalRows(), 0u);
    EXPECT_FALSE(indexer.seek(0).has_value());

    ASSERT_TRUE(indexer.buildIndex().has_value());
    EXPECT_TRUE(indexer.isBuilt());
    EXPECT_EQ(indexer.totalRows(), 10u);
}

TEST_F(RowIndexerTest, SeekFindsEveryRowAcrossCheckpoints) {
    const auto content = numberedRows(57);
    auto path = writeFile("data.csv", content);

    RowIndexerOptions options;
    options.checkpointInterval = 10;
    RowIndexer indexer(path, options);
    ASSERT_TRUE(indexer.buildIndex().has_value());

    ASSERT_EQ(indexer.totalRows(), 57u);
    EXPECT_EQ(indexer.getCheckpoints().size(), 6u);

    for (std::uint64_t row = 0; row < indexer.totalRows(); ++row) {
        auto offset = indexer.seek(row);
        ASSERT_TRUE(offset.has_value()) << "row " << row;
        EXPECT_EQ(rowAt(content, *offset), "r" + std::to_string(row));
    }
}

TEST_F(RowIndexerTest, SeekPastLastRowIsNotFound) {
    const auto content = numberedRows(25);
    auto path = writeFile("data.csv", content);

    RowIndexerOptions options;
    options.checkpointInterval = 7;
    RowIndexer indexer(path, options);
    ASSERT_TRUE(indexer.buildIndex().has_value());

    auto last = indexer.seek(indexer.totalRows() - 1);
    ASSERT_TRUE(last.has_value());
    EXPECT_EQ(rowAt(content, *last), "r24");
    EXPECT_FALSE(indexer.seek(indexer.totalRows()).has_value());
}

TEST_F(RowIndexerTest, CheckpointIsNearestAtOrBeforeRow) {
    auto path = writeFile("data.csv", numberedRows(30));

    RowIndexerOptions options;
    options.checkpointInterval = 10;
    RowIndexer indexer(path, options);
    ASSERT_TRUE(indexer.buildIndex().has_value());

    EXPECT_EQ(indexer.checkpoint(0)->row, 0u);
    EXPECT_EQ(indexer.checkpoint(9)->row, 0u);
    EXPECT_EQ(indexer.checkpoint(10)->row, 10u);
    EXPECT_EQ(indexer.checkpoint(29)->row, 20u);
}

TEST_F(RowIndexerTest, QuotedNewlineDoesNotEndRow) {
    const std::string content = "1,\"multi\nline\"\n2,\"say \"\"hi\"\"\"\n3,plain\n";
    auto path = writeFile("data.csv", content);

    RowIndexer indexer(path);
    ASSERT_TRUE(indexer.buildIndex().has_value());
    EXPECT_EQ(indexer.totalRows(), 3u);

    auto third = indexer.seek(2);
    ASSERT_TRUE(third.has_value());
    EXPECT_EQ(rowAt(content, *third), "3,plain");
}

TEST_F(RowIndexerTest, UnterminatedQuoteClosesFinalRow) {
    auto path = writeFile("data.csv", "1,a\n2,\"never closed\n3,b");

    RowIndexer indexer(path);
    ASSERT_TRUE(indexer.buildIndex().has_value());
    EXPECT_EQ(indexer.totalRows(), 2u);
}

TEST_F(RowIndexerTest, TrailingRowWithoutNewlineIsCounted) {
    auto path = writeFile("data.csv", "a\r\nb\r\nc");

    RowIndexer indexer(path);
    ASSERT_TRUE(indexer.buildIndex().has_value());
    EXPECT_EQ(indexer.totalRows(), 3u);
    EXPECT_EQ(*indexer.seek(2), 6u);
}

TEST_F(RowIndexerTest, SkipHeaderCountsDataRowsOnly) {
    const std::string content = "id,name\n1,a\n2,b\n";
    auto path = writeFile("data.csv", content);

    RowIndexerOptions options;
    options.skipHeader = true;
    RowIndexer indexer(path, options);
    ASSERT_TRUE(indexer.buildIndex().has_value());

    EXPECT_EQ(indexer.totalRows(), 2u);
    EXPECT_EQ(rowAt(content, *indexer.seek(0)), "1,a");
}

TEST_F(RowIndexerTest, JsonLinesCountsPhysicalLines) {
    const std::string content = "{\"a\":\"x\\\"y\"}\n{\"a\":\"\\\"\"}\n{\"a\":3}\n";
    auto path = writeFile("data.jsonl", content);

    RowIndexerOptions options;
    options.format = DataFormat::JsonLines;
    RowIndexer indexer(path, options);
    ASSERT_TRUE(indexer.buildIndex().has_value());

    EXPECT_EQ(indexer.totalRows(), 3u);
    EXPECT_EQ(rowAt(content, *indexer.seek(2)), "{\"a\":3}");
}

TEST_F(RowIndexerTest, EmptyFileHasNoRows) {
    auto path = writeFile("empty.csv", "");

    RowIndexer indexer(path);
    ASSERT_TRUE(indexer.buildIndex().has_value());
    EXPECT_EQ(indexer.totalRows(), 0u);
    EXPECT_FALSE(indexer.seek(0).has_value());
}

TEST_F(RowIndexerTest, MissingFileFailsToBuild) {
    RowIndexer indexer(tempDir_ / "missing.csv");
    auto built = indexer.buildIndex();
    ASSERT_FALSE(built.has_value());
    EXPECT_EQ(built.error().code, ErrorCode::NotFound);
    EXPECT_FALSE(indexer.isBuilt());
}

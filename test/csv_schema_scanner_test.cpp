#include "schema/csv_schema_scanner.hpp"
#include <gtest/gtest.h>
#include <string_view>
#include <vector>

using namespace tabula;

namespace {

std::vector<std::string_view> records(std::initializer_list<std::string_view> lines) {
    return std::vector<std::string_view>(lines);
}

}  // namespace

class CsvSchemaScannerTest : public ::testing::Test {
protected:
    CsvSchemaScanner scanner_;

    SchemaPtr scan(const std::vector<std::string_view>& sample) {
        auto schema = scanner_.scanSchema(sample, sample.size());
        EXPECT_TRUE(schema.has_value()) << (schema ? "" : schema.error().message);
        return schema.value_or(nullptr);
    }
};

TEST_F(CsvSchemaScannerTest, HeaderDefinesColumnsInOrder) {
    // split on '\n' the way the line reader hands records over
    auto schema = scan(records({"Id,Name,Age", "value1,value2,value3", "value4,value5,value6"}));
    ASSERT_NE(schema, nullptr);

    ASSERT_EQ(schema->getColumnCount(), 3u);
    EXPECT_EQ(schema->getColumn(0).name, "Id");
    EXPECT_EQ(schema->getColumn(1).name, "Name");
    EXPECT_EQ(schema->getColumn(2).name, "Age");
    EXPECT_EQ(schema->getColumn(2).index, 2u);
    EXPECT_EQ(schema->getSourceFormat(), DataFormat::Csv);
}

TEST_F(CsvSchemaScannerTest, ByteOrderMarkIsNotPartOfFirstColumnName) {
    auto schema = scan(records({"\xEF\xBB\xBFId,Name", "1,a", "2,b"}));
    ASSERT_NE(schema, nullptr);

    EXPECT_EQ(schema->getColumn(0).name, "Id");
    ASSERT_NE(schema->findColumn("Id"), nullptr);
    EXPECT_EQ(schema->findColumn("Id")->type, ColumnType::WholeNumber);
}

TEST_F(CsvSchemaScannerTest, InfersColumnTypes) {
    auto schema = scan(records({"whole,fraction,mixed", "123,45.6,123", "100,200.5,text"}));
    ASSERT_NE(schema, nullptr);

    EXPECT_EQ(schema->getColumn(0).type, ColumnType::WholeNumber);
    EXPECT_EQ(schema->getColumn(1).type, ColumnType::FloatingPoint);
    EXPECT_EQ(schema->getColumn(2).type, ColumnType::Text);
}

TEST_F(CsvSchemaScannerTest, WholeNumberWidensToFloatingPoint) {
    auto schema = scan(records({"n", "1", "2.5", "3"}));
    ASSERT_NE(schema, nullptr);
    EXPECT_EQ(schema->getColumn(0).type, ColumnType::FloatingPoint);
}

TEST_F(CsvSchemaScannerTest, EmptyCellMakesColumnNullable) {
    auto schema = scan(records({"a,b,c", "1,,true", "2,x,", "3,y,false"}));
    ASSERT_NE(schema, nullptr);

    EXPECT_FALSE(schema->getColumn(0).nullable);
    EXPECT_TRUE(schema->getColumn(1).nullable);
    EXPECT_EQ(schema->getColumn(1).type, ColumnType::Text);
    EXPECT_TRUE(schema->getColumn(2).nullable);
    EXPECT_EQ(schema->getColumn(2).type, ColumnType::Boolean);
}

TEST_F(CsvSchemaScannerTest, LeadingEmptyValuesDoNotFixType) {
    auto schema = scan(records({"a,b", ",x", ",y", "42,z"}));
    ASSERT_NE(schema, nullptr);
    EXPECT_EQ(schema->getColumn(0).type, ColumnType::WholeNumber);
    EXPECT_TRUE(schema->getColumn(0).nullable);
}

TEST_F(CsvSchemaScannerTest, BlankHeaderNamesAreNumbered) {
    auto schema = scan(records({"id,, ", "1,2,3"}));
    ASSERT_NE(schema, nullptr);

    EXPECT_EQ(schema->getColumn(0).name, "id");
    EXPECT_EQ(schema->getColumn(1).name, "Column2");
    EXPECT_EQ(schema->getColumn(2).name, "Column3");
}

TEST_F(CsvSchemaScannerTest, DuplicateHeaderIsInvalidData) {
    auto sample = records({"a,b,a", "1,2,3"});
    auto schema = scanner_.scanSchema(sample, sample.size());
    ASSERT_FALSE(schema.has_value());
    EXPECT_EQ(schema.error().code, ErrorCode::InvalidData);
}

TEST_F(CsvSchemaScannerTest, SampleWithoutDataRecordsFails) {
    auto headerOnly = records({"a,b"});
    auto schema = scanner_.scanSchema(headerOnly, 200);
    ASSERT_FALSE(schema.has_value());
    EXPECT_EQ(schema.error().code, ErrorCode::EmptySample);

    std::vector<std::string_view> nothing;
    EXPECT_EQ(scanner_.scanSchema(nothing, 200).error().code, ErrorCode::EmptySample);
}

TEST_F(CsvSchemaScannerTest, SampleSizeLimitsScannedRecords) {
    auto sample = records({"a", "1", "text"});
    auto schema = scanner_.scanSchema(sample, 1);
    ASSERT_TRUE(schema.has_value());
    EXPECT_EQ((*schema)->getColumn(0).type, ColumnType::WholeNumber);
}

TEST_F(CsvSchemaScannerTest, QuotedFieldsAreUnquotedBeforeInference) {
    auto schema = scan(records({"\"id\",\"note\"", "\"7\",\"a, b\""}));
    ASSERT_NE(schema, nullptr);
    EXPECT_EQ(schema->getColumn(0).name, "id");
    EXPECT_EQ(schema->getColumn(0).type, ColumnType::WholeNumber);
    EXPECT_EQ(schema->getColumn(1).type, ColumnType::Text);
}

TEST_F(CsvSchemaScannerTest, RefineReturnsSamePointerWhenUnchanged) {
    auto schema = scan(records({"a,b", "1,x"}));
    ASSERT_NE(schema, nullptr);

    auto refined = scanner_.refineSchema(schema, "2,y");
    ASSERT_TRUE(refined.has_value());
    EXPECT_EQ(refined->get(), schema.get());
}

TEST_F(CsvSchemaScannerTest, RefineProducesNewSchemaWithoutTouchingInput) {
    auto schema = scan(records({"a,b", "1,x"}));
    ASSERT_NE(schema, nullptr);

    auto refined = scanner_.refineSchema(schema, "2.5,");
    ASSERT_TRUE(refined.has_value());
    EXPECT_NE(refined->get(), schema.get());

    EXPECT_EQ((*refined)->getColumn(0).type, ColumnType::FloatingPoint);
    EXPECT_TRUE((*refined)->getColumn(1).nullable);

    EXPECT_EQ(schema->getColumn(0).type, ColumnType::WholeNumber);
    EXPECT_FALSE(schema->getColumn(1).nullable);
}

TEST_F(CsvSchemaScannerTest, TextNeverRevertsDuringRefinement) {
    auto schema = scan(records({"a", "1", "text"}));
    ASSERT_NE(schema, nullptr);
    ASSERT_EQ(schema->getColumn(0).type, ColumnType::Text);

    for (std::string_view record : {"2", "3.5", "true", "2024-01-01"}) {
        auto refined = scanner_.refineSchema(schema, record);
        ASSERT_TRUE(refined.has_value());
        schema = *refined;
        EXPECT_EQ(schema->getColumn(0).type, ColumnType::Text);
    }
}

TEST_F(CsvSchemaScannerTest, RefiningSameRecordTwiceIsIdempotent) {
    auto schema = scan(records({"a,b", "1,true"}));
    ASSERT_NE(schema, nullptr);

    auto once = scanner_.refineSchema(schema, "1.5,");
    ASSERT_TRUE(once.has_value());
    auto twice = scanner_.refineSchema(*once, "1.5,");
    ASSERT_TRUE(twice.has_value());

    EXPECT_EQ(twice->get(), once->get());
    EXPECT_EQ(**twice, **once);
}

TEST_F(CsvSchemaScannerTest, RefineRejectsFieldCountMismatch) {
    auto schema = scan(records({"a,b", "1,2"}));
    ASSERT_NE(schema, nullptr);

    auto refined = scanner_.refineSchema(schema, "1,2,3");
    ASSERT_FALSE(refined.has_value());
    EXPECT_EQ(refined.error().code, ErrorCode::InvalidData);
}

#include "schema/csv_schema_scanner.hpp"
#include <algorithm>
#include <optional>
#include <unordered_set>
#include "common/logging.hpp"
#include "schema/type_inference.hpp"
#include "storage/csv_parser.hpp"
#include "storage/format_detector.hpp"

namespace tabula {

namespace {

std::optional<ColumnType> observe(std::string_view value) {
    if (isAbsent(value)) {
        return std::nullopt;
    }
    return inferType(value);
}

}  // namespace

std::expected<std::vector<std::string>, Error> CsvSchemaScanner::parseHeader(std::string_view header) {
    std::size_t count = parseCsvRecord(stripByteOrderMark(header), delimiter_, fields_);

    std::vector<std::string> names;
    names.reserve(count);
    std::unordered_set<std::string_view> seen;

    for (std::size_t i = 0; i < count; ++i) {
        std::string name = isBlank(fields_[i]) ? "Column" + std::to_string(i + 1) : fields_[i];
        names.push_back(std::move(name));
    }

    for (const auto& name : names) {
        if (!seen.insert(name).second) {
            return std::unexpected(Error::make(ErrorCode::InvalidData, "Duplicate column name in header: {}", name));
        }
    }

    return names;
}

std::expected<SchemaPtr, Error> CsvSchemaScanner::scanSchema(std::span<const std::string_view> sample,
                                                             std::size_t sampleSize) {
    if (sample.empty()) {
        return std::unexpected(Error(ErrorCode::EmptySample, "CSV sample has no header"));
    }

    auto names = parseHeader(sample.front());
    if (!names) {
        return std::unexpected(names.error());
    }

    std::vector<ColumnSchema> columns;
    columns.reserve(names->size());
    for (std::size_t i = 0; i < names->size(); ++i) {
        columns.push_back(ColumnSchema{std::move((*names)[i]), ColumnType::Text, false, i, false});
    }

    auto records = sample.subspan(1, std::min(sampleSize, sample.size() - 1));
    std::size_t usedRecords = 0;

    for (std::string_view record : records) {
        if (record.empty()) {
            continue;
        }

        std::size_t count = parseCsvRecord(record, delimiter_, fields_);
        if (count != columns.size()) {
            Logger::trace("Skipping CSV record with {} fields, header has {}", count, columns.size());
            continue;
        }

        for (std::size_t i = 0; i < count; ++i) {
            observeValue(columns[i], observe(fields_[i]));
        }
        ++usedRecords;
    }

    if (usedRecords == 0) {
        return std::unexpected(Error(ErrorCode::EmptySample, "CSV sample contains no data records"));
    }

    return std::make_shared<const TableSchema>(std::move(columns), DataFormat::Csv);
}

std::expected<SchemaPtr, Error> CsvSchemaScanner::refineSchema(const SchemaPtr& schema, std::string_view record) {
    if (record.empty()) {
        return schema;
    }

    std::size_t count = parseCsvRecord(record, delimiter_, fields_);
    if (count != schema->getColumnCount()) {
        return std::unexpected(Error::make(ErrorCode::InvalidData, "Record has {} fields but schema has {} columns",
                                           count, schema->getColumnCount()));
    }

    std::optional<std::vector<ColumnSchema>> updated;

    for (std::size_t i = 0; i < count; ++i) {
        auto observed = observe(fields_[i]);
        ColumnSchema column = schema->getColumn(i);
        if (!observeValue(column, observed)) {
            continue;
        }

        if (!updated) {
            updated = schema->getColumns();
        }
        (*updated)[i] = std::move(column);
    }

    if (!updated) {
        return schema;
    }

    return std::make_shared<const TableSchema>(std::move(*updated), DataFormat::Csv, schema->getRowCount());
}

}  // namespace tabula

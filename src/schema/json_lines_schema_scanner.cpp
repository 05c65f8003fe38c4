#include "schema/json_lines_schema_scanner.hpp"
#include <algorithm>
#include <cstdint>
#include <limits>
#include <string>
#include <unordered_map>
#include <vector>
#include "common/logging.hpp"

namespace tabula {

std::optional<ordered_json> parseJsonRecord(std::string_view line) {
    auto parsed = ordered_json::parse(line.begin(), line.end(), nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return std::nullopt;
    }
    return parsed;
}

std::optional<ColumnType> jsonValueType(const ordered_json& value) noexcept {
    switch (value.type()) {
        case ordered_json::value_t::null:
            return std::nullopt;
        case ordered_json::value_t::boolean:
            return ColumnType::Boolean;
        case ordered_json::value_t::number_integer:
            return ColumnType::WholeNumber;
        case ordered_json::value_t::number_unsigned: {
            auto unsignedValue = value.get_ref<const ordered_json::number_unsigned_t&>();
            return unsignedValue > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())
                       ? ColumnType::Text
                       : ColumnType::WholeNumber;
        }
        case ordered_json::value_t::number_float:
            return ColumnType::FloatingPoint;
        default:
            return ColumnType::Text;
    }
}

namespace {

/**
 * @brief Mutable column list with a name index, used while folding records in.
 */
class ColumnAccumulator {
public:
    ColumnAccumulator() = default;

    explicit ColumnAccumulator(const std::vector<ColumnSchema>& columns) : columns_(columns) {
        for (const auto& column : columns_) {
            index_.emplace(column.name, column.index);
        }
    }

    /**
     * @brief Folds record into the columns. Keys never seen before are appended, nullable when
     * lateKeysNullable is set. Returns whether any column changed or was added.
     */
    bool fold(const ordered_json& record, bool lateKeysNullable) {
        bool changed = false;
        seen_.assign(columns_.size(), false);

        for (const auto& [key, value] : record.items()) {
            if (isBlank(key)) {
                continue;
            }

            auto observed = jsonValueType(value);
            auto it = index_.find(key);
            if (it == index_.end()) {
                std::size_t index = columns_.size();
                ColumnSchema column{key, ColumnType::Text, lateKeysNullable, index, false};
                observeValue(column, observed);
                columns_.push_back(std::move(column));
                index_.emplace(key, index);
                seen_.push_back(true);
                changed = true;
                continue;
            }

            seen_[it->second] = true;
            changed |= observeValue(columns_[it->second], observed);
        }

        for (std::size_t i = 0; i < columns_.size(); ++i) {
            if (!seen_[i]) {
                changed |= observeValue(columns_[i], std::nullopt);
            }
        }

        return changed;
    }

    std::vector<ColumnSchema> release() { return std::move(columns_); }

    bool empty() const noexcept { return columns_.empty(); }

private:
    std::vector<ColumnSchema> columns_;
    std::unordered_map<std::string, std::size_t> index_;
    std::vector<bool> seen_;
};

}  // namespace

std::expected<SchemaPtr, Error> JsonLinesSchemaScanner::scanSchema(std::span<const std::string_view> sample,
                                                                   std::size_t sampleSize) const {
    ColumnAccumulator columns;
    std::size_t usedRecords = 0;

    for (std::string_view line : sample.first(std::min(sampleSize, sample.size()))) {
        auto record = parseJsonRecord(line);
        if (!record) {
            Logger::trace("Skipping JSON Lines record that is not an object");
            continue;
        }

        columns.fold(*record, usedRecords > 0);
        ++usedRecords;
    }

    if (usedRecords == 0) {
        return std::unexpected(Error(ErrorCode::EmptySample, "JSON Lines sample contains no object records"));
    }

    return std::make_shared<const TableSchema>(columns.release(), DataFormat::JsonLines);
}

std::expected<SchemaPtr, Error> JsonLinesSchemaScanner::refineSchema(const SchemaPtr& schema,
                                                                     std::string_view record) const {
    auto parsed = parseJsonRecord(record);
    if (!parsed) {
        return std::unexpected(Error(ErrorCode::InvalidData, "Record is not a JSON object"));
    }

    ColumnAccumulator columns(schema->getColumns());
    if (!columns.fold(*parsed, true)) {
        return schema;
    }

    return std::make_shared<const TableSchema>(columns.release(), DataFormat::JsonLines, schema->getRowCount());
}

}  // namespace tabula

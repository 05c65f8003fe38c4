#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>
#include "common/types.hpp"

namespace tabula {

/**
 * @brief One column of a table schema.
 *
 * typeResolved is false while the column has only seen absent values. Such a column reports
 * Text but takes the type of the first present value it meets.
 */
struct ColumnSchema {
    std::string name;
    ColumnType type = ColumnType::Text;
    bool nullable = false;
    std::size_t index = 0;
    bool typeResolved = true;

    bool operator==(const ColumnSchema& other) const = default;
};

/**
 * @brief Folds one observed value into a column. nullopt stands for an absent value and only
 * marks the column nullable. Applying the same observation twice changes nothing the second time.
 *
 * @return true if the column changed
 */
bool observeValue(ColumnSchema& column, std::optional<ColumnType> observed) noexcept;

/**
 * @brief Immutable ordered column list with an O(1) name lookup built at construction.
 *
 * Never mutated once built. Refinement produces a new schema and publishes it in place of the
 * old one, so readers holding a SchemaPtr always see a consistent value.
 */
class TableSchema {
public:
    /**
     * @throws ArgumentException on a blank or duplicate column name, or when a column's index
     * does not match its position
     */
    TableSchema(std::vector<ColumnSchema> columns, DataFormat sourceFormat, std::uint64_t rowCount = 0);

    const std::vector<ColumnSchema>& getColumns() const noexcept { return columns_; }

    std::size_t getColumnCount() const noexcept { return columns_.size(); }

    const ColumnSchema& getColumn(std::size_t index) const noexcept { return columns_[index]; }

    /**
     * @brief Column by exact (ordinal) name, nullptr if absent.
     */
    const ColumnSchema* findColumn(std::string_view name) const noexcept;

    bool containsColumn(std::string_view name) const noexcept { return findColumn(name) != nullptr; }

    /**
     * @brief Row count, 0 when unknown.
     */
    std::uint64_t getRowCount() const noexcept { return row_count_; }

    DataFormat getSourceFormat() const noexcept { return source_format_; }

    TableSchema withRowCount(std::uint64_t rowCount) const { return TableSchema(columns_, source_format_, rowCount); }

    bool operator==(const TableSchema& other) const noexcept {
        return columns_ == other.columns_ && row_count_ == other.row_count_ && source_format_ == other.source_format_;
    }

private:
    struct NameHash {
        using is_transparent = void;
        std::size_t operator()(std::string_view name) const noexcept { return std::hash<std::string_view>{}(name); }
    };

    std::vector<ColumnSchema> columns_;
    std::unordered_map<std::string, std::size_t, NameHash, std::equal_to<>> column_by_name_;
    std::uint64_t row_count_;
    DataFormat source_format_;
};

using SchemaPtr = std::shared_ptr<const TableSchema>;

}  // namespace tabula

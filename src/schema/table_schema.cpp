#include "schema/table_schema.hpp"
#include "common/errors.hpp"

namespace tabula {

bool observeValue(ColumnSchema& column, std::optional<ColumnType> observed) noexcept {
    if (!observed) {
        if (column.nullable) {
            return false;
        }
        column.nullable = true;
        return true;
    }

    if (!column.typeResolved) {
        column.type = *observed;
        column.typeResolved = true;
        return true;
    }

    ColumnType widened = widenType(column.type, *observed);
    if (widened == column.type) {
        return false;
    }
    column.type = widened;
    return true;
}

TableSchema::TableSchema(std::vector<ColumnSchema> columns, DataFormat sourceFormat, std::uint64_t rowCount)
    : columns_(std::move(columns)), row_count_(rowCount), source_format_(sourceFormat) {
    column_by_name_.reserve(columns_.size());

    for (std::size_t i = 0; i < columns_.size(); ++i) {
        const auto& column = columns_[i];

        if (isBlank(column.name)) {
            throw ArgumentException("Column name must not be blank", "columns");
        }
        if (column.index != i) {
            throw ArgumentException("Column '" + column.name + "' has index " + std::to_string(column.index) +
                                        " but sits at position " + std::to_string(i),
                                    "columns");
        }
        if (!column_by_name_.emplace(column.name, i).second) {
            throw ArgumentException("Duplicate column name found: " + column.name, "columns");
        }
    }
}

const ColumnSchema* TableSchema::findColumn(std::string_view name) const noexcept {
    auto it = column_by_name_.find(name);
    return it == column_by_name_.end() ? nullptr : &columns_[it->second];
}

}  // namespace tabula

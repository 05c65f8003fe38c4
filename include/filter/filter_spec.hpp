#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include "common/types.hpp"

namespace tabula {

enum class FilterOperator {
    Equals,
    NotEquals,
    GreaterThan,
    LessThan,
    GreaterThanOrEqual,
    LessThanOrEqual,
    Contains,
    NotContains,
    StartsWith,
    EndsWith
};

std::string_view toString(FilterOperator op) noexcept;

std::optional<FilterOperator> filterOperatorFromString(std::string_view name) noexcept;

/**
 * @brief GreaterThan, LessThan and their OrEqual variants. They compare parsed values and
 * only work on orderable column types.
 */
constexpr bool isRelational(FilterOperator op) noexcept {
    return op == FilterOperator::GreaterThan || op == FilterOperator::LessThan ||
           op == FilterOperator::GreaterThanOrEqual || op == FilterOperator::LessThanOrEqual;
}

/**
 * @brief String operators work on every type, relational ones only on WholeNumber,
 * FloatingPoint and Timestamp.
 */
constexpr bool isOperatorSupported(FilterOperator op, ColumnType type) noexcept {
    return !isRelational(op) || isOrderable(type);
}

/**
 * @brief Filter condition resolved against a schema: the column is identified by its position
 * in the source file and compared as its effective type (after casts).
 */
struct FilterSpec {
    std::size_t sourceColumnIndex;
    ColumnType columnType;
    FilterOperator op;
    std::string value;

    bool operator==(const FilterSpec& other) const = default;
};

}  // namespace tabula

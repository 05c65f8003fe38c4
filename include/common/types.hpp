#pragma once

#include <optional>
#include <string_view>

namespace tabula {

/**
 * @brief Closed set of column types the viewer understands.
 */
enum class ColumnType { Text, WholeNumber, FloatingPoint, Boolean, Timestamp };

std::string_view toString(ColumnType type) noexcept;

std::optional<ColumnType> columnTypeFromString(std::string_view name) noexcept;

/**
 * @brief Merges a newly observed value type into the type a column already has.
 *
 * Identical types are kept, WholeNumber and FloatingPoint meet in FloatingPoint, every
 * other combination collapses to Text. Text absorbs everything, so a column never
 * narrows again once it has become Text.
 */
constexpr ColumnType widenType(ColumnType current, ColumnType observed) noexcept {
    if (current == observed) {
        return current;
    }

    const bool currentNumeric = current == ColumnType::WholeNumber || current == ColumnType::FloatingPoint;
    const bool observedNumeric = observed == ColumnType::WholeNumber || observed == ColumnType::FloatingPoint;
    if (currentNumeric && observedNumeric) {
        return ColumnType::FloatingPoint;
    }

    return ColumnType::Text;
}

/**
 * @brief True for types with a total order usable by relational filter operators.
 */
constexpr bool isOrderable(ColumnType type) noexcept {
    return type == ColumnType::WholeNumber || type == ColumnType::FloatingPoint ||
           type == ColumnType::Timestamp;
}

enum class DataFormat { Csv, JsonLines };

std::string_view toString(DataFormat format) noexcept;

std::string_view getDisplayName(DataFormat format) noexcept;

}  // namespace tabula

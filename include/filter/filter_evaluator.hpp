#pragma once

#include <string_view>
#include "filter/filter_spec.hpp"

namespace tabula {

/**
 * @brief Whether one raw cell value satisfies spec. Runs once per cell while filtering, so it
 * never allocates.
 *
 * String operators compare case-insensitively (ASCII) against the literal. Relational operators
 * parse the cell and the literal as the effective column type; if either parse fails the cell does
 * not match. On a column type without an order a relational operator never matches.
 */
bool evaluateFilter(std::string_view rawValue, const FilterSpec& spec) noexcept;

bool equalsIgnoreCase(std::string_view lhs, std::string_view rhs) noexcept;

bool containsIgnoreCase(std::string_view haystack, std::string_view needle) noexcept;

bool startsWithIgnoreCase(std::string_view value, std::string_view prefix) noexcept;

bool endsWithIgnoreCase(std::string_view value, std::string_view suffix) noexcept;

}  // namespace tabula

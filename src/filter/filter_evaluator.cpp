#include "filter/filter_evaluator.hpp"
#include <algorithm>
#include "schema/type_inference.hpp"

namespace tabula {

namespace {

constexpr char toLowerAscii(char c) noexcept {
    return c >= 'A' && c <= 'Z' ? static_cast<char>(c - 'A' + 'a') : c;
}

bool charEqualsIgnoreCase(char lhs, char rhs) noexcept {
    return toLowerAscii(lhs) == toLowerAscii(rhs);
}

template <typename T>
bool compare(const T& lhs, const T& rhs, FilterOperator op) noexcept {
    switch (op) {
        case FilterOperator::GreaterThan:
            return lhs > rhs;
        case FilterOperator::LessThan:
            return lhs < rhs;
        case FilterOperator::GreaterThanOrEqual:
            return lhs >= rhs;
        case FilterOperator::LessThanOrEqual:
            return lhs <= rhs;
        default:
            return false;
    }
}

template <typename Parser>
bool evaluateRelational(std::string_view rawValue, std::string_view literal, FilterOperator op,
                        Parser parse) noexcept {
    auto cell = parse(rawValue);
    auto operand = parse(literal);
    if (!cell || !operand) {
        return false;
    }
    return compare(*cell, *operand, op);
}

}  // namespace

bool equalsIgnoreCase(std::string_view lhs, std::string_view rhs) noexcept {
    return lhs.size() == rhs.size() && std::equal(lhs.begin(), lhs.end(), rhs.begin(), charEqualsIgnoreCase);
}

bool containsIgnoreCase(std::string_view haystack, std::string_view needle) noexcept {
    return needle.empty() || std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(),
                                         charEqualsIgnoreCase) != haystack.end();
}

bool startsWithIgnoreCase(std::string_view value, std::string_view prefix) noexcept {
    return value.size() >= prefix.size() && equalsIgnoreCase(value.substr(0, prefix.size()), prefix);
}

bool endsWithIgnoreCase(std::string_view value, std::string_view suffix) noexcept {
    return value.size() >= suffix.size() && equalsIgnoreCase(value.substr(value.size() - suffix.size()), suffix);
}

bool evaluateFilter(std::string_view rawValue, const FilterSpec& spec) noexcept {
    const std::string_view literal = spec.value;

    switch (spec.op) {
        case FilterOperator::Equals:
            return equalsIgnoreCase(rawValue, literal);
        case FilterOperator::NotEquals:
            return !equalsIgnoreCase(rawValue, literal);
        case FilterOperator::Contains:
            return containsIgnoreCase(rawValue, literal);
        case FilterOperator::NotContains:
            return !containsIgnoreCase(rawValue, literal);
        case FilterOperator::StartsWith:
            return startsWithIgnoreCase(rawValue, literal);
        case FilterOperator::EndsWith:
            return endsWithIgnoreCase(rawValue, literal);
        default:
            break;
    }

    switch (spec.columnType) {
        case ColumnType::WholeNumber:
            return evaluateRelational(rawValue, literal, spec.op, parseWholeNumber);
        case ColumnType::FloatingPoint:
            return evaluateRelational(rawValue, literal, spec.op, parseFloatingPoint);
        case ColumnType::Timestamp:
            return evaluateRelational(rawValue, literal, spec.op, parseTimestamp);
        default:
            // no order on Text or Boolean
            return false;
    }
}

}  // namespace tabula

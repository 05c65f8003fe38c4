#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include "common/types.hpp"

namespace tabula {

/**
 * Canonical parsers for raw cell text. Shared by schema inference and filter evaluation so a
 * value that inferred as a type also compares as that type. None of them allocates; leading
 * and trailing whitespace is ignored.
 */

std::string_view trimWhitespace(std::string_view value) noexcept;

/**
 * @brief Empty or whitespace-only values count as absent (null).
 */
inline bool isAbsent(std::string_view value) noexcept {
    return trimWhitespace(value).empty();
}

/**
 * @brief Case-insensitive "true" / "false".
 */
std::optional<bool> parseBoolean(std::string_view value) noexcept;

/**
 * @brief Signed 64-bit decimal integer with optional sign.
 */
std::optional<std::int64_t> parseWholeNumber(std::string_view value) noexcept;

/**
 * @brief Finite decimal or exponent notation number. Infinity and NaN are rejected.
 */
std::optional<double> parseFloatingPoint(std::string_view value) noexcept;

/**
 * @brief Date or date-time in ISO-8601 style, returned as microseconds since the Unix epoch (UTC).
 *
 * Accepted: YYYY-MM-DD or YYYY/MM/DD, optionally followed by 'T' or ' ' and HH:MM[:SS[.fraction]],
 * optionally followed by 'Z' or an offset +HH:MM / -HH:MM / +HHMM. Without an offset the value is
 * taken as UTC.
 */
std::optional<std::int64_t> parseTimestamp(std::string_view value) noexcept;

/**
 * @brief Most specific type for a present delimited value.
 * Priority: Boolean > WholeNumber > FloatingPoint > Timestamp > Text.
 */
ColumnType inferType(std::string_view value) noexcept;

}  // namespace tabula

#include "schema/type_inference.hpp"
#include <cctype>
#include <charconv>
#include <chrono>
#include <cmath>
#include <system_error>

namespace tabula {

namespace {

bool isSpace(char c) noexcept {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool equalsIgnoreCase(std::string_view value, std::string_view expected) noexcept {
    if (value.size() != expected.size()) {
        return false;
    }
    for (std::size_t i = 0; i < value.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(value[i])) != expected[i]) {
            return false;
        }
    }
    return true;
}

/**
 * @brief Cursor over the timestamp text.
 */
struct TimestampCursor {
    std::string_view text;
    std::size_t position = 0;

    bool atEnd() const noexcept { return position >= text.size(); }

    char peek() const noexcept { return atEnd() ? '\0' : text[position]; }

    bool consume(char expected) noexcept {
        if (peek() != expected) {
            return false;
        }
        ++position;
        return true;
    }

    // exactly `digits` decimal digits
    std::optional<int> number(std::size_t digits) noexcept {
        if (text.size() - position < digits) {
            return std::nullopt;
        }
        int value = 0;
        for (std::size_t i = 0; i < digits; ++i) {
            char c = text[position + i];
            if (c < '0' || c > '9') {
                return std::nullopt;
            }
            value = value * 10 + (c - '0');
        }
        position += digits;
        return value;
    }
};

constexpr std::int64_t kMicrosPerSecond = 1'000'000;

}  // namespace

std::string_view trimWhitespace(std::string_view value) noexcept {
    while (!value.empty() && isSpace(value.front())) {
        value.remove_prefix(1);
    }
    while (!value.empty() && isSpace(value.back())) {
        value.remove_suffix(1);
    }
    return value;
}

std::optional<bool> parseBoolean(std::string_view value) noexcept {
    value = trimWhitespace(value);
    if (equalsIgnoreCase(value, "true")) {
        return true;
    }
    if (equalsIgnoreCase(value, "false")) {
        return false;
    }
    return std::nullopt;
}

std::optional<std::int64_t> parseWholeNumber(std::string_view value) noexcept {
    value = trimWhitespace(value);
    // from_chars accepts '-' but not '+'
    if (value.size() > 1 && value.front() == '+' && value[1] != '-') {
        value.remove_prefix(1);
    }
    if (value.empty()) {
        return std::nullopt;
    }

    std::int64_t result = 0;
    auto [end, ec] = std::from_chars(value.data(), value.data() + value.size(), result);
    if (ec != std::errc{} || end != value.data() + value.size()) {
        return std::nullopt;
    }
    return result;
}

std::optional<double> parseFloatingPoint(std::string_view value) noexcept {
    value = trimWhitespace(value);
    if (value.size() > 1 && value.front() == '+' && value[1] != '-') {
        value.remove_prefix(1);
    }
    if (value.empty()) {
        return std::nullopt;
    }

    double result = 0.0;
    auto [end, ec] = std::from_chars(value.data(), value.data() + value.size(), result, std::chars_format::general);
    if (ec != std::errc{} || end != value.data() + value.size() || !std::isfinite(result)) {
        return std::nullopt;
    }
    return result;
}

std::optional<std::int64_t> parseTimestamp(std::string_view value) noexcept {
    TimestampCursor cursor{trimWhitespace(value)};

    auto year = cursor.number(4);
    if (!year) {
        return std::nullopt;
    }

    char separator = cursor.peek();
    if (separator != '-' && separator != '/') {
        return std::nullopt;
    }
    cursor.consume(separator);

    auto month = cursor.number(2);
    if (!month || !cursor.consume(separator)) {
        return std::nullopt;
    }
    auto day = cursor.number(2);
    if (!day) {
        return std::nullopt;
    }

    std::chrono::year_month_day date{std::chrono::year{*year}, std::chrono::month{static_cast<unsigned>(*month)},
                                     std::chrono::day{static_cast<unsigned>(*day)}};
    if (!date.ok()) {
        return std::nullopt;
    }

    std::int64_t micros = static_cast<std::int64_t>(std::chrono::sys_days{date}.time_since_epoch().count()) * 86'400 *
                          kMicrosPerSecond;

    if (cursor.atEnd()) {
        return micros;
    }

    if (!cursor.consume('T') && !cursor.consume(' ')) {
        return std::nullopt;
    }

    auto hour = cursor.number(2);
    if (!hour || !cursor.consume(':')) {
        return std::nullopt;
    }
    auto minute = cursor.number(2);
    if (!minute || *hour > 23 || *minute > 59) {
        return std::nullopt;
    }

    int second = 0;
    std::int64_t fraction = 0;
    if (cursor.consume(':')) {
        auto parsed = cursor.number(2);
        if (!parsed || *parsed > 59) {
            return std::nullopt;
        }
        second = *parsed;

        if (cursor.consume('.')) {
            std::size_t digits = 0;
            std::int64_t scale = 100'000;
            while (!cursor.atEnd() && cursor.peek() >= '0' && cursor.peek() <= '9') {
                // precision beyond microseconds is dropped
                if (scale > 0) {
                    fraction += (cursor.peek() - '0') * scale;
                    scale /= 10;
                }
                ++cursor.position;
                ++digits;
            }
            if (digits == 0) {
                return std::nullopt;
            }
        }
    }

    micros += ((*hour * 60 + *minute) * 60 + second) * kMicrosPerSecond + fraction;

    if (cursor.atEnd()) {
        return micros;
    }

    if (cursor.consume('Z') || cursor.consume('z')) {
        return cursor.atEnd() ? std::optional<std::int64_t>(micros) : std::nullopt;
    }

    char sign = cursor.peek();
    if (sign != '+' && sign != '-') {
        return std::nullopt;
    }
    cursor.consume(sign);

    auto offsetHours = cursor.number(2);
    if (!offsetHours) {
        return std::nullopt;
    }
    cursor.consume(':');
    auto offsetMinutes = cursor.number(2);
    if (!offsetMinutes || !cursor.atEnd() || *offsetHours > 23 || *offsetMinutes > 59) {
        return std::nullopt;
    }

    std::int64_t offset = (*offsetHours * 60 + *offsetMinutes) * 60 * kMicrosPerSecond;
    return sign == '+' ? micros - offset : micros + offset;
}

ColumnType inferType(std::string_view value) noexcept {
    if (parseBoolean(value)) {
        return ColumnType::Boolean;
    }
    if (parseWholeNumber(value)) {
        return ColumnType::WholeNumber;
    }
    if (parseFloatingPoint(value)) {
        return ColumnType::FloatingPoint;
    }
    if (parseTimestamp(value)) {
        return ColumnType::Timestamp;
    }
    return ColumnType::Text;
}

}  // namespace tabula

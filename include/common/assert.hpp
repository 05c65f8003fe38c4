#pragma once

#include <fmt/format.h>
#include <cstdlib>
#include <source_location>
#include <string>
#include <string_view>

namespace tabula {

void logAssertionFailed(std::string_view, const std::source_location&,
                        std::string msg) noexcept;

template <typename... Args>
[[noreturn]] void printAssertFailed(std::string_view condition, std::string_view message,
                                    const std::source_location& source_location,
                                    Args&&... args) noexcept {
    std::string formatted_message = fmt::vformat(message, fmt::make_format_args(args...));
    logAssertionFailed(condition, source_location, formatted_message);
    std::abort();
}

}  // namespace tabula

/**
 * @brief Hard precondition check. Stays enabled in release builds, used where a violated
 * precondition would otherwise touch memory outside a mapping.
 */
#define tbl_check(cond, msg, ...)                                                                \
    if (!(cond)) {                                                                               \
        tabula::printAssertFailed(#cond, (msg), std::source_location::current(), ##__VA_ARGS__); \
    }

#ifdef NDEBUG
#define tbl_assert(...)
#define tbl_unreachable(...) __builtin_unreachable()
#else

#define tbl_assert(cond, msg, ...) tbl_check(cond, msg, ##__VA_ARGS__)

#define tbl_unreachable(msg)                                                            \
    do {                                                                                \
        tabula::printAssertFailed("unreachable", msg, std::source_location::current()); \
    } while (0)

#endif

#pragma once

#include <fmt/format.h>
#include <stdexcept>
#include <string>
#include <string_view>

namespace tabula {

enum class ErrorCode {
    NotFound,
    AccessDenied,
    IoError,
    InvalidArgument,
    EmptySample,
    InvalidData,
    InvalidConfiguration
};

std::string_view toString(ErrorCode code) noexcept;

/**
 * @brief Anticipated failure returned through std::expected. Carries a code callers can branch
 * on and a message that can be shown to the user as is.
 */
struct Error {
    ErrorCode code;
    std::string message;

    Error(ErrorCode code, std::string message) : code(code), message(std::move(message)) {}

    template <typename... Args>
    static Error make(ErrorCode code, fmt::format_string<Args...> fmt, Args&&... args) {
        return Error(code, fmt::format(fmt, std::forward<Args>(args)...));
    }

    std::string toString() const { return fmt::format("{}: {}", tabula::toString(code), message); }
};

class TabulaException : public std::runtime_error {
   public:
    explicit TabulaException(const std::string& message) : std::runtime_error(message) {}

    explicit TabulaException(const char* message) : std::runtime_error(message) {}
};

/**
 * @brief Thrown by constructors handed an argument they can never work with,
 * e.g. a blank file path or a schema with duplicate column names.
 */
class ArgumentException : public TabulaException {
   public:
    ArgumentException(const std::string& message, std::string argument)
        : TabulaException(message + " (argument '" + argument + "')"), argument_(std::move(argument)) {}

    const std::string& getArgument() const noexcept { return argument_; }

   private:
    std::string argument_;
};

/**
 * @brief True for an empty path or one made only of whitespace.
 */
bool isBlank(std::string_view value) noexcept;

}  // namespace tabula

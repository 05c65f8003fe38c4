#include "common/errors.hpp"
#include <algorithm>
#include <cctype>
#include "common/assert.hpp"

namespace tabula {

std::string_view toString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::NotFound:
            return "NotFound";
        case ErrorCode::AccessDenied:
            return "AccessDenied";
        case ErrorCode::IoError:
            return "IoError";
        case ErrorCode::InvalidArgument:
            return "InvalidArgument";
        case ErrorCode::EmptySample:
            return "EmptySample";
        case ErrorCode::InvalidData:
            return "InvalidData";
        case ErrorCode::InvalidConfiguration:
            return "InvalidConfiguration";
    }
    tbl_unreachable("Unknown error code");
}

bool isBlank(std::string_view value) noexcept {
    return std::all_of(value.begin(), value.end(),
                       [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; });
}

}  // namespace tabula

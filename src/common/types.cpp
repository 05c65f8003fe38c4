#include "common/types.hpp"
#include "common/assert.hpp"

namespace tabula {

std::string_view toString(ColumnType type) noexcept {
    switch (type) {
        case ColumnType::Text:
            return "Text";
        case ColumnType::WholeNumber:
            return "WholeNumber";
        case ColumnType::FloatingPoint:
            return "FloatingPoint";
        case ColumnType::Boolean:
            return "Boolean";
        case ColumnType::Timestamp:
            return "Timestamp";
    }
    tbl_unreachable("Invalid column type");
}

std::optional<ColumnType> columnTypeFromString(std::string_view name) noexcept {
    if (name == "Text") {
        return ColumnType::Text;
    } else if (name == "WholeNumber") {
        return ColumnType::WholeNumber;
    } else if (name == "FloatingPoint") {
        return ColumnType::FloatingPoint;
    } else if (name == "Boolean") {
        return ColumnType::Boolean;
    } else if (name == "Timestamp") {
        return ColumnType::Timestamp;
    } else {
        return std::nullopt;
    }
}

std::string_view toString(DataFormat format) noexcept {
    switch (format) {
        case DataFormat::Csv:
            return "csv";
        case DataFormat::JsonLines:
            return "jsonl";
    }
    tbl_unreachable("Invalid data format");
}

std::string_view getDisplayName(DataFormat format) noexcept {
    switch (format) {
        case DataFormat::Csv:
            return "CSV";
        case DataFormat::JsonLines:
            return "JSON Lines";
    }
    tbl_unreachable("Invalid data format");
}

}  // namespace tabula

#include "actions/action.hpp"
#include <fmt/format.h>
#include <type_traits>

namespace tabula {

std::string_view discriminator(const Action& action) noexcept {
    return std::visit(
        [](const auto& a) -> std::string_view {
            using T = std::decay_t<decltype(a)>;
            if constexpr (std::is_same_v<T, RenameColumnAction>) {
                return "rename";
            } else if constexpr (std::is_same_v<T, DeleteColumnAction>) {
                return "delete";
            } else if constexpr (std::is_same_v<T, CastColumnAction>) {
                return "cast";
            } else {
                return "filter";
            }
        },
        action);
}

std::string description(const Action& action) {
    return std::visit(
        [](const auto& a) -> std::string {
            using T = std::decay_t<decltype(a)>;
            if constexpr (std::is_same_v<T, RenameColumnAction>) {
                return fmt::format("Rename column '{}' to '{}'", a.oldName, a.newName);
            } else if constexpr (std::is_same_v<T, DeleteColumnAction>) {
                return fmt::format("Delete column '{}'", a.columnName);
            } else if constexpr (std::is_same_v<T, CastColumnAction>) {
                return fmt::format("Cast column '{}' to {}", a.columnName, toString(a.targetType));
            } else {
                return fmt::format("Filter '{}' {} '{}'", a.columnName, toString(a.op), a.value);
            }
        },
        action);
}

json toJson(const Action& action) {
    json obj = std::visit(
        [](const auto& a) -> json {
            using T = std::decay_t<decltype(a)>;
            if constexpr (std::is_same_v<T, RenameColumnAction>) {
                return {{"oldName", a.oldName}, {"newName", a.newName}};
            } else if constexpr (std::is_same_v<T, DeleteColumnAction>) {
                return {{"columnName", a.columnName}};
            } else if constexpr (std::is_same_v<T, CastColumnAction>) {
                return {{"columnName", a.columnName}, {"targetType", std::string(toString(a.targetType))}};
            } else {
                return {{"columnName", a.columnName}, {"operator", std::string(toString(a.op))}, {"value", a.value}};
            }
        },
        action);
    obj["type"] = std::string(discriminator(action));
    return obj;
}

namespace {

std::expected<std::string, Error> stringField(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) {
        return std::unexpected(Error::make(ErrorCode::InvalidData, "Action field '{}' must be a string", key));
    }
    return it->get<std::string>();
}

}  // namespace

std::expected<Action, Error> actionFromJson(const json& obj) {
    if (!obj.is_object()) {
        return std::unexpected(Error(ErrorCode::InvalidData, "Action must be a JSON object"));
    }

    auto type = stringField(obj, "type");
    if (!type) {
        return std::unexpected(type.error());
    }

    if (*type == "rename") {
        auto oldName = stringField(obj, "oldName");
        auto newName = stringField(obj, "newName");
        if (!oldName || !newName) {
            return std::unexpected(!oldName ? oldName.error() : newName.error());
        }
        return RenameColumnAction{std::move(*oldName), std::move(*newName)};
    }

    auto columnName = stringField(obj, "columnName");
    if (!columnName) {
        return std::unexpected(columnName.error());
    }

    if (*type == "delete") {
        return DeleteColumnAction{std::move(*columnName)};
    }

    if (*type == "cast") {
        auto typeName = stringField(obj, "targetType");
        if (!typeName) {
            return std::unexpected(typeName.error());
        }
        auto targetType = columnTypeFromString(*typeName);
        if (!targetType) {
            return std::unexpected(Error::make(ErrorCode::InvalidData, "Unknown column type '{}'", *typeName));
        }
        return CastColumnAction{std::move(*columnName), *targetType};
    }

    if (*type == "filter") {
        auto operatorName = stringField(obj, "operator");
        auto value = stringField(obj, "value");
        if (!operatorName || !value) {
            return std::unexpected(!operatorName ? operatorName.error() : value.error());
        }
        auto op = filterOperatorFromString(*operatorName);
        if (!op) {
            return std::unexpected(Error::make(ErrorCode::InvalidData, "Unknown filter operator '{}'", *operatorName));
        }
        return FilterAction{std::move(*columnName), *op, std::move(*value)};
    }

    return std::unexpected(Error::make(ErrorCode::InvalidData, "Unknown action type '{}'", *type));
}

}  // namespace tabula

#pragma once

#include <expected>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <variant>
#include "common/errors.hpp"
#include "common/types.hpp"
#include "filter/filter_spec.hpp"

namespace tabula {

using json = nlohmann::json;

struct RenameColumnAction {
    std::string oldName;
    std::string newName;

    bool operator==(const RenameColumnAction&) const = default;
};

struct DeleteColumnAction {
    std::string columnName;

    bool operator==(const DeleteColumnAction&) const = default;
};

struct CastColumnAction {
    std::string columnName;
    ColumnType targetType;

    bool operator==(const CastColumnAction&) const = default;
};

/**
 * @brief Keeps only rows whose value in columnName satisfies op against value. Does not change
 * the column set; several filters combine with AND.
 */
struct FilterAction {
    std::string columnName;
    FilterOperator op;
    std::string value;

    bool operator==(const FilterAction&) const = default;
};

using Action = std::variant<RenameColumnAction, DeleteColumnAction, CastColumnAction, FilterAction>;

/**
 * @brief Stable tag of the variant: "rename", "delete", "cast" or "filter".
 */
std::string_view discriminator(const Action& action) noexcept;

/**
 * @brief Text shown to the user for the action, e.g. "Rename column 'a' to 'b'".
 */
std::string description(const Action& action);

/**
 * @brief {"type": discriminator, ...fields in camelCase}. Types and operators are written by name.
 */
json toJson(const Action& action);

/**
 * @brief Inverse of toJson. InvalidData for an unknown type tag, a missing or wrongly typed
 * field, an unknown column type or an unknown operator.
 */
std::expected<Action, Error> actionFromJson(const json& obj);

}  // namespace tabula

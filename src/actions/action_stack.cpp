#include "actions/action_stack.hpp"
#include <algorithm>
#include <optional>
#include <type_traits>
#include <unordered_map>
#include "common/logging.hpp"

namespace tabula {

const TransformedColumn* TransformedSchema::findColumn(std::string_view name) const noexcept {
    auto it = std::find_if(columns.begin(), columns.end(),
                           [name](const TransformedColumn& column) { return column.name == name; });
    return it == columns.end() ? nullptr : &*it;
}

namespace {

/**
 * @brief Working state of a replay. Columns stay at their source position, deleted ones are
 * only hidden, and names map to the source position of the column currently carrying them.
 */
class ReplayState {
public:
    explicit ReplayState(const TableSchema& schema) {
        columns_.reserve(schema.getColumnCount());
        for (const auto& column : schema.getColumns()) {
            columns_.push_back(TransformedColumn{column.name, column.type, column.nullable, column.index});
            by_name_.emplace(column.name, column.index);
        }
        visible_.assign(columns_.size(), true);
    }

    /**
     * @brief Applies one action. In strict mode every action that cannot apply is an error,
     * otherwise only a filter on an unknown column is.
     */
    std::expected<void, Error> apply(const Action& action, bool strict) {
        return std::visit([&](const auto& a) { return applyAction(a, strict); }, action);
    }

    TransformedSchema finish() && {
        TransformedSchema result;
        for (std::size_t i = 0; i < columns_.size(); ++i) {
            if (visible_[i]) {
                result.columns.push_back(std::move(columns_[i]));
            }
        }
        result.filters = std::move(filters_);
        return result;
    }

private:
    std::optional<std::size_t> find(const std::string& name) const {
        auto it = by_name_.find(name);
        if (it == by_name_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    static std::expected<void, Error> skipped(bool strict, const std::string& name, const Action& action) {
        if (strict) {
            return std::unexpected(Error::make(ErrorCode::InvalidArgument, "Column '{}' does not exist", name));
        }
        Logger::debug("Skipping '{}': column '{}' does not exist", description(action), name);
        return {};
    }

    std::expected<void, Error> applyAction(const RenameColumnAction& rename, bool strict) {
        auto index = find(rename.oldName);
        if (!index) {
            return skipped(strict, rename.oldName, rename);
        }
        if (rename.oldName == rename.newName) {
            return {};
        }
        if (isBlank(rename.newName)) {
            if (strict) {
                return std::unexpected(Error(ErrorCode::InvalidArgument, "New column name must not be blank"));
            }
            Logger::warn("Skipping '{}': new name is blank", description(rename));
            return {};
        }
        if (by_name_.contains(rename.newName)) {
            if (strict) {
                return std::unexpected(
                    Error::make(ErrorCode::InvalidArgument, "Column '{}' already exists", rename.newName));
            }
            Logger::warn("Skipping '{}': column '{}' already exists", description(rename), rename.newName);
            return {};
        }

        by_name_.erase(rename.oldName);
        by_name_.emplace(rename.newName, *index);
        columns_[*index].name = rename.newName;
        return {};
    }

    std::expected<void, Error> applyAction(const DeleteColumnAction& del, bool strict) {
        auto index = find(del.columnName);
        if (!index) {
            return skipped(strict, del.columnName, del);
        }

        by_name_.erase(del.columnName);
        visible_[*index] = false;
        return {};
    }

    std::expected<void, Error> applyAction(const CastColumnAction& cast, bool strict) {
        auto index = find(cast.columnName);
        if (!index) {
            return skipped(strict, cast.columnName, cast);
        }

        columns_[*index].type = cast.targetType;
        return {};
    }

    std::expected<void, Error> applyAction(const FilterAction& filter, bool strict) {
        auto index = find(filter.columnName);
        if (!index) {
            return std::unexpected(Error::make(ErrorCode::InvalidArgument, "Filter references unknown column '{}'",
                                               filter.columnName));
        }

        ColumnType effectiveType = columns_[*index].type;
        if (strict && !isOperatorSupported(filter.op, effectiveType)) {
            return std::unexpected(Error::make(ErrorCode::InvalidArgument,
                                               "Operator {} is not supported on column '{}' of type {}",
                                               toString(filter.op), filter.columnName, toString(effectiveType)));
        }

        filters_.push_back(FilterSpec{*index, effectiveType, filter.op, filter.value});
        return {};
    }

    std::vector<TransformedColumn> columns_;
    std::vector<bool> visible_;
    std::unordered_map<std::string, std::size_t> by_name_;
    std::vector<FilterSpec> filters_;
};

}  // namespace

std::expected<void, Error> ActionStack::tryPush(Action action, const TableSchema& schema) {
    ReplayState state(schema);
    for (const auto& existing : actions_) {
        auto applied = state.apply(existing, false);
        if (!applied) {
            return applied;
        }
    }

    auto applied = state.apply(action, true);
    if (!applied) {
        Logger::debug("Rejected action '{}': {}", description(action), applied.error().message);
        return applied;
    }

    actions_.push_back(std::move(action));
    return {};
}

std::expected<TransformedSchema, Error> ActionStack::replay(const TableSchema& schema) const {
    ReplayState state(schema);
    for (const auto& action : actions_) {
        auto applied = state.apply(action, false);
        if (!applied) {
            return std::unexpected(applied.error());
        }
    }
    return std::move(state).finish();
}

json ActionStack::toJson() const {
    json array = json::array();
    for (const auto& action : actions_) {
        array.push_back(tabula::toJson(action));
    }
    return array;
}

std::expected<ActionStack, Error> ActionStack::fromJson(const json& array) {
    if (!array.is_array()) {
        return std::unexpected(Error(ErrorCode::InvalidData, "Action list must be a JSON array"));
    }

    std::vector<Action> actions;
    actions.reserve(array.size());
    for (const auto& obj : array) {
        auto action = actionFromJson(obj);
        if (!action) {
            return std::unexpected(action.error());
        }
        actions.push_back(std::move(*action));
    }
    return ActionStack(std::move(actions));
}

}  // namespace tabula

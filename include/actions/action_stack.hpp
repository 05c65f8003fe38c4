#pragma once

#include <cstddef>
#include <expected>
#include <string>
#include <string_view>
#include <vector>
#include "actions/action.hpp"
#include "common/errors.hpp"
#include "filter/filter_spec.hpp"
#include "schema/table_schema.hpp"

namespace tabula {

/**
 * @brief A visible column after replaying an action stack. sourceIndex is the column's
 * position in the source schema and never changes through renames or casts.
 */
struct TransformedColumn {
    std::string name;
    ColumnType type;
    bool nullable;
    std::size_t sourceIndex;

    bool operator==(const TransformedColumn&) const = default;
};

struct TransformedSchema {
    std::vector<TransformedColumn> columns;  // visible columns in source order
    std::vector<FilterSpec> filters;         // in stack order, combined with AND

    const TransformedColumn* findColumn(std::string_view name) const noexcept;
};

/**
 * @brief Append-only log of column edits. The stack never transforms data itself. The current
 * name, type and visibility of every column are derived by replaying all actions in order.
 *
 * Columns are tracked by their source position, so a filter on a column that was cast and then
 * renamed resolves to the right source column with the cast type.
 */
class ActionStack {
public:
    ActionStack() = default;

    explicit ActionStack(std::vector<Action> actions) : actions_(std::move(actions)) {}

    /**
     * @brief Appends without validation. Actions that do not apply are skipped on replay.
     */
    void push(Action action) { actions_.push_back(std::move(action)); }

    /**
     * @brief Appends action only if it applies to the state of schema after the current stack.
     *
     * @return InvalidArgument if the action names a column that is not visible, renames onto a
     * visible name, or uses a relational filter operator on a column whose effective type has
     * no order
     */
    std::expected<void, Error> tryPush(Action action, const TableSchema& schema);

    /**
     * @brief Left fold of all actions over schema.
     *
     * Rename, Delete and Cast actions naming an unknown column are skipped, as are renames onto a
     * name that is already visible.
     *
     * @return InvalidArgument if a filter names a column that is not visible at its position
     */
    std::expected<TransformedSchema, Error> replay(const TableSchema& schema) const;

    void clear() noexcept { actions_.clear(); }

    const std::vector<Action>& getActions() const noexcept { return actions_; }

    std::size_t size() const noexcept { return actions_.size(); }

    bool empty() const noexcept { return actions_.empty(); }

    json toJson() const;

    static std::expected<ActionStack, Error> fromJson(const json& array);

private:
    std::vector<Action> actions_;
};

}  // namespace tabula

// graphflow/core/state.h
#ifndef GRAPHFLOW_CORE_STATE_H
#define GRAPHFLOW_CORE_STATE_H

#include "graphflow/common/types.h"
#include <string>
#include <unordered_map>

namespace graphflow {

// 合并策略："last_write_wins", "array_concat", "array_merge_unique",
// "deep_merge", "numeric_add", "error_on_conflict"
using MergeStrategy = std::string;

namespace merge_strategy {
inline constexpr const char* LAST_WRITE_WINS = "last_write_wins";
inline constexpr const char* ARRAY_CONCAT = "array_concat";
inline constexpr const char* ARRAY_MERGE_UNIQUE = "array_merge_unique";
inline constexpr const char* DEEP_MERGE = "deep_merge";
inline constexpr const char* NUMERIC_ADD = "numeric_add";
inline constexpr const char* ERROR_ON_CONFLICT = "error_on_conflict";
} // namespace merge_strategy

bool is_known_merge_strategy(const MergeStrategy& strategy);

// Describes how a node's update is folded into the running state.
//
// Field paths are dot-separated ("results.items"). A pattern ending in '*'
// matches every path with that prefix. Nested paths are only reached beneath a
// field whose strategy is deep_merge; any other strategy treats the top-level
// field as a unit.
//
// A non-object update replaces the state wholesale.
class StateSchema {
public:
    StateSchema() = default;
    explicit StateSchema(MergeStrategy default_strategy);

    // Throws std::invalid_argument on an unknown strategy name.
    StateSchema& field(const std::string& path, MergeStrategy strategy);

    [[nodiscard]] Context merge(const Context& current, const Context& update) const;
    void merge_into(Context& target, const Context& update) const;

    // The smallest update that turns `before` into `after` under this schema.
    // Removed keys are not representable and are ignored.
    [[nodiscard]] Context diff(const Context& before, const Context& after) const;

    const MergeStrategy& strategy_for(const std::string& path) const;
    const MergeStrategy& default_strategy() const { return default_strategy_; }
    const std::unordered_map<std::string, MergeStrategy>& field_policies() const { return field_policies_; }

private:
    std::unordered_map<std::string, MergeStrategy> field_policies_;
    MergeStrategy default_strategy_ = merge_strategy::LAST_WRITE_WINS;

    void merge_recursive(Context& target, const Context& source, const std::string& path_prefix) const;
    void merge_field(Context& target_val, const Context& source_val, const std::string& path) const;
    void diff_recursive(Context& delta, const Context& before, const Context& after, const std::string& path_prefix) const;
    static void merge_array(Context& target_arr, const Context& source, const MergeStrategy& strategy, const std::string& path);
    static void merge_scalar(Context& target_val, const Context& source_val, const MergeStrategy& strategy, const std::string& path);
};

} // namespace graphflow

#endif // GRAPHFLOW_CORE_STATE_H

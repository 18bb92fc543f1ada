// core/state.cpp
#include "graphflow/core/state.h"
#include "graphflow/common/errors.h"
#include <algorithm>
#include <cstdint>
#include <stdexcept>

namespace graphflow {

namespace {

bool is_array_strategy(const MergeStrategy& strategy) {
    return strategy == merge_strategy::ARRAY_CONCAT || strategy == merge_strategy::ARRAY_MERGE_UNIQUE;
}

Context add_numbers(const Context& a, const Context& b) {
    if (a.is_number_integer() && b.is_number_integer()) {
        return a.get<int64_t>() + b.get<int64_t>();
    }
    return a.get<double>() + b.get<double>();
}

Context subtract_numbers(const Context& a, const Context& b) {
    if (a.is_number_integer() && b.is_number_integer()) {
        return a.get<int64_t>() - b.get<int64_t>();
    }
    return a.get<double>() - b.get<double>();
}

} // namespace

bool is_known_merge_strategy(const MergeStrategy& strategy) {
    return strategy == merge_strategy::LAST_WRITE_WINS ||
           strategy == merge_strategy::ARRAY_CONCAT ||
           strategy == merge_strategy::ARRAY_MERGE_UNIQUE ||
           strategy == merge_strategy::DEEP_MERGE ||
           strategy == merge_strategy::NUMERIC_ADD ||
           strategy == merge_strategy::ERROR_ON_CONFLICT;
}

StateSchema::StateSchema(MergeStrategy default_strategy) : default_strategy_(std::move(default_strategy)) {
    if (!is_known_merge_strategy(default_strategy_)) {
        throw std::invalid_argument("Unknown merge strategy '" + default_strategy_ + "'");
    }
}

StateSchema& StateSchema::field(const std::string& path, MergeStrategy strategy) {
    if (path.empty()) {
        throw std::invalid_argument("State field path must not be empty");
    }
    if (!is_known_merge_strategy(strategy)) {
        throw std::invalid_argument("Unknown merge strategy '" + strategy + "' for field '" + path + "'");
    }
    field_policies_[path] = std::move(strategy);
    return *this;
}

const MergeStrategy& StateSchema::strategy_for(const std::string& path) const {
    auto exact_it = field_policies_.find(path);
    if (exact_it != field_policies_.end()) {
        return exact_it->second;
    }

    // 通配符：最长前缀优先 (e.g. "results.*" matches "results.items")
    const MergeStrategy* best = nullptr;
    size_t best_len = 0;
    for (const auto& [pattern, strategy] : field_policies_) {
        if (pattern.back() != '*') continue;
        std::string prefix = pattern.substr(0, pattern.size() - 1);
        if (path.starts_with(prefix) && (best == nullptr || prefix.size() > best_len)) {
            best = &strategy;
            best_len = prefix.size();
        }
    }
    return best ? *best : default_strategy_;
}

Context StateSchema::merge(const Context& current, const Context& update) const {
    Context result = current;
    merge_into(result, update);
    return result;
}

void StateSchema::merge_into(Context& target, const Context& update) const {
    if (update.is_null()) {
        return;
    }
    if (!update.is_object()) {
        target = update;
        return;
    }
    if (target.is_null()) {
        target = Context::object();
    } else if (!target.is_object()) {
        target = update;
        return;
    }
    merge_recursive(target, update, "");
}

void StateSchema::merge_recursive(Context& target, const Context& source, const std::string& path_prefix) const {
    for (auto it = source.begin(); it != source.end(); ++it) {
        std::string current_path = path_prefix.empty() ? it.key() : path_prefix + "." + it.key();

        auto target_it = target.find(it.key());
        if (target_it == target.end()) {
            const MergeStrategy& strategy = strategy_for(current_path);
            if (is_array_strategy(strategy) && !it.value().is_array()) {
                target[it.key()] = Context::array({it.value()});
            } else {
                target[it.key()] = it.value();
            }
        } else {
            merge_field(target_it.value(), it.value(), current_path);
        }
    }
}

void StateSchema::merge_field(Context& target_val, const Context& source_val, const std::string& path) const {
    const MergeStrategy& strategy = strategy_for(path);

    if (strategy == merge_strategy::DEEP_MERGE && target_val.is_object() && source_val.is_object()) {
        merge_recursive(target_val, source_val, path);
    } else if (is_array_strategy(strategy)) {
        merge_array(target_val, source_val, strategy, path);
    } else {
        merge_scalar(target_val, source_val, strategy, path);
    }
}

void StateSchema::merge_array(Context& target_arr, const Context& source, const MergeStrategy& strategy, const std::string& path) {
    if (target_arr.is_null()) {
        target_arr = Context::array();
    }
    if (!target_arr.is_array()) {
        throw StateMergeError("Cannot apply " + strategy + " to non-array field '" + path + "'");
    }
    // 非数组更新视为单个元素
    Context items = source.is_array() ? source : Context::array({source});

    if (strategy == merge_strategy::ARRAY_CONCAT) {
        for (const auto& item : items) {
            target_arr.push_back(item);
        }
    } else {
        for (const auto& item : items) {
            if (std::find(target_arr.begin(), target_arr.end(), item) == target_arr.end()) {
                target_arr.push_back(item);
            }
        }
    }
}

void StateSchema::merge_scalar(Context& target_val, const Context& source_val, const MergeStrategy& strategy, const std::string& path) {
    if (strategy == merge_strategy::LAST_WRITE_WINS || strategy == merge_strategy::DEEP_MERGE) {
        target_val = source_val;
    } else if (strategy == merge_strategy::NUMERIC_ADD) {
        if (target_val.is_null()) {
            target_val = source_val;
        } else if (target_val.is_number() && source_val.is_number()) {
            target_val = add_numbers(target_val, source_val);
        } else {
            throw StateMergeError("numeric_add requires numbers for field '" + path + "': " +
                                  target_val.dump() + " + " + source_val.dump());
        }
    } else if (target_val != source_val) { // error_on_conflict
        throw StateMergeError("State merge conflict for field '" + path + "': " +
                              target_val.dump() + " vs " + source_val.dump());
    }
}

Context StateSchema::diff(const Context& before, const Context& after) const {
    if (!before.is_object() || !after.is_object()) {
        return after;
    }
    Context delta = Context::object();
    diff_recursive(delta, before, after, "");
    return delta;
}

void StateSchema::diff_recursive(Context& delta, const Context& before, const Context& after, const std::string& path_prefix) const {
    for (auto it = after.begin(); it != after.end(); ++it) {
        const std::string& key = it.key();
        std::string current_path = path_prefix.empty() ? key : path_prefix + "." + key;
        const Context& new_val = it.value();

        auto before_it = before.find(key);
        if (before_it == before.end()) {
            delta[key] = new_val;
            continue;
        }
        const Context& old_val = before_it.value();
        if (old_val == new_val) {
            continue;
        }

        const MergeStrategy& strategy = strategy_for(current_path);
        if (strategy == merge_strategy::ARRAY_CONCAT && old_val.is_array() && new_val.is_array()) {
            if (old_val.size() > new_val.size() ||
                !std::equal(old_val.begin(), old_val.end(), new_val.begin())) {
                throw StateMergeError("Field '" + current_path + "' is append-only but its prefix changed");
            }
            delta[key] = Context(new_val.begin() + static_cast<std::ptrdiff_t>(old_val.size()), new_val.end());
        } else if (strategy == merge_strategy::ARRAY_MERGE_UNIQUE && old_val.is_array() && new_val.is_array()) {
            Context added = Context::array();
            for (const auto& item : new_val) {
                if (std::find(old_val.begin(), old_val.end(), item) == old_val.end()) {
                    added.push_back(item);
                }
            }
            delta[key] = std::move(added);
        } else if (strategy == merge_strategy::NUMERIC_ADD && old_val.is_number() && new_val.is_number()) {
            delta[key] = subtract_numbers(new_val, old_val);
        } else if (strategy == merge_strategy::DEEP_MERGE && old_val.is_object() && new_val.is_object()) {
            Context nested = Context::object();
            diff_recursive(nested, old_val, new_val, current_path);
            if (!nested.empty()) {
                delta[key] = std::move(nested);
            }
        } else {
            delta[key] = new_val;
        }
    }
}

} // namespace graphflow

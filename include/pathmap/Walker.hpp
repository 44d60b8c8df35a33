/**
 * @file Walker.hpp
 * @brief Policy-parameterized recursive descent shared by all operations
 *
 * Every public operation in PathMap.hpp is one instantiation of walk().
 * A policy supplies:
 *
 * ```cpp
 * struct Policy {
 *     // true: rebuild each ancestor with the child returned by the level
 *     // below (writes); false: pass the deepest result through (reads)
 *     static constexpr bool kRebuild = ...;
 *
 *     // path empty from the start
 *     Result<Value> on_exhausted(const Value& node);
 *
 *     // exactly one key left; prefix ends with key
 *     Result<Value> on_last_key(const Value& node, const Key& key,
 *                               const Keys& prefix);
 *
 *     // more than one key left and key is absent; prefix ends with key.
 *     // Success value is the child to descend into.
 *     Result<Value> on_missing_intermediate(const Keys& prefix);
 * };
 * ```
 *
 * Strict and AutoVivify provide the two on_missing_intermediate flavours.
 */

#ifndef PATHMAP_WALKER_HPP
#define PATHMAP_WALKER_HPP

#include "pathmap/Path.hpp"
#include "pathmap/Result.hpp"
#include "pathmap/Value.hpp"

namespace pathmap {
namespace detail {

/// Missing intermediate keys fail with Missing(prefix).
struct Strict {
    Result<Value> on_missing_intermediate(const Keys& prefix) const {
        return Result<Value>::failure(Error::missing(prefix));
    }
};

/// Missing intermediate keys are created as empty maps.
struct AutoVivify {
    Result<Value> on_missing_intermediate(const Keys&) const {
        return Result<Value>::success(empty_map());
    }
};

template <typename Policy>
Result<Value> walk(const Value& node, const Keys& keys, std::size_t index,
                   Keys& prefix, Policy& policy) {
    // Checked at every depth, not only at the root
    if (!is_map(node)) {
        return Result<Value>::failure(Error::not_a_map(node, prefix));
    }

    if (index == keys.size()) {
        return policy.on_exhausted(node);
    }

    const Key& key = keys[index];
    prefix.push_back(key);

    if (index + 1 == keys.size()) {
        return policy.on_last_key(node, key, prefix);
    }

    Result<Value> child = [&]() {
        auto it = node.find(key);
        if (it != node.end()) {
            return walk(*it, keys, index + 1, prefix, policy);
        }
        Result<Value> created = policy.on_missing_intermediate(prefix);
        if (!created) {
            return created;
        }
        return walk(created.value(), keys, index + 1, prefix, policy);
    }();

    if constexpr (Policy::kRebuild) {
        if (!child) {
            return child;
        }
        Value rebuilt = node;
        rebuilt[key] = std::move(child).value();
        return Result<Value>::success(std::move(rebuilt));
    } else {
        return child;
    }
}

/**
 * @brief Shape checks every operation runs before descending
 *
 * Root-is-map is checked first and wins over an invalid path.
 */
inline Status check_root_and_path(const Value& root, const Path& path) {
    if (!is_map(root)) {
        return Status::failure(Error::not_a_map(root, {}));
    }
    if (!path.valid()) {
        return Status::failure(Error::invalid_path(path.raw()));
    }
    return Status::success();
}

/// Walk a checked root along a valid path.
template <typename Policy>
Result<Value> descend(const Value& root, const Path& path, Policy& policy) {
    Keys prefix;
    prefix.reserve(path.size());
    return walk(root, path.keys(), 0, prefix, policy);
}

} // namespace detail
} // namespace pathmap

#endif // PATHMAP_WALKER_HPP

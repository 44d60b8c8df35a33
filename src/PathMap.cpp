/**
 * @file PathMap.cpp
 * @brief Public operations as walker policies
 */

#include "pathmap/PathMap.hpp"
#include "pathmap/Walker.hpp"

namespace pathmap {

namespace {
    using detail::AutoVivify;
    using detail::Strict;

    Result<Value> ok(Value v) {
        return Result<Value>::success(std::move(v));
    }

    Result<Value> fail(Error err) {
        return Result<Value>::failure(std::move(err));
    }

    /// Copy of node with key set to value.
    Value with(const Value& node, const Key& key, Value value) {
        Value out = node;
        out[key] = std::move(value);
        return out;
    }

    struct FetchPolicy : Strict {
        static constexpr bool kRebuild = false;

        Result<Value> on_exhausted(const Value& node) {
            return ok(node);
        }

        Result<Value> on_last_key(const Value& node, const Key& key, const Keys& prefix) {
            auto it = node.find(key);
            if (it == node.end()) return fail(Error::missing(prefix));
            return ok(*it);
        }
    };

    /// put / put_auto
    template <typename Intermediate, bool kCreateLeaf>
    struct PutPolicy : Intermediate {
        static constexpr bool kRebuild = true;
        Value value;

        explicit PutPolicy(Value v) : value(std::move(v)) {}

        Result<Value> on_exhausted(const Value&) {
            return ok(std::move(value));
        }

        Result<Value> on_last_key(const Value& node, const Key& key, const Keys& prefix) {
            if (!kCreateLeaf && !node.contains(key)) {
                return fail(Error::missing(prefix));
            }
            return ok(with(node, key, std::move(value)));
        }
    };

    /// put_new / put_new_auto
    template <typename Intermediate>
    struct PutNewPolicy : Intermediate {
        static constexpr bool kRebuild = true;
        Value value;

        explicit PutNewPolicy(Value v) : value(std::move(v)) {}

        Result<Value> on_exhausted(const Value&) {
            // The root always exists
            return fail(Error::already_exists({}));
        }

        Result<Value> on_last_key(const Value& node, const Key& key, const Keys& prefix) {
            if (node.contains(key)) return fail(Error::already_exists(prefix));
            return ok(with(node, key, std::move(value)));
        }
    };

    struct EnsurePolicy : Strict {
        static constexpr bool kRebuild = true;
        const Initializer& initializer;

        explicit EnsurePolicy(const Initializer& init) : initializer(init) {}

        Result<Value> on_exhausted(const Value& node) {
            return ok(node);
        }

        Result<Value> on_last_key(const Value& node, const Key& key, const Keys&) {
            if (node.contains(key)) return ok(node);
            return ok(with(node, key, initializer()));
        }
    };

    /// What update does with an absent final key.
    enum class AbsentLeaf {
        Fail,        // LeafMissing
        SetDefault,  // default, fn not called
        ApplyDefault // fn(default)
    };

    template <typename Intermediate, AbsentLeaf kAbsent>
    struct UpdatePolicy : Intermediate {
        static constexpr bool kRebuild = true;
        const Updater& fn;
        Value default_value;

        UpdatePolicy(const Updater& f, Value d) : fn(f), default_value(std::move(d)) {}

        Result<Value> on_exhausted(const Value& node) {
            return ok(fn(node));
        }

        Result<Value> on_last_key(const Value& node, const Key& key, const Keys&) {
            auto it = node.find(key);
            if (it != node.end()) {
                return ok(with(node, key, fn(*it)));
            }
            switch (kAbsent) {
                case AbsentLeaf::Fail:
                    return fail(Error::leaf_missing());
                case AbsentLeaf::SetDefault:
                    return ok(with(node, key, std::move(default_value)));
                case AbsentLeaf::ApplyDefault:
                    break;
            }
            return ok(with(node, key, fn(default_value)));
        }
    };

    template <typename Policy>
    Result<Value> run(const Value& root, const Path& path, Policy policy) {
        Status shape = detail::check_root_and_path(root, path);
        if (!shape) return fail(shape.error());
        return detail::descend(root, path, policy);
    }

    template <typename Policy>
    Result<Value> run_with_updater(const Value& root, const Path& path,
                                   const Updater& fn, Policy policy) {
        Status shape = detail::check_root_and_path(root, path);
        if (!shape) return fail(shape.error());
        if (!fn) return fail(Error::invalid_function(1));
        return detail::descend(root, path, policy);
    }
}

// ---- Read API ---------------------------------------------------------------

Result<Value> fetch(const Value& root, const Path& path) {
    return run(root, path, FetchPolicy{});
}

Value get(const Value& root, const Path& path, const Value& default_value) {
    auto r = fetch(root, path);
    if (!r) return default_value;
    return std::move(r).value();
}

bool exists(const Value& root, const Path& path) {
    return fetch(root, path).ok();
}

Status validate_path(const Value& root, const Path& path) {
    auto r = fetch(root, path);
    if (!r) return Status::failure(r.error());
    return Status::success();
}

bool valid_path(const Value& root, const Path& path) {
    return validate_path(root, path).ok();
}

// ---- Write API --------------------------------------------------------------

Result<Value> put(const Value& root, const Path& path, Value value) {
    return run(root, path, PutPolicy<Strict, false>(std::move(value)));
}

Result<Value> put_auto(const Value& root, const Path& path, Value value) {
    return run(root, path, PutPolicy<AutoVivify, true>(std::move(value)));
}

Result<Value> put_new(const Value& root, const Path& path, Value value) {
    return run(root, path, PutNewPolicy<Strict>(std::move(value)));
}

Result<Value> put_new_auto(const Value& root, const Path& path, Value value) {
    return run(root, path, PutNewPolicy<AutoVivify>(std::move(value)));
}

Result<Value> ensure(const Value& root, const Path& path, const Initializer& initializer) {
    Status shape = detail::check_root_and_path(root, path);
    if (!shape) return fail(shape.error());
    if (!initializer) return fail(Error::invalid_initializer());
    EnsurePolicy policy(initializer);
    return detail::descend(root, path, policy);
}

Result<Value> update(const Value& root, const Path& path, const Updater& fn) {
    return run_with_updater(root, path, fn,
        UpdatePolicy<Strict, AbsentLeaf::Fail>(fn, nullptr));
}

Result<Value> update(const Value& root, const Path& path, Value default_value,
                     const Updater& fn) {
    return run_with_updater(root, path, fn,
        UpdatePolicy<Strict, AbsentLeaf::SetDefault>(fn, std::move(default_value)));
}

Result<Value> update_auto(const Value& root, const Path& path, Value default_value,
                          const Updater& fn) {
    return run_with_updater(root, path, fn,
        UpdatePolicy<AutoVivify, AbsentLeaf::ApplyDefault>(fn, std::move(default_value)));
}

} // namespace pathmap

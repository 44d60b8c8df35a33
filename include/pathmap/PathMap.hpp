/**
 * @file PathMap.hpp
 * @brief Reading, checking and mutating nested maps by explicit paths
 *
 * Every operation is total: it returns a success value or a classified
 * Error (see Errors.hpp) for any root and any path, and never throws for
 * an ordinary failure.
 *
 * Before descending, each operation checks in this order:
 * 1. root is a map, else NotAMap(root, []);
 * 2. path is valid, else InvalidPath(raw path);
 * 3. a supplied callable is non-empty, else InvalidInitializer /
 *    InvalidFunction(1).
 *
 * Write operations never modify root. They return a new tree in which
 * every ancestor of the written location has been rebuilt.
 *
 * | operation     | empty path      | last key present | last key absent | missing intermediate |
 * |---------------|-----------------|------------------|-----------------|----------------------|
 * | fetch         | root            | value            | Missing         | Missing              |
 * | put           | value           | overwrite        | Missing         | Missing              |
 * | put_auto      | value           | overwrite        | set             | create {}            |
 * | put_new       | AlreadyExists   | AlreadyExists    | set             | Missing              |
 * | put_new_auto  | AlreadyExists   | AlreadyExists    | set             | create {}            |
 * | ensure        | root            | unchanged        | set init()      | Missing              |
 * | update(fn)    | fn(root)        | fn(value)        | LeafMissing     | Missing              |
 * | update(d, fn) | fn(root)        | fn(value)        | set d           | Missing              |
 * | update_auto   | fn(root)        | fn(value)        | set fn(d)       | create {}            |
 */

#ifndef PATHMAP_PATHMAP_HPP
#define PATHMAP_PATHMAP_HPP

#include "pathmap/Errors.hpp"
#include "pathmap/Path.hpp"
#include "pathmap/Result.hpp"
#include "pathmap/Value.hpp"
#include <functional>

namespace pathmap {

/// Produces the value for a missing leaf (arity 0).
using Initializer = std::function<Value()>;

/// Transforms an existing value (arity 1).
using Updater = std::function<Value(const Value&)>;

// ============================================================================
// Read API
// ============================================================================

/**
 * @brief Fetch the value at path
 *
 * @return The value, or root itself for the empty path
 *
 * Errors: NotAMap, InvalidPath, Missing(prefix ending with absent key).
 *
 * Examples:
 * ```cpp
 * Value cfg = {{"db", {{"host", "localhost"}}}};
 * fetch(cfg, {"db", "host"});           // ok: "localhost"
 * fetch(cfg, {"db", "port"});           // Missing([db, port])
 * fetch(cfg, {"db", "host", "x"});      // NotAMap("localhost", [db, host])
 * ```
 */
Result<Value> fetch(const Value& root, const Path& path);

/**
 * @brief Fetch the value at path, or default_value on any failure
 *
 * Unlike a plain lookup, every error (including a non-map root or an
 * invalid path) collapses to default_value.
 */
Value get(const Value& root, const Path& path, const Value& default_value = nullptr);

/// True when fetch() would succeed.
bool exists(const Value& root, const Path& path);

/**
 * @brief Check that path can be traversed in root
 *
 * Success when fetch() succeeds; otherwise the same Error fetch()
 * reports.
 */
Status validate_path(const Value& root, const Path& path);

/// Boolean form of validate_path().
bool valid_path(const Value& root, const Path& path);

// ============================================================================
// Write API
// ============================================================================

/**
 * @brief Strict insertion
 *
 * Overwrites an existing leaf or sets an absent one, but every
 * intermediate key must exist. The empty path replaces the whole root.
 *
 * Errors: NotAMap, InvalidPath, Missing.
 *
 * Note: an absent final key fails with Missing as well; put() only writes
 * where the location already exists.
 */
Result<Value> put(const Value& root, const Path& path, Value value);

/**
 * @brief Permissive insertion
 *
 * Creates empty maps for missing intermediate keys. The empty path
 * replaces the whole root.
 *
 * Errors: NotAMap, InvalidPath.
 */
Result<Value> put_auto(const Value& root, const Path& path, Value value);

/**
 * @brief Insert only where nothing exists yet
 *
 * Errors: NotAMap, InvalidPath, Missing (intermediate),
 * AlreadyExists(prefix) (including AlreadyExists([]) for the empty path).
 */
Result<Value> put_new(const Value& root, const Path& path, Value value);

/**
 * @brief Insert only where nothing exists yet, creating intermediates
 *
 * Errors: NotAMap, InvalidPath, AlreadyExists(prefix).
 */
Result<Value> put_new_auto(const Value& root, const Path& path, Value value);

/**
 * @brief Initialize the leaf at path if it is absent
 *
 * The initializer is called at most once, and only when the final key is
 * absent. The empty path returns root unchanged.
 *
 * Errors: NotAMap, InvalidPath, InvalidInitializer, Missing.
 */
Result<Value> ensure(const Value& root, const Path& path, const Initializer& initializer);

/**
 * @brief Replace the leaf at path with fn(leaf)
 *
 * The empty path returns fn(root).
 *
 * Errors: NotAMap, InvalidPath, InvalidFunction, Missing (intermediate),
 * LeafMissing (every intermediate exists, final key absent).
 */
Result<Value> update(const Value& root, const Path& path, const Updater& fn);

/**
 * @brief Replace the leaf at path with fn(leaf), or set default_value
 *
 * fn is not called when the final key is absent.
 *
 * Errors: NotAMap, InvalidPath, InvalidFunction, Missing.
 */
Result<Value> update(const Value& root, const Path& path, Value default_value,
                     const Updater& fn);

/**
 * @brief Replace the leaf at path with fn(leaf), or with fn(default_value)
 *
 * Creates empty maps for missing intermediate keys.
 *
 * Errors: NotAMap, InvalidPath, InvalidFunction.
 */
Result<Value> update_auto(const Value& root, const Path& path, Value default_value,
                          const Updater& fn);

} // namespace pathmap

#endif // PATHMAP_PATHMAP_HPP

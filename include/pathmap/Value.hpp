/**
 * @file Value.hpp
 * @brief Value and key types for path maps
 *
 * Uses nlohmann::json as the underlying value model. A Value is a map
 * when it is a JSON object; every other Value is a terminal leaf:
 * - Null
 * - Bool (true | false)
 * - Integer (int64_t / uint64_t)
 * - Float (double)
 * - String (std::string, UTF-8)
 * - Array ([Value, ...]), never traversed
 */

#ifndef PATHMAP_VALUE_HPP
#define PATHMAP_VALUE_HPP

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace pathmap {

/**
 * @brief JSON-like value stored in a path map
 *
 * This is an alias for nlohmann::json. Nested maps are JSON objects,
 * so the same tree may hold heterogeneous values at every level.
 *
 * See nlohmann::json documentation for complete API.
 */
using Value = nlohmann::json;

/// Map key. JSON objects are string-keyed.
using Key = std::string;

/// A validated sequence of keys (used for prefixes in errors).
using Keys = std::vector<Key>;

/**
 * @brief Get human-readable type name for a Value
 * @param val The value to inspect
 * @return Type name string (e.g., "null", "boolean", "integer", "float",
 *         "string", "array", "map")
 */
inline std::string type_name(const Value& val) {
    if (val.is_null()) return "null";
    if (val.is_boolean()) return "boolean";
    if (val.is_number_integer()) return "integer";
    if (val.is_number_float()) return "float";
    if (val.is_string()) return "string";
    if (val.is_array()) return "array";
    if (val.is_object()) return "map";
    return "unknown";
}

/**
 * @brief Check if value is a map (the only traversable shape)
 */
inline bool is_map(const Value& val) {
    return val.is_object();
}

/// A fresh empty map.
inline Value empty_map() {
    return Value::object();
}

} // namespace pathmap

#endif // PATHMAP_VALUE_HPP

/**
 * @file Parse.hpp
 * @brief Text-to-Value conversion for command-line values
 *
 * Rules, first match wins:
 * - Boolean ("true", "false", case-insensitive)
 * - Null ("null", case-insensitive)
 * - Integer (^-?[0-9]+$, must fit int64)
 * - Float (^-?[0-9]+\.[0-9]+([eE][+-]?[0-9]+)?$)
 * - JSON map or array ({...} or [...])
 * - Quoted JSON string ("...", escapes decoded)
 * - Raw string (fallback)
 */

#ifndef PATHMAP_PARSE_HPP
#define PATHMAP_PARSE_HPP

#include "pathmap/Value.hpp"
#include <string>

namespace pathmap {

/**
 * @brief Parse text to the most specific Value it denotes
 *
 * Examples:
 * ```cpp
 * parse_value("TRUE")       // → true
 * parse_value("-17")        // → -17
 * parse_value("2.5e3")      // → 2500.0
 * parse_value("{\"a\":1}")  // → {"a": 1}
 * parse_value("\"42\"")     // → "42" (string)
 * parse_value("{broken")    // → "{broken" (string)
 * parse_value("")           // → ""
 * ```
 */
Value parse_value(const std::string& text);

} // namespace pathmap

#endif // PATHMAP_PARSE_HPP

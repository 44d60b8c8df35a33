/**
 * @file Path.hpp
 * @brief Path arguments for path map operations
 *
 * A Path is an ordered sequence of keys locating a position in a path
 * map; the empty path denotes the root itself.
 *
 * A Path can also be built from an arbitrary Value, in which case it may
 * be invalid (the Value is not an array of strings). An invalid Path keeps
 * the raw Value so operations can report InvalidPath with it instead of
 * guessing what the caller meant.
 *
 * Keys are strings only, as map keys are JSON object keys. A list with a
 * number (or any other non-string element) is rejected as InvalidPath up
 * front; it never reaches traversal to fail as Missing or NotAMap.
 *
 * Examples:
 * ```cpp
 * Path p1{"database", "host"};                   // valid
 * Path p2 = Path::parse_dot("database.host");    // valid, same keys
 * Path p3 = Value::parse(R"(["a", "b"])");       // valid
 * Path p4 = Value(42);                           // invalid, raw() == 42
 * Path p5 = Value::parse(R"(["a", 1])");         // invalid
 * ```
 */

#ifndef PATHMAP_PATH_HPP
#define PATHMAP_PATH_HPP

#include "pathmap/Value.hpp"
#include <initializer_list>
#include <string>
#include <vector>

namespace pathmap {

class Path {
public:
    /// The empty path (the root).
    Path() = default;

    Path(std::initializer_list<Key> keys) : keys_(keys) {}

    Path(Keys keys) : keys_(std::move(keys)) {}

    /**
     * @brief Classify a raw Value as a path
     *
     * Valid only if raw is an array whose elements are all strings.
     */
    Path(const Value& raw);

    /**
     * @brief Parse a dot-separated path
     *
     * - "a.b.c" → [a, b, c]
     * - "" → []
     * - "a..b", ".a", "a." → invalid (empty segment)
     */
    static Path parse_dot(const std::string& dotted);

    bool valid() const noexcept { return valid_; }
    bool empty() const noexcept { return keys_.empty(); }
    std::size_t size() const noexcept { return keys_.size(); }

    /// Keys of a valid path; empty for an invalid one.
    const Keys& keys() const noexcept { return keys_; }

    /// The path as a Value (the original Value when invalid).
    Value raw() const;

    /// Dot-notation rendering of a valid path.
    std::string to_dot() const;

    friend bool operator==(const Path& a, const Path& b) {
        return a.valid_ == b.valid_ && a.keys_ == b.keys_ && a.invalid_ == b.invalid_;
    }
    friend bool operator!=(const Path& a, const Path& b) {
        return !(a == b);
    }

private:
    Keys keys_;
    bool valid_ = true;
    Value invalid_;
};

/**
 * @brief Split a dot-path into segments
 *
 * Empty segments are kept so callers can reject them:
 * - "database.host" → ["database", "host"]
 * - "a..b" → ["a", "", "b"]
 * - "" → []
 */
std::vector<std::string> split_dot_path(const std::string& path);

/**
 * @brief Join path segments with dots
 *
 * - ["a", "b", "c"] → "a.b.c"
 * - [] → ""
 */
std::string join_dot_path(const Keys& segments);

/**
 * @brief Parse a path given on the command line
 *
 * Text starting with '[' is parsed as a JSON array (any parse failure,
 * or a non-string element, yields an invalid path). Anything else is
 * dot notation.
 */
Path parse_path_arg(const std::string& text);

} // namespace pathmap

#endif // PATHMAP_PATH_HPP

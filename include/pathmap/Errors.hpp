/**
 * @file Errors.hpp
 * @brief Closed error vocabulary returned by path map operations
 *
 * Every failed operation yields exactly one of:
 * - NotAMap: a non-map was found where a map was required
 * - Missing: a strict operation needed a key that is absent
 * - InvalidPath: the path argument is not a sequence of keys
 * - AlreadyExists: put_new / put_new_auto found an existing value
 * - LeafMissing: 3-argument update found no value at the final key
 * - InvalidFunction: the updater is not callable
 * - InvalidInitializer: the initializer is not callable
 *
 * Errors are ordinary values. See Exceptions.hpp for the throwing
 * counterparts used by Result::value().
 */

#ifndef PATHMAP_ERRORS_HPP
#define PATHMAP_ERRORS_HPP

#include "pathmap/Value.hpp"
#include <iosfwd>
#include <string>

namespace pathmap {

enum class ErrorKind {
    NotAMap,
    Missing,
    InvalidPath,
    AlreadyExists,
    LeafMissing,
    InvalidFunction,
    InvalidInitializer
};

/// Stable name of an error kind, e.g. "not_a_map".
std::string to_string(ErrorKind kind);

/**
 * @brief Classified failure of a path map operation
 *
 * Carries enough data to diagnose the failure without re-walking the
 * tree. Which accessors are meaningful depends on kind():
 *
 * | kind               | value()        | prefix()        | arity() |
 * |--------------------|----------------|-----------------|---------|
 * | NotAMap            | offending node | keys consumed   |         |
 * | Missing            |                | up to absent key|         |
 * | InvalidPath        | raw path       |                 |         |
 * | AlreadyExists      |                | existing key    |         |
 * | LeafMissing        |                |                 |         |
 * | InvalidFunction    |                |                 | 1       |
 * | InvalidInitializer |                |                 | 0       |
 */
class Error {
public:
    static Error not_a_map(Value value, Keys prefix);
    static Error missing(Keys prefix);
    static Error invalid_path(Value raw_path);
    static Error already_exists(Keys prefix);
    static Error leaf_missing();
    static Error invalid_function(int arity);
    static Error invalid_initializer();

    ErrorKind kind() const noexcept { return kind_; }
    const Value& value() const noexcept { return value_; }
    const Keys& prefix() const noexcept { return prefix_; }
    int arity() const noexcept { return arity_; }

    /// Human-readable description, e.g. "Missing key at 'a.b'".
    std::string message() const;

    friend bool operator==(const Error& a, const Error& b) {
        return a.kind_ == b.kind_ && a.value_ == b.value_ &&
               a.prefix_ == b.prefix_ && a.arity_ == b.arity_;
    }
    friend bool operator!=(const Error& a, const Error& b) {
        return !(a == b);
    }

private:
    Error(ErrorKind kind, Value value, Keys prefix, int arity)
        : kind_(kind)
        , value_(std::move(value))
        , prefix_(std::move(prefix))
        , arity_(arity)
    {}

    ErrorKind kind_;
    Value value_;
    Keys prefix_;
    int arity_;
};

std::ostream& operator<<(std::ostream& os, const Error& err);

} // namespace pathmap

#endif // PATHMAP_ERRORS_HPP

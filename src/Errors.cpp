/**
 * @file Errors.cpp
 * @brief Error construction, formatting and exception mapping
 */

#include "pathmap/Errors.hpp"
#include "pathmap/Exceptions.hpp"
#include "pathmap/Path.hpp"
#include <ostream>

namespace pathmap {

namespace {
    std::string describe_prefix(const Keys& prefix) {
        if (prefix.empty()) return "<root>";
        return "'" + join_dot_path(prefix) + "'";
    }
}

std::string to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NotAMap: return "not_a_map";
        case ErrorKind::Missing: return "missing";
        case ErrorKind::InvalidPath: return "invalid_path";
        case ErrorKind::AlreadyExists: return "already_exists";
        case ErrorKind::LeafMissing: return "leaf_missing";
        case ErrorKind::InvalidFunction: return "invalid_function";
        case ErrorKind::InvalidInitializer: return "invalid_initializer";
    }
    return "unknown";
}

Error Error::not_a_map(Value value, Keys prefix) {
    return Error(ErrorKind::NotAMap, std::move(value), std::move(prefix), 0);
}

Error Error::missing(Keys prefix) {
    return Error(ErrorKind::Missing, Value(), std::move(prefix), 0);
}

Error Error::invalid_path(Value raw_path) {
    return Error(ErrorKind::InvalidPath, std::move(raw_path), {}, 0);
}

Error Error::already_exists(Keys prefix) {
    return Error(ErrorKind::AlreadyExists, Value(), std::move(prefix), 0);
}

Error Error::leaf_missing() {
    return Error(ErrorKind::LeafMissing, Value(), {}, 0);
}

Error Error::invalid_function(int arity) {
    return Error(ErrorKind::InvalidFunction, Value(), {}, arity);
}

Error Error::invalid_initializer() {
    return Error(ErrorKind::InvalidInitializer, Value(), {}, 0);
}

std::string Error::message() const {
    switch (kind_) {
        case ErrorKind::NotAMap:
            return "Expected a map at " + describe_prefix(prefix_) +
                   ", found " + type_name(value_) + " " + value_.dump();
        case ErrorKind::Missing:
            return "Missing key at " + describe_prefix(prefix_);
        case ErrorKind::InvalidPath:
            return "Invalid path: " + value_.dump() +
                   " (expected a list of string keys)";
        case ErrorKind::AlreadyExists:
            return "Value already exists at " + describe_prefix(prefix_);
        case ErrorKind::LeafMissing:
            return "Leaf missing: every intermediate key exists but the final key does not";
        case ErrorKind::InvalidFunction:
            return "Invalid function: expected a callable of arity " +
                   std::to_string(arity_);
        case ErrorKind::InvalidInitializer:
            return "Invalid initializer: expected a callable of arity 0";
    }
    return "Unknown error";
}

std::ostream& operator<<(std::ostream& os, const Error& err) {
    return os << to_string(err.kind()) << ": " << err.message();
}

void throw_error(const Error& err) {
    switch (err.kind()) {
        case ErrorKind::NotAMap: throw NotAMapError(err);
        case ErrorKind::Missing: throw MissingError(err);
        case ErrorKind::InvalidPath: throw InvalidPathError(err);
        case ErrorKind::AlreadyExists: throw AlreadyExistsError(err);
        case ErrorKind::LeafMissing: throw LeafMissingError(err);
        case ErrorKind::InvalidFunction: throw InvalidFunctionError(err);
        case ErrorKind::InvalidInitializer: throw InvalidInitializerError(err);
    }
    throw PathMapError(err);
}

} // namespace pathmap

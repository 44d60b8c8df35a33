/**
 * @file Result.hpp
 * @brief Tagged outcome of a path map operation
 *
 * A Result<T> holds either a success value or an Error. A Status is the
 * payload-free form used by validate_path().
 *
 * Examples:
 * ```cpp
 * auto r = fetch(cfg, {"db", "host"});
 * if (r) {
 *     std::cout << r.value();
 * } else if (r.error().kind() == ErrorKind::Missing) {
 *     // r.error().prefix() names the absent key
 * }
 * Value port = fetch(cfg, {"db", "port"}).value_or(5432);
 * ```
 */

#ifndef PATHMAP_RESULT_HPP
#define PATHMAP_RESULT_HPP

#include "pathmap/Errors.hpp"
#include "pathmap/Exceptions.hpp"
#include <optional>
#include <utility>
#include <variant>

namespace pathmap {

template <typename T>
class Result {
public:
    static Result success(T value) {
        return Result(std::in_place_index<0>, std::move(value));
    }

    static Result failure(Error err) {
        return Result(std::in_place_index<1>, std::move(err));
    }

    bool ok() const noexcept { return state_.index() == 0; }
    explicit operator bool() const noexcept { return ok(); }

    /**
     * @brief Success value
     * @throws PathMapError subclass matching error().kind() on failure
     */
    const T& value() const& {
        if (!ok()) throw_error(std::get<1>(state_));
        return std::get<0>(state_);
    }

    T&& value() && {
        if (!ok()) throw_error(std::get<1>(state_));
        return std::get<0>(std::move(state_));
    }

    T value_or(T fallback) const& {
        if (!ok()) return fallback;
        return std::get<0>(state_);
    }

    /**
     * @brief The failure
     * @pre !ok()
     */
    const Error& error() const {
        return std::get<1>(state_);
    }

private:
    template <std::size_t I, typename U>
    Result(std::in_place_index_t<I> tag, U&& payload)
        : state_(tag, std::forward<U>(payload))
    {}

    std::variant<T, Error> state_;
};

class Status {
public:
    static Status success() { return Status(); }
    static Status failure(Error err) { return Status(std::move(err)); }

    bool ok() const noexcept { return !error_.has_value(); }
    explicit operator bool() const noexcept { return ok(); }

    /**
     * @brief The failure
     * @pre !ok()
     */
    const Error& error() const {
        return *error_;
    }

    void throw_if_error() const {
        if (error_) throw_error(*error_);
    }

private:
    Status() = default;
    explicit Status(Error err) : error_(std::move(err)) {}

    std::optional<Error> error_;
};

} // namespace pathmap

#endif // PATHMAP_RESULT_HPP

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace reqtrace {

/**
 * @brief Outcome of a handler: either a value or a typed error
 *
 * Handlers never throw for expected failures; they return
 * Result::error(rejection) and leave exceptions for infrastructure faults.
 */
template<typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    static Result ok(T value) {
        return Result(std::in_place_index<0>, std::move(value));
    }

    static Result error(E error) {
        return Result(std::in_place_index<1>, std::move(error));
    }

    [[nodiscard]] bool is_ok() const { return storage_.index() == 0; }
    [[nodiscard]] bool is_error() const { return storage_.index() == 1; }

    const T& value() const& { return std::get<0>(storage_); }
    T& value() & { return std::get<0>(storage_); }
    T&& value() && { return std::get<0>(std::move(storage_)); }

    const E& error() const& { return std::get<1>(storage_); }
    E& error() & { return std::get<1>(storage_); }
    E&& error() && { return std::get<1>(std::move(storage_)); }

private:
    template<std::size_t I, typename V>
    Result(std::in_place_index_t<I> tag, V&& v) : storage_(tag, std::forward<V>(v)) {}

    std::variant<T, E> storage_;
};

/**
 * @brief Thrown when a wrapped handler runs without a current request
 */
class MissingRequestContext : public std::logic_error {
public:
    MissingRequestContext()
        : std::logic_error("no request context is active on this thread") {}
};

} // namespace reqtrace

#pragma once

#include "core/error.hpp"
#include "core/task.hpp"

#include <concepts>
#include <type_traits>
#include <utility>

namespace reqtrace {

/**
 * @brief A request handler
 *
 * Reads the current request implicitly (RequestScope::current()) and
 * asynchronously produces Result<Extract, Error>. Filters are values:
 * copyable and callable any number of times, concurrently.
 */
template<typename F>
concept Filter = std::copy_constructible<F> && requires(const F& f) {
    typename F::Extract;
    typename F::Error;
    { f.filter() } -> std::same_as<Task<Result<typename F::Extract, typename F::Error>>>;
};

/**
 * @brief Filter built from a callable returning Task<Result<E, R>>
 *
 * Usage:
 *   auto hello = make_filter([]() -> Task<Result<Response, Rejection>> {
 *       co_return Result<Response, Rejection>::ok(reply::text("hello"));
 *   });
 */
template<typename Fn>
class FnFilter {
    using Output = typename std::invoke_result_t<const Fn&>::value_type;

public:
    using Extract = typename Output::value_type;
    using Error = typename Output::error_type;

    explicit FnFilter(Fn fn) : fn_(std::move(fn)) {}

    [[nodiscard]] Task<Output> filter() const { return fn_(); }

private:
    Fn fn_;
};

template<typename Fn>
[[nodiscard]] FnFilter<Fn> make_filter(Fn fn) {
    return FnFilter<Fn>(std::move(fn));
}

namespace detail {

/**
 * Only way to reach a wrapper's wrap(). Wrapper types keep wrap() private
 * and befriend this struct, so no outside type can pose as a wrapper.
 */
struct WrapAccess {
    template<typename W, typename F>
    static auto wrap(const W& wrapper, F filter) -> decltype(wrapper.wrap(std::move(filter))) {
        return wrapper.wrap(std::move(filter));
    }
};

} // namespace detail

/**
 * @brief Decorate a filter with a wrapper (e.g. trace::request())
 *
 * Usage:
 *   auto routes = with(with(hello, trace::context("hello")), trace::request());
 */
template<Filter F, typename W>
[[nodiscard]] auto with(F filter, const W& wrapper)
    -> decltype(detail::WrapAccess::wrap(wrapper, std::move(filter))) {
    return detail::WrapAccess::wrap(wrapper, std::move(filter));
}

} // namespace reqtrace

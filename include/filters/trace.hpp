#pragma once

#include "core/error.hpp"
#include "core/filter.hpp"
#include "core/http_types.hpp"
#include "core/rejection.hpp"
#include "core/reply.hpp"
#include "core/request_context.hpp"
#include "core/task.hpp"
#include "tracing/dispatcher.hpp"
#include "tracing/span.hpp"

#include <concepts>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace reqtrace::trace {

/// Target of the spans the canonical factories create
inline constexpr std::string_view kSpanTarget = "reqtrace";

/// Target of the events the wrapper emits
inline constexpr std::string_view kEventTarget = "reqtrace::filters::trace";

// ============================================================================
// RequestView
// ============================================================================

/**
 * @brief Read-only view of the current request handed to span factories
 *
 * Only valid for the duration of the factory call.
 */
class RequestView {
public:
    explicit RequestView(const RequestContext& ctx) : ctx_(ctx) {}

    RequestView(const RequestView&) = delete;
    RequestView& operator=(const RequestView&) = delete;

    [[nodiscard]] http::Method method() const { return ctx_.method; }
    [[nodiscard]] std::string_view path() const { return ctx_.path; }
    [[nodiscard]] http::Version version() const { return ctx_.version; }
    [[nodiscard]] const std::optional<http::SocketAddr>& remote_addr() const { return ctx_.remote_addr; }

    // Absent or non-text header values yield nullopt
    [[nodiscard]] std::optional<std::string_view> referer() const {
        return ctx_.headers.get_str(http::kRefererHeader);
    }
    [[nodiscard]] std::optional<std::string_view> user_agent() const {
        return ctx_.headers.get_str(http::kUserAgentHeader);
    }
    [[nodiscard]] std::optional<std::string_view> host() const {
        return ctx_.headers.get_str(http::kHostHeader);
    }

    [[nodiscard]] const http::HeaderMap& headers() const { return ctx_.headers; }

private:
    const RequestContext& ctx_;
};

/**
 * @brief Builds the span for one request from its RequestView
 *
 * Must not keep the view. Copied freely and called concurrently.
 */
template<typename F>
concept SpanFactory = std::copy_constructible<F> &&
    std::invocable<const F&, const RequestView&> &&
    std::same_as<std::invoke_result_t<const F&, const RequestView&>, tracing::Span>;

// ============================================================================
// Traced
// ============================================================================

namespace detail {

void record_success(const tracing::Span& span, http::StatusCode status);
void record_failure(const tracing::Span& span, http::StatusCode status, std::string error);

} // namespace detail

/**
 * @brief A successful reply that has passed through a trace wrapper
 *
 * Yields exactly the response the wrapped handler produced.
 */
class Traced {
public:
    Response into_response() && { return std::move(response_); }

    [[nodiscard]] const Response& response() const { return response_; }

    /**
     * @brief Record the outcome on the current span and pass it on
     *
     * Success: the reply is materialized, response.status is recorded and a
     * DEBUG event emitted. Failure: response.status and response.error are
     * recorded, a TRACE event emitted, and the rejection returned as is.
     */
    template<Reply R, IsReject E>
    static Result<Traced, E> map_result(Result<R, E> result) {
        const tracing::Span span = tracing::Span::current();
        if (result.is_ok()) {
            Response response = std::move(result).value().into_response();
            detail::record_success(span, response.status);
            return Result<Traced, E>::ok(Traced(std::move(response)));
        }
        const E& rejection = result.error();
        detail::record_failure(span, rejection.status(), rejection.debug_string());
        return Result<Traced, E>::error(std::move(result).error());
    }

private:
    explicit Traced(Response response) : response_(std::move(response)) {}

    Response response_;
};

namespace detail {

template<Reply R, IsReject E>
Task<Result<Traced, E>> record_outcome(Task<Result<R, E>> inner) {
    auto result = co_await std::move(inner);
    co_return Traced::map_result(std::move(result));
}

} // namespace detail

// ============================================================================
// WithTrace / Trace
// ============================================================================

/**
 * @brief A filter instrumented with a span per request
 *
 * filter() builds the span synchronously (throws MissingRequestContext
 * outside a request), emits "received request" inside it, and returns a
 * task that runs the inner filter with the span entered on every
 * resumption, then records the outcome. The inner result is returned
 * unchanged.
 */
template<Filter FN, SpanFactory F>
    requires Reply<typename FN::Extract> && IsReject<typename FN::Error>
class WithTrace {
public:
    using Extract = Traced;
    using Error = typename FN::Error;

    WithTrace(FN filter, F factory) : filter_(std::move(filter)), factory_(std::move(factory)) {}

    [[nodiscard]] Task<Result<Traced, Error>> filter() const {
        tracing::Span span = with_request([this](const RequestContext& ctx) {
            const RequestView view(ctx);
            return factory_(view);
        });

        auto inner = span.in_scope([this] {
            tracing::event(tracing::Level::TRACE, kEventTarget, "received request");
            return filter_.filter();
        });

        return detail::record_outcome(std::move(inner))
            .instrument(std::move(span))
            .into_task();
    }

private:
    FN filter_;
    F factory_;
};

/**
 * @brief Wrapper that instruments a filter with spans built by a factory
 *
 * Apply with reqtrace::with(filter, trace(...)).
 */
template<SpanFactory F = tracing::Span (*)(const RequestView&)>
class Trace {
public:
    explicit Trace(F factory) : factory_(std::move(factory)) {}

private:
    friend struct reqtrace::detail::WrapAccess;

    template<Filter FN>
    WithTrace<FN, F> wrap(FN filter) const {
        return WithTrace<FN, F>(std::move(filter), factory_);
    }

    F factory_;
};

/// Instrument with any span factory
template<SpanFactory F>
[[nodiscard]] Trace<F> trace(F factory) {
    return Trace<F>(std::move(factory));
}

/// INFO span "request" with method, path and version fields
[[nodiscard]] tracing::Span request_span(const RequestView& view);

/**
 * @brief DEBUG span "context" named by a fixed label
 */
class ContextSpan {
public:
    explicit ContextSpan(std::string name) : name_(std::move(name)) {}

    tracing::Span operator()(const RequestView& view) const;

    [[nodiscard]] const std::string& name() const { return name_; }

private:
    std::string name_;
};

/**
 * @brief Instrument every request with an INFO "request" span
 *
 * Usage:
 *   auto routes = with(handlers, trace::request());
 */
[[nodiscard]] Trace<> request();

/**
 * @brief Instrument with a DEBUG "context" span labelled name
 *
 * Usage:
 *   auto hello = with(say_hello, trace::context("hello"));
 */
[[nodiscard]] Trace<ContextSpan> context(std::string name);

} // namespace reqtrace::trace

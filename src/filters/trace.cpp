#include "filters/trace.hpp"

namespace reqtrace::trace {

namespace detail {

void record_success(const tracing::Span& span, const http::StatusCode status) {
    span.record("response.status", status);
    tracing::event(tracing::Level::DEBUG, kEventTarget, {},
                   {{"response.status", status}});
}

void record_failure(const tracing::Span& span, const http::StatusCode status, std::string error) {
    tracing::DebugValue rendered{std::move(error)};
    span.record("response.status", status);
    span.record("response.error", rendered);
    tracing::event(tracing::Level::TRACE, kEventTarget, {},
                   {{"response.status", status}, {"response.error", std::move(rendered)}});
}

} // namespace detail

tracing::Span request_span(const RequestView& view) {
    return tracing::Span::create(tracing::Level::INFO, kSpanTarget, "request", {
        {"method", http::to_string(view.method())},
        {"path", tracing::quoted(view.path())},
        {"version", tracing::DebugValue{std::string(http::to_string(view.version()))}},
    });
}

tracing::Span ContextSpan::operator()(const RequestView&) const {
    return tracing::Span::create(tracing::Level::DEBUG, kSpanTarget, "context", {
        {std::string(tracing::kMessageField), name_},
    });
}

Trace<> request() {
    return Trace<>(&request_span);
}

Trace<ContextSpan> context(std::string name) {
    return Trace<ContextSpan>(ContextSpan(std::move(name)));
}

} // namespace reqtrace::trace

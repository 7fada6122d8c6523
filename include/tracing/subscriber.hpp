#pragma once

#include "tracing/metadata.hpp"

#include <chrono>
#include <memory>
#include <string_view>

namespace reqtrace::tracing {

class SpanData;

/**
 * @brief A single diagnostic event, attributed to the span current at emission
 */
struct Event {
    Metadata metadata;
    FieldSet fields;
    std::shared_ptr<const SpanData> span;   // null outside any span
    std::chrono::system_clock::time_point timestamp;

    /// Empty when the event carries only fields
    [[nodiscard]] std::string message() const;
};

/**
 * @brief Abstract interface for diagnostic consumers
 *
 * Called concurrently from every thread that opens spans or emits events;
 * implementations synchronize internally. Span callbacks receive the span
 * state by reference; it is only valid for the duration of the call.
 */
class ISubscriber {
public:
    virtual ~ISubscriber() = default;

    /// Whether spans/events with this metadata are recorded at all
    [[nodiscard]] virtual bool enabled(const Metadata& metadata) const = 0;

    virtual void on_new_span(const SpanData& span) = 0;

    /// Fields attached after creation
    virtual void on_record(const SpanData& span, const FieldSet& values) = 0;

    virtual void on_event(const Event& event) = 0;

    virtual void on_enter(const SpanData& span) = 0;
    virtual void on_exit(const SpanData& span) = 0;

    /// Last handle to the span was dropped
    virtual void on_close(const SpanData& span) = 0;

    virtual void flush() {}
};

} // namespace reqtrace::tracing

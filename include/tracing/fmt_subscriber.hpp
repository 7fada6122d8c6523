#pragma once

#include "tracing/env_filter.hpp"
#include "tracing/event_sink.hpp"
#include "tracing/subscriber.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace reqtrace::tracing {

enum class OutputFormat : uint8_t { TEXT, JSON };

/// Which span lifecycle points produce a line of their own
enum class SpanEvents : uint8_t { NONE, NEW, CLOSE, FULL };

[[nodiscard]] std::optional<OutputFormat> parse_output_format(std::string_view name);
[[nodiscard]] std::optional<SpanEvents> parse_span_events(std::string_view name);

/**
 * @brief Subscriber that formats events as text or JSON lines
 *
 * Text:
 *   2026-01-01T12:00:00.000+0000 DEBUG request{method=GET path="/hello"}: reqtrace::filters::trace: finished processing with success response.status=200
 *
 * JSON (one object per line):
 *   {"timestamp":"...","level":"DEBUG","target":"...","fields":{...},
 *    "span":{"name":"request",...},"spans":[{...},...]}
 *
 * Span close lines carry time.busy (entered) and time.idle (open but not
 * entered) durations.
 */
class FmtSubscriber : public ISubscriber {
public:
    struct Config {
        EnvFilter filter;
        OutputFormat format = OutputFormat::TEXT;
        bool with_target = true;
        SpanEvents span_events = SpanEvents::NONE;
    };

    FmtSubscriber(Config config, std::unique_ptr<IEventSink> sink);
    ~FmtSubscriber() override;

    [[nodiscard]] bool enabled(const Metadata& metadata) const override;

    void on_new_span(const SpanData& span) override;
    void on_record(const SpanData& span, const FieldSet& values) override;
    void on_event(const Event& event) override;
    void on_enter(const SpanData& span) override;
    void on_exit(const SpanData& span) override;
    void on_close(const SpanData& span) override;

    void flush() override;

    [[nodiscard]] const Config& config() const { return config_; }

private:
    struct Timing {
        std::chrono::steady_clock::time_point last;
        std::chrono::nanoseconds busy{0};
        std::chrono::nanoseconds idle{0};
        uint32_t entered = 0;
    };

    [[nodiscard]] std::string format_text(const Metadata& metadata, const FieldSet& fields,
                                          const SpanData* span,
                                          std::chrono::system_clock::time_point timestamp) const;
    [[nodiscard]] std::string format_json(const Metadata& metadata, const FieldSet& fields,
                                          const SpanData* span,
                                          std::chrono::system_clock::time_point timestamp) const;
    /// Formats and writes one line; failures are logged and the line dropped
    void emit(const Metadata& metadata, const FieldSet& fields, const SpanData* span,
              std::chrono::system_clock::time_point timestamp) noexcept;

    Config config_;

    std::mutex sink_mutex_;
    std::unique_ptr<IEventSink> sink_;

    std::mutex timing_mutex_;
    std::unordered_map<const SpanData*, Timing> timings_;
};

/// "1.25ms", "830us", "2.00s"
[[nodiscard]] std::string format_duration(std::chrono::nanoseconds duration);

} // namespace reqtrace::tracing

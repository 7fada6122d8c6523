#include "tracing/fmt_subscriber.hpp"
#include "tracing/span.hpp"
#include "core/utils.hpp"

#include <nlohmann/json.hpp>

#include <exception>
#include <format>
#include <vector>

namespace reqtrace::tracing {

namespace {

// Root first
std::vector<const SpanData*> span_chain(const SpanData* span) {
    std::vector<const SpanData*> chain;
    for (const SpanData* s = span; s != nullptr; s = s->parent().get()) {
        chain.push_back(s);
    }
    return {chain.rbegin(), chain.rend()};
}

void append_fields(std::string& out, const FieldSet& fields) {
    bool first = true;
    for (const auto& field : fields) {
        if (!first) out += ' ';
        first = false;
        if (field.name == kMessageField) {
            out += field.value.render();
        } else {
            out += std::format("{}={}", field.name, field.value.render());
        }
    }
}

nlohmann::json to_json(const FieldValue& value) {
    return std::visit([](const auto& v) -> nlohmann::json {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, DebugValue>) {
            return v.repr;
        } else {
            return v;
        }
    }, value.storage());
}

nlohmann::json span_to_json(const SpanData& span) {
    nlohmann::json obj = nlohmann::json::object();
    obj["name"] = span.name();
    obj["id"] = span.id();
    for (const auto& field : span.fields()) {
        obj[field.name] = to_json(field.value);
    }
    return obj;
}

bool wants_new(SpanEvents events) {
    return events == SpanEvents::NEW || events == SpanEvents::FULL;
}

bool wants_close(SpanEvents events) {
    return events == SpanEvents::CLOSE || events == SpanEvents::FULL;
}

} // anonymous namespace

std::optional<OutputFormat> parse_output_format(std::string_view name) {
    const std::string lower = utils::to_lower(utils::trim(name));
    if (lower == "text") return OutputFormat::TEXT;
    if (lower == "json") return OutputFormat::JSON;
    return std::nullopt;
}

std::optional<SpanEvents> parse_span_events(std::string_view name) {
    const std::string lower = utils::to_lower(utils::trim(name));
    if (lower == "none") return SpanEvents::NONE;
    if (lower == "new") return SpanEvents::NEW;
    if (lower == "close") return SpanEvents::CLOSE;
    if (lower == "full") return SpanEvents::FULL;
    return std::nullopt;
}

std::string format_duration(const std::chrono::nanoseconds duration) {
    const auto ns = static_cast<double>(duration.count());
    if (ns >= 1e9) return std::format("{:.2f}s", ns / 1e9);
    if (ns >= 1e6) return std::format("{:.2f}ms", ns / 1e6);
    if (ns >= 1e3) return std::format("{:.2f}us", ns / 1e3);
    return std::format("{}ns", duration.count());
}

// ============================================================================
// FmtSubscriber
// ============================================================================

FmtSubscriber::FmtSubscriber(Config config, std::unique_ptr<IEventSink> sink)
    : config_(std::move(config)),
      sink_(sink ? std::move(sink) : std::make_unique<StderrSink>()) {}

FmtSubscriber::~FmtSubscriber() {
    std::lock_guard lock(sink_mutex_);
    sink_->shutdown();
}

bool FmtSubscriber::enabled(const Metadata& metadata) const {
    return config_.filter.enabled(metadata.level, metadata.target);
}

void FmtSubscriber::on_new_span(const SpanData& span) {
    {
        std::lock_guard lock(timing_mutex_);
        timings_[&span] = Timing{.last = std::chrono::steady_clock::now()};
    }
    if (wants_new(config_.span_events)) {
        const FieldSet fields{Field{std::string(kMessageField), FieldValue("new")}};
        emit(span.metadata(), fields, &span, std::chrono::system_clock::now());
    }
}

void FmtSubscriber::on_record(const SpanData&, const FieldSet&) {
    // Span fields are read from the span when a line is formatted
}

void FmtSubscriber::on_event(const Event& event) {
    emit(event.metadata, event.fields, event.span.get(), event.timestamp);
}

void FmtSubscriber::on_enter(const SpanData& span) {
    std::lock_guard lock(timing_mutex_);
    const auto it = timings_.find(&span);
    if (it == timings_.end()) return;

    auto& timing = it->second;
    const auto now = std::chrono::steady_clock::now();
    if (timing.entered++ == 0) {
        timing.idle += now - timing.last;
        timing.last = now;
    }
}

void FmtSubscriber::on_exit(const SpanData& span) {
    std::lock_guard lock(timing_mutex_);
    const auto it = timings_.find(&span);
    if (it == timings_.end() || it->second.entered == 0) return;

    auto& timing = it->second;
    if (--timing.entered == 0) {
        const auto now = std::chrono::steady_clock::now();
        timing.busy += now - timing.last;
        timing.last = now;
    }
}

void FmtSubscriber::on_close(const SpanData& span) {
    Timing timing;
    {
        std::lock_guard lock(timing_mutex_);
        const auto it = timings_.find(&span);
        if (it == timings_.end()) return;
        timing = it->second;
        timings_.erase(it);
    }
    if (!wants_close(config_.span_events)) return;

    timing.idle += std::chrono::steady_clock::now() - timing.last;
    const FieldSet fields{
        Field{std::string(kMessageField), FieldValue("close")},
        Field{"time.busy", FieldValue(format_duration(timing.busy))},
        Field{"time.idle", FieldValue(format_duration(timing.idle))},
    };
    emit(span.metadata(), fields, &span, std::chrono::system_clock::now());
}

void FmtSubscriber::flush() {
    std::lock_guard lock(sink_mutex_);
    sink_->flush();
}

void FmtSubscriber::emit(const Metadata& metadata, const FieldSet& fields, const SpanData* span,
                         const std::chrono::system_clock::time_point timestamp) noexcept {
    // Reached from span destructors and noexcept awaiters: never throws
    try {
        const std::string line = config_.format == OutputFormat::JSON
            ? format_json(metadata, fields, span, timestamp)
            : format_text(metadata, fields, span, timestamp);

        std::lock_guard lock(sink_mutex_);
        if (!sink_->write(line)) {
            utils::log::error(std::format("Trace sink {} failed to write", sink_->name()));
        }
    } catch (const std::exception& e) {
        utils::log::error(std::format("Dropped trace line for {}: {}", metadata.target, e.what()));
    }
}

std::string FmtSubscriber::format_text(const Metadata& metadata, const FieldSet& fields,
                                       const SpanData* span,
                                       const std::chrono::system_clock::time_point timestamp) const {
    std::string out = std::format("{} {:>5} ", utils::format_timestamp(timestamp),
                                  to_string(metadata.level));

    const auto chain = span_chain(span);
    for (size_t i = 0; i < chain.size(); ++i) {
        if (i > 0) out += ':';
        out += chain[i]->name();
        const auto span_fields = chain[i]->fields();
        if (!span_fields.empty()) {
            out += '{';
            append_fields(out, span_fields);
            out += '}';
        }
    }
    if (!chain.empty()) out += ": ";

    if (config_.with_target) {
        out += std::format("{}: ", metadata.target);
    }
    append_fields(out, fields);
    return out;
}

std::string FmtSubscriber::format_json(const Metadata& metadata, const FieldSet& fields,
                                       const SpanData* span,
                                       const std::chrono::system_clock::time_point timestamp) const {
    nlohmann::json obj = nlohmann::json::object();
    obj["timestamp"] = utils::format_timestamp(timestamp);
    obj["level"] = std::string(to_string(metadata.level));
    if (config_.with_target) {
        obj["target"] = std::string(metadata.target);
    }

    nlohmann::json field_obj = nlohmann::json::object();
    for (const auto& field : fields) {
        field_obj[field.name] = to_json(field.value);
    }
    obj["fields"] = std::move(field_obj);

    if (span != nullptr) {
        obj["trace_id"] = span->trace_id();
        obj["span"] = span_to_json(*span);
        nlohmann::json spans = nlohmann::json::array();
        for (const SpanData* s : span_chain(span)) {
            spans.push_back(span_to_json(*s));
        }
        obj["spans"] = std::move(spans);
    }
    // Field text is not guaranteed to be UTF-8; bad bytes become U+FFFD
    return obj.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace reqtrace::tracing

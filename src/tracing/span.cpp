#include "tracing/span.hpp"
#include "tracing/dispatcher.hpp"
#include "tracing/ids.hpp"

#include <utility>

namespace reqtrace::tracing {

namespace {

// Innermost entered span of this thread. Entered guards keep it alive.
thread_local SpanData* current_span = nullptr;

} // anonymous namespace

// ============================================================================
// SpanData
// ============================================================================

SpanData::SpanData(Level level, std::string target, std::string name, FieldSet fields,
                   std::shared_ptr<SpanData> parent, std::shared_ptr<ISubscriber> subscriber)
    : id_(generate_span_id()),
      trace_id_(parent ? parent->trace_id() : generate_trace_id()),
      name_(std::move(name)),
      target_(std::move(target)),
      level_(level),
      parent_(std::move(parent)),
      subscriber_(std::move(subscriber)),
      opened_at_(std::chrono::system_clock::now()),
      fields_(std::move(fields)) {}

SpanData::~SpanData() {
    if (subscriber_) {
        subscriber_->on_close(*this);
    }
}

FieldSet SpanData::fields() const {
    std::lock_guard lock(fields_mutex_);
    return fields_;
}

void SpanData::record(Field field) {
    std::lock_guard lock(fields_mutex_);
    for (auto& existing : fields_) {
        if (existing.name == field.name) {
            existing.value = std::move(field.value);
            return;
        }
    }
    fields_.push_back(std::move(field));
}

// ============================================================================
// Entered
// ============================================================================

Entered::Entered(std::shared_ptr<SpanData> span) noexcept
    : span_(std::move(span)),
      previous_(std::exchange(current_span, span_.get())) {
    span_->subscriber_->on_enter(*span_);
}

Entered::~Entered() {
    exit();
}

Entered::Entered(Entered&& other) noexcept
    : span_(std::move(other.span_)),
      previous_(std::exchange(other.previous_, nullptr)) {}

Entered& Entered::operator=(Entered&& other) noexcept {
    if (this != &other) {
        exit();
        span_ = std::move(other.span_);
        previous_ = std::exchange(other.previous_, nullptr);
    }
    return *this;
}

void Entered::exit() noexcept {
    if (!span_) return;
    current_span = previous_;
    span_->subscriber_->on_exit(*span_);
    span_.reset();
    previous_ = nullptr;
}

// ============================================================================
// Span
// ============================================================================

Span Span::create(Level level, std::string_view target, std::string_view name, FieldSet fields) {
    auto subscriber = current_dispatch();
    if (!subscriber) {
        return Span();
    }
    const Metadata metadata{name, target, level, Kind::SPAN};
    if (!subscriber->enabled(metadata)) {
        return Span();
    }

    std::shared_ptr<SpanData> parent;
    if (current_span) {
        parent = current_span->shared_from_this();
    }

    auto data = std::make_shared<SpanData>(level, std::string(target), std::string(name),
                                           std::move(fields), std::move(parent), subscriber);
    subscriber->on_new_span(*data);
    return Span(std::move(data));
}

Span Span::current() {
    if (!current_span) {
        return Span();
    }
    return Span(current_span->shared_from_this());
}

std::string_view Span::id() const {
    if (!data_) return {};
    return data_->id();
}

Span Span::parent() const {
    if (!data_) return Span();
    return Span(data_->parent());
}

Entered Span::enter() const {
    if (!data_) {
        return Entered();
    }
    return Entered(data_);
}

void Span::record(std::string name, FieldValue value) const {
    if (!data_) return;
    data_->record(Field{name, value});
    data_->subscriber_->on_record(*data_, FieldSet{Field{std::move(name), std::move(value)}});
}

} // namespace reqtrace::tracing

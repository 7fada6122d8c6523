#include "tracing/dispatcher.hpp"

#include <atomic>
#include <mutex>
#include <utility>

namespace reqtrace::tracing {

namespace {

// Written once under the mutex, then published through the ready flag.
std::mutex global_mutex;
std::shared_ptr<ISubscriber> global_subscriber;
std::atomic<bool> global_ready{false};

thread_local std::shared_ptr<ISubscriber> scoped_subscriber;

} // anonymous namespace

bool set_global_default(std::shared_ptr<ISubscriber> subscriber) {
    std::lock_guard lock(global_mutex);
    if (global_ready.load(std::memory_order_relaxed)) {
        return false;
    }
    global_subscriber = std::move(subscriber);
    global_ready.store(true, std::memory_order_release);
    return true;
}

void flush_global_default() {
    if (global_ready.load(std::memory_order_acquire) && global_subscriber) {
        global_subscriber->flush();
    }
}

std::shared_ptr<ISubscriber> current_dispatch() {
    if (scoped_subscriber) {
        return scoped_subscriber;
    }
    if (global_ready.load(std::memory_order_acquire)) {
        return global_subscriber;
    }
    return nullptr;
}

// ============================================================================
// DefaultGuard
// ============================================================================

DefaultGuard::DefaultGuard(std::shared_ptr<ISubscriber> subscriber)
    : previous_(std::exchange(scoped_subscriber, std::move(subscriber))) {}

DefaultGuard::~DefaultGuard() {
    scoped_subscriber = std::move(previous_);
}

// ============================================================================
// Events
// ============================================================================

bool enabled(const Level level, std::string_view target) {
    const auto subscriber = current_dispatch();
    if (!subscriber) return false;
    return subscriber->enabled(Metadata{"event", target, level, Kind::EVENT});
}

void event(const Level level, std::string_view target, std::string_view message, FieldSet fields) {
    const auto subscriber = current_dispatch();
    if (!subscriber) return;

    const Metadata metadata{"event", target, level, Kind::EVENT};
    if (!subscriber->enabled(metadata)) return;

    if (!message.empty()) {
        fields.insert(fields.begin(), Field{std::string(kMessageField), FieldValue(message)});
    }

    const Span current = Span::current();
    Event ev{
        .metadata = metadata,
        .fields = std::move(fields),
        .span = current.is_none() ? nullptr : current.data()->shared_from_this(),
        .timestamp = std::chrono::system_clock::now(),
    };
    subscriber->on_event(ev);
}

std::string Event::message() const {
    const FieldValue* value = find_field(fields, kMessageField);
    return value ? value->render() : std::string{};
}

} // namespace reqtrace::tracing

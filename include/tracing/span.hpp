#pragma once

#include "tracing/metadata.hpp"
#include "tracing/subscriber.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

namespace reqtrace::tracing {

/**
 * @brief Shared state of one open span
 *
 * Lives as long as any Span handle, Entered guard or child span refers to
 * it. Closing (the subscriber's on_close) happens in the destructor.
 */
class SpanData : public std::enable_shared_from_this<SpanData> {
public:
    SpanData(Level level, std::string target, std::string name, FieldSet fields,
             std::shared_ptr<SpanData> parent, std::shared_ptr<ISubscriber> subscriber);
    ~SpanData();

    SpanData(const SpanData&) = delete;
    SpanData& operator=(const SpanData&) = delete;

    [[nodiscard]] const std::string& id() const { return id_; }
    [[nodiscard]] const std::string& trace_id() const { return trace_id_; }
    [[nodiscard]] const std::string& name() const { return name_; }
    [[nodiscard]] const std::string& target() const { return target_; }
    [[nodiscard]] Level level() const { return level_; }
    [[nodiscard]] Metadata metadata() const { return {name_, target_, level_, Kind::SPAN}; }
    [[nodiscard]] const std::shared_ptr<SpanData>& parent() const { return parent_; }
    [[nodiscard]] std::chrono::system_clock::time_point opened_at() const { return opened_at_; }

    /// Snapshot of creation-time and recorded fields
    [[nodiscard]] FieldSet fields() const;

private:
    friend class Span;
    friend class Entered;

    void record(Field field);

    std::string id_;
    std::string trace_id_;
    std::string name_;
    std::string target_;
    Level level_;
    std::shared_ptr<SpanData> parent_;
    std::shared_ptr<ISubscriber> subscriber_;
    std::chrono::system_clock::time_point opened_at_;

    mutable std::mutex fields_mutex_;
    FieldSet fields_;
};

/**
 * @brief RAII guard marking a span as the current one on this thread
 *
 * Guards must be released in reverse order of creation on the thread that
 * created them. Never hold one across a co_await: tasks re-enter their span
 * themselves on every resumption.
 */
class [[nodiscard]] Entered {
public:
    Entered() noexcept = default;
    ~Entered();

    Entered(Entered&& other) noexcept;
    Entered& operator=(Entered&& other) noexcept;

    Entered(const Entered&) = delete;
    Entered& operator=(const Entered&) = delete;

private:
    friend class Span;

    explicit Entered(std::shared_ptr<SpanData> span) noexcept;
    void exit() noexcept;

    std::shared_ptr<SpanData> span_;
    SpanData* previous_ = nullptr;
};

/**
 * @brief Handle to a diagnostic span
 *
 * Cheap to copy; all copies refer to the same span, which closes when the
 * last one goes away. A default-constructed (or filtered-out) span is
 * "none": entering and recording on it do nothing.
 *
 * Usage:
 *   auto span = Span::create(Level::INFO, "reqtrace", "request", {{"method", "GET"}});
 *   auto guard = span.enter();
 *   tracing::event(Level::DEBUG, "reqtrace", "inside the request span");
 */
class Span {
public:
    Span() = default;

    /// New span whose parent is the current span; none if no subscriber wants it
    [[nodiscard]] static Span create(Level level, std::string_view target,
                                     std::string_view name, FieldSet fields = {});

    /// Span entered on this thread, or none
    [[nodiscard]] static Span current();

    [[nodiscard]] static Span none() { return Span(); }

    [[nodiscard]] bool is_none() const { return data_ == nullptr; }
    [[nodiscard]] const SpanData* data() const { return data_.get(); }

    /// Id of the span, empty for none
    [[nodiscard]] std::string_view id() const;

    [[nodiscard]] Span parent() const;

    [[nodiscard]] Entered enter() const;

    template<typename Fn>
    decltype(auto) in_scope(Fn&& fn) const {
        const Entered guard = enter();
        return std::forward<Fn>(fn)();
    }

    /// Attach (or overwrite) a field after creation
    void record(std::string name, FieldValue value) const;

    bool operator==(const Span& other) const { return data_ == other.data_; }

private:
    explicit Span(std::shared_ptr<SpanData> data) : data_(std::move(data)) {}

    std::shared_ptr<SpanData> data_;
};

} // namespace reqtrace::tracing

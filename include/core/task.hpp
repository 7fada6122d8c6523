#pragma once

#include "core/request_context.hpp"
#include "tracing/span.hpp"

#include <concepts>
#include <condition_variable>
#include <coroutine>
#include <exception>
#include <functional>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

namespace reqtrace {

template<typename T = void>
class Task;

template<typename T>
class Instrumented;

namespace detail {

// ============================================================================
// Task-local context
// ============================================================================

/**
 * @brief Ambient context a task carries across suspensions
 *
 * Captured from the creating thread when the task is created; the span can
 * be replaced before the task first runs (Instrumented).
 */
struct TaskLocals {
    const RequestContext* request = nullptr;
    tracing::Span span;
};

/// Re-installs the task locals on the resuming thread
class ResumeScope {
public:
    explicit ResumeScope(const TaskLocals& locals)
        : request_(locals.request), entered_(locals.span.enter()) {}

    ResumeScope(const ResumeScope&) = delete;
    ResumeScope& operator=(const ResumeScope&) = delete;

private:
    RequestScope request_;
    tracing::Entered entered_;
};

template<typename A>
concept HasMemberCoAwait = requires(A&& a) { std::forward<A>(a).operator co_await(); };

template<typename A>
concept HasFreeCoAwait = requires(A&& a) { operator co_await(std::forward<A>(a)); };

template<typename T>
struct remove_rvalue_reference { using type = T; };

template<typename T>
struct remove_rvalue_reference<T&&> { using type = T; };

template<typename A>
decltype(auto) get_awaiter(A&& awaitable) {
    if constexpr (HasMemberCoAwait<A>) {
        return std::forward<A>(awaitable).operator co_await();
    } else if constexpr (HasFreeCoAwait<A>) {
        return operator co_await(std::forward<A>(awaitable));
    } else {
        return std::forward<A>(awaitable);
    }
}

// ============================================================================
// Promise base: locals, continuation, completion callback
// ============================================================================

class PromiseBase {
public:
    PromiseBase()
        : locals_{RequestScope::current(), tracing::Span::current()} {}

    /// Install the locals on this thread (no-op if already installed)
    void enter() {
        if (!scope_) {
            scope_.emplace(locals_);
        }
    }

    /// Uninstall the locals; called right before every suspension
    void leave() noexcept { scope_.reset(); }

    [[nodiscard]] const TaskLocals& locals() const { return locals_; }
    void bind_span(tracing::Span span) { locals_.span = std::move(span); }

    [[nodiscard]] bool started() const { return started_; }

    void set_continuation(std::coroutine_handle<> continuation) { continuation_ = continuation; }
    void set_on_complete(std::function<void()> on_complete) { on_complete_ = std::move(on_complete); }

    struct InitialAwaiter {
        PromiseBase& promise;

        bool await_ready() const noexcept { return false; }
        void await_suspend(std::coroutine_handle<>) const noexcept {}
        void await_resume() const {
            promise.started_ = true;
            promise.enter();
        }
    };

    /**
     * Leaves the task's context, closes its span handle and hands control
     * to whoever awaits the result. Nothing in the frame is touched after
     * on_complete runs: the owner may destroy the task from it.
     */
    struct FinalAwaiter {
        bool await_ready() const noexcept { return false; }

        template<typename P>
        std::coroutine_handle<> await_suspend(std::coroutine_handle<P> handle) const noexcept {
            PromiseBase& promise = handle.promise();
            promise.leave();
            promise.locals_.span = tracing::Span::none();

            const std::coroutine_handle<> continuation = promise.continuation_;
            const std::function<void()> on_complete = std::move(promise.on_complete_);
            if (on_complete) {
                on_complete();
            }
            return continuation ? continuation : std::noop_coroutine();
        }

        void await_resume() const noexcept {}
    };

    /**
     * Wraps any awaiter so the task context is uninstalled before the task
     * suspends and installed again when it resumes, whichever thread that
     * happens on.
     */
    template<typename Awaiter>
    class BracketAwaiter {
    public:
        BracketAwaiter(Awaiter&& inner, PromiseBase& promise)
            : inner_(std::forward<Awaiter>(inner)), promise_(promise) {}

        bool await_ready() { return inner_.await_ready(); }

        template<typename P>
        auto await_suspend(std::coroutine_handle<P> handle) {
            using R = decltype(inner_.await_suspend(handle));
            promise_.leave();
            // Once the inner awaiter has accepted the handle the task may be
            // running (or gone) elsewhere: only the refusal paths touch state
            try {
                if constexpr (std::is_void_v<R>) {
                    inner_.await_suspend(handle);
                } else if constexpr (std::is_same_v<R, bool>) {
                    const bool suspended = inner_.await_suspend(handle);
                    if (!suspended) {
                        promise_.enter();
                    }
                    return suspended;
                } else {
                    return inner_.await_suspend(handle);
                }
            } catch (...) {
                promise_.enter();
                throw;
            }
        }

        decltype(auto) await_resume() {
            promise_.enter();
            return inner_.await_resume();
        }

    private:
        Awaiter inner_;
        PromiseBase& promise_;
    };

    InitialAwaiter initial_suspend() noexcept { return InitialAwaiter{*this}; }
    FinalAwaiter final_suspend() noexcept { return {}; }

    template<typename A>
    auto await_transform(A&& awaitable) {
        using Awaiter = typename remove_rvalue_reference<
            decltype(get_awaiter(std::forward<A>(awaitable)))>::type;
        return BracketAwaiter<Awaiter>(get_awaiter(std::forward<A>(awaitable)), *this);
    }

private:
    TaskLocals locals_;
    std::optional<ResumeScope> scope_;
    bool started_ = false;
    std::coroutine_handle<> continuation_;
    std::function<void()> on_complete_;
};

template<typename T>
class Promise : public PromiseBase {
public:
    Task<T> get_return_object();

    template<typename V>
        requires std::convertible_to<V, T>
    void return_value(V&& value) {
        result_.template emplace<1>(std::forward<V>(value));
    }

    void unhandled_exception() noexcept {
        result_.template emplace<2>(std::current_exception());
    }

    T take_result() {
        if (result_.index() == 2) {
            std::rethrow_exception(std::get<2>(result_));
        }
        if (result_.index() != 1) {
            throw std::logic_error("task has not completed");
        }
        return std::get<1>(std::move(result_));
    }

private:
    std::variant<std::monostate, T, std::exception_ptr> result_;
};

template<>
class Promise<void> : public PromiseBase {
public:
    Task<void> get_return_object();

    void return_void() noexcept { completed_ = true; }

    void unhandled_exception() noexcept {
        exception_ = std::current_exception();
        completed_ = true;
    }

    void take_result() {
        if (exception_) {
            std::rethrow_exception(exception_);
        }
        if (!completed_) {
            throw std::logic_error("task has not completed");
        }
    }

private:
    bool completed_ = false;
    std::exception_ptr exception_;
};

} // namespace detail

// ============================================================================
// Task
// ============================================================================

/**
 * @brief Lazily started asynchronous computation producing a T
 *
 * Nothing runs until the task is awaited or started. The request and the
 * span current when the task was created are re-installed every time the
 * task resumes, on whatever thread resumes it.
 *
 * Destroying an unfinished task abandons it: its frame (and every frame it
 * is awaiting) is destroyed, releasing spans without a completion event.
 * Only abandon a task that is not being resumed concurrently.
 *
 * Usage:
 *   Task<int> answer() { co_await schedule_on(pool); co_return 42; }
 *   int v = block_on(answer());
 */
template<typename T>
class [[nodiscard]] Task {
public:
    using promise_type = detail::Promise<T>;
    using value_type = T;

    Task() = default;
    ~Task() {
        if (handle_) {
            handle_.destroy();
        }
    }

    Task(Task&& other) noexcept : handle_(std::exchange(other.handle_, {})) {}
    Task& operator=(Task&& other) noexcept {
        if (this != &other) {
            if (handle_) {
                handle_.destroy();
            }
            handle_ = std::exchange(other.handle_, {});
        }
        return *this;
    }

    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    [[nodiscard]] bool valid() const { return static_cast<bool>(handle_); }
    [[nodiscard]] bool done() const { return handle_ && handle_.done(); }

    /// Span the task will run inside
    [[nodiscard]] const tracing::Span& span() const { return handle_.promise().locals().span; }

    /**
     * @brief Run the task on this thread until its first suspension
     * @param on_complete Called once, on the completing thread, when done
     */
    void start(std::function<void()> on_complete = {}) {
        if (!handle_ || handle_.promise().started()) {
            throw std::logic_error("task is empty or already started");
        }
        handle_.promise().set_on_complete(std::move(on_complete));
        handle_.resume();
    }

    /// Result of a finished task; rethrows its exception
    T result() && { return handle_.promise().take_result(); }

    /// Attach a span the task will enter on every resumption
    [[nodiscard]] Instrumented<T> instrument(tracing::Span span) &&;

    class Awaiter {
    public:
        explicit Awaiter(std::coroutine_handle<promise_type> handle) : handle_(handle) {}

        bool await_ready() const noexcept { return !handle_ || handle_.done(); }

        std::coroutine_handle<> await_suspend(std::coroutine_handle<> continuation) noexcept {
            handle_.promise().set_continuation(continuation);
            return handle_;
        }

        T await_resume() {
            if (!handle_) {
                throw std::logic_error("awaiting an empty task");
            }
            return handle_.promise().take_result();
        }

    private:
        std::coroutine_handle<promise_type> handle_;
    };

    Awaiter operator co_await() && { return Awaiter(handle_); }

private:
    friend class detail::Promise<T>;
    friend class Instrumented<T>;

    explicit Task(std::coroutine_handle<promise_type> handle) : handle_(handle) {}

    std::coroutine_handle<promise_type> handle_;
};

namespace detail {

template<typename T>
Task<T> Promise<T>::get_return_object() {
    return Task<T>(std::coroutine_handle<Promise<T>>::from_promise(*this));
}

inline Task<void> Promise<void>::get_return_object() {
    return Task<void>(std::coroutine_handle<Promise<void>>::from_promise(*this));
}

} // namespace detail

// ============================================================================
// Instrumented
// ============================================================================

/**
 * @brief A task paired with the span it must run inside
 *
 * The span is entered every time the task resumes and exited every time it
 * suspends, so work the task does is attributed to the span no matter
 * which thread polls it. Creating the pair runs nothing.
 */
template<typename T>
class [[nodiscard]] Instrumented {
public:
    Instrumented(Task<T> task, tracing::Span span)
        : task_(std::move(task)), span_(std::move(span)) {}

    [[nodiscard]] const tracing::Span& span() const { return span_; }

    /// The task with the span bound as its context
    Task<T> into_task() && {
        if (!task_.handle_ || task_.handle_.promise().started()) {
            throw std::logic_error("cannot instrument an empty or started task");
        }
        task_.handle_.promise().bind_span(std::move(span_));
        return std::move(task_);
    }

    class Awaiter {
    public:
        explicit Awaiter(Task<T> task)
            : task_(std::move(task)), inner_(std::move(task_).operator co_await()) {}

        bool await_ready() const noexcept { return inner_.await_ready(); }
        std::coroutine_handle<> await_suspend(std::coroutine_handle<> continuation) noexcept {
            return inner_.await_suspend(continuation);
        }
        T await_resume() { return inner_.await_resume(); }

    private:
        Task<T> task_;
        typename Task<T>::Awaiter inner_;
    };

    Awaiter operator co_await() && { return Awaiter(std::move(*this).into_task()); }

private:
    Task<T> task_;
    tracing::Span span_;
};

template<typename T>
Instrumented<T> Task<T>::instrument(tracing::Span span) && {
    return Instrumented<T>(std::move(*this), std::move(span));
}

// ============================================================================
// block_on
// ============================================================================

/**
 * @brief Start a task and wait on this thread until it completes
 *
 * Used at the synchronous edge (the HTTP worker thread, tests). The task
 * may hop to other threads in between.
 */
template<typename T>
T block_on(Task<T> task) {
    std::mutex mutex;
    std::condition_variable cv;
    bool finished = false;

    task.start([&] {
        std::lock_guard lock(mutex);
        finished = true;
        cv.notify_one();
    });

    {
        std::unique_lock lock(mutex);
        cv.wait(lock, [&] { return finished; });
    }
    return std::move(task).result();
}

} // namespace reqtrace

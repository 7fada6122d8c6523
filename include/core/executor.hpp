#pragma once

#include <condition_variable>
#include <coroutine>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <stop_token>
#include <thread>
#include <vector>

namespace reqtrace {

/**
 * @brief Abstract interface for something that runs posted work
 *
 * Tasks hop onto an executor with `co_await schedule_on(executor)`.
 */
class IExecutor {
public:
    virtual ~IExecutor() = default;

    /// Queue a job. Thread-safe.
    virtual void post(std::function<void()> job) = 0;
};

/**
 * @brief Fixed-size pool of worker threads draining a FIFO queue
 *
 * Destruction stops accepting work, runs what is already queued and
 * joins the workers.
 */
class ThreadPool : public IExecutor {
public:
    explicit ThreadPool(size_t threads);
    ~ThreadPool() override;

    // Non-copyable, non-movable (owns threads)
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    void post(std::function<void()> job) override;

    [[nodiscard]] size_t size() const { return workers_.size(); }

private:
    void worker_loop(std::stop_token stop);

    std::mutex mutex_;
    std::condition_variable_any cv_;
    std::deque<std::function<void()>> queue_;
    std::vector<std::jthread> workers_;
};

/**
 * @brief Executor that only runs work when told to
 *
 * Gives tests full control over when, and on which thread, a task
 * resumes.
 */
class ManualExecutor : public IExecutor {
public:
    void post(std::function<void()> job) override;

    /// Run the oldest queued job; false if there was none
    bool run_one();

    /// Run jobs (including ones they post) until the queue is empty
    size_t run_until_idle();

    [[nodiscard]] size_t pending() const;

    /// Drop queued jobs without running them
    void clear();

private:
    mutable std::mutex mutex_;
    std::deque<std::function<void()>> queue_;
};

namespace detail {

struct ScheduleState {
    std::mutex mutex;
    std::coroutine_handle<> handle;
    bool cancelled = false;
};

} // namespace detail

/**
 * @brief Awaiter that resumes the awaiting task on an executor
 *
 * If the awaiting task is destroyed before the job runs, the job does
 * nothing.
 */
class ScheduleAwaiter {
public:
    explicit ScheduleAwaiter(IExecutor& executor) : executor_(&executor) {}
    ~ScheduleAwaiter();

    ScheduleAwaiter(ScheduleAwaiter&& other) noexcept = default;
    ScheduleAwaiter& operator=(ScheduleAwaiter&&) = delete;
    ScheduleAwaiter(const ScheduleAwaiter&) = delete;
    ScheduleAwaiter& operator=(const ScheduleAwaiter&) = delete;

    bool await_ready() const noexcept { return false; }
    void await_suspend(std::coroutine_handle<> handle);
    void await_resume() const noexcept {}

private:
    IExecutor* executor_;
    std::shared_ptr<detail::ScheduleState> state_;
};

[[nodiscard]] inline ScheduleAwaiter schedule_on(IExecutor& executor) {
    return ScheduleAwaiter(executor);
}

/**
 * @brief One-shot event tasks can wait on
 *
 * set() resumes every waiting task on the calling thread; waiting on an
 * event that is already set does not suspend.
 */
class AsyncEvent {
public:
    AsyncEvent() = default;

    AsyncEvent(const AsyncEvent&) = delete;
    AsyncEvent& operator=(const AsyncEvent&) = delete;

    void set();
    [[nodiscard]] bool is_set() const;

    class Waiter {
    public:
        explicit Waiter(AsyncEvent& event) : event_(&event) {}
        ~Waiter();

        Waiter(Waiter&& other) noexcept;
        Waiter& operator=(Waiter&&) = delete;
        Waiter(const Waiter&) = delete;
        Waiter& operator=(const Waiter&) = delete;

        bool await_ready() const { return event_->is_set(); }
        bool await_suspend(std::coroutine_handle<> handle);
        void await_resume() const noexcept {}

    private:
        friend class AsyncEvent;

        AsyncEvent* event_;
        std::coroutine_handle<> handle_;
        bool registered_ = false;
    };

    [[nodiscard]] Waiter wait() { return Waiter(*this); }

private:
    mutable std::mutex mutex_;
    bool set_ = false;
    std::vector<Waiter*> waiters_;
};

} // namespace reqtrace

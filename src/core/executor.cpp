#include "core/executor.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <exception>
#include <format>
#include <utility>

namespace reqtrace {

namespace {

void run_job(const std::function<void()>& job) {
    try {
        job();
    } catch (const std::exception& e) {
        utils::log::error(std::format("Executor job failed: {}", e.what()));
    }
}

} // anonymous namespace

// ============================================================================
// ThreadPool
// ============================================================================

ThreadPool::ThreadPool(size_t threads) {
    const size_t count = std::max<size_t>(threads, 1);
    workers_.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        workers_.emplace_back([this](std::stop_token stop) { worker_loop(stop); });
    }
}

ThreadPool::~ThreadPool() {
    for (auto& worker : workers_) {
        worker.request_stop();
    }
    cv_.notify_all();
    workers_.clear();   // joins
}

void ThreadPool::post(std::function<void()> job) {
    {
        std::lock_guard lock(mutex_);
        queue_.push_back(std::move(job));
    }
    cv_.notify_one();
}

void ThreadPool::worker_loop(std::stop_token stop) {
    while (true) {
        std::function<void()> job;
        {
            std::unique_lock lock(mutex_);
            cv_.wait(lock, stop, [this] { return !queue_.empty(); });
            if (queue_.empty()) {
                return;   // stop requested and nothing left to drain
            }
            job = std::move(queue_.front());
            queue_.pop_front();
        }
        run_job(job);
    }
}

// ============================================================================
// ManualExecutor
// ============================================================================

void ManualExecutor::post(std::function<void()> job) {
    std::lock_guard lock(mutex_);
    queue_.push_back(std::move(job));
}

bool ManualExecutor::run_one() {
    std::function<void()> job;
    {
        std::lock_guard lock(mutex_);
        if (queue_.empty()) return false;
        job = std::move(queue_.front());
        queue_.pop_front();
    }
    run_job(job);
    return true;
}

size_t ManualExecutor::run_until_idle() {
    size_t count = 0;
    while (run_one()) {
        ++count;
    }
    return count;
}

size_t ManualExecutor::pending() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
}

void ManualExecutor::clear() {
    std::deque<std::function<void()>> dropped;
    {
        std::lock_guard lock(mutex_);
        dropped.swap(queue_);
    }
}

// ============================================================================
// ScheduleAwaiter
// ============================================================================

ScheduleAwaiter::~ScheduleAwaiter() {
    if (state_) {
        std::lock_guard lock(state_->mutex);
        state_->cancelled = true;
        state_->handle = {};
    }
}

void ScheduleAwaiter::await_suspend(std::coroutine_handle<> handle) {
    state_ = std::make_shared<detail::ScheduleState>();
    state_->handle = handle;
    executor_->post([state = state_] {
        std::coroutine_handle<> resume;
        {
            std::lock_guard lock(state->mutex);
            if (state->cancelled) return;
            resume = std::exchange(state->handle, {});
        }
        if (resume) {
            resume.resume();
        }
    });
}

// ============================================================================
// AsyncEvent
// ============================================================================

void AsyncEvent::set() {
    std::vector<std::coroutine_handle<>> ready;
    {
        std::lock_guard lock(mutex_);
        if (set_) return;
        set_ = true;
        ready.reserve(waiters_.size());
        for (Waiter* waiter : waiters_) {
            waiter->registered_ = false;
            ready.push_back(waiter->handle_);
        }
        waiters_.clear();
    }
    for (const auto handle : ready) {
        handle.resume();
    }
}

bool AsyncEvent::is_set() const {
    std::lock_guard lock(mutex_);
    return set_;
}

AsyncEvent::Waiter::Waiter(Waiter&& other) noexcept
    : event_(other.event_), handle_(other.handle_), registered_(false) {}

AsyncEvent::Waiter::~Waiter() {
    std::lock_guard lock(event_->mutex_);
    if (registered_) {
        std::erase(event_->waiters_, this);
    }
}

bool AsyncEvent::Waiter::await_suspend(std::coroutine_handle<> handle) {
    std::lock_guard lock(event_->mutex_);
    if (event_->set_) {
        return false;
    }
    handle_ = handle;
    registered_ = true;
    event_->waiters_.push_back(this);
    return true;
}

} // namespace reqtrace

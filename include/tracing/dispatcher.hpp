#pragma once

#include "tracing/metadata.hpp"
#include "tracing/span.hpp"
#include "tracing/subscriber.hpp"

#include <memory>
#include <string_view>

namespace reqtrace::tracing {

/**
 * @brief Install the process-wide subscriber
 *
 * Done once by the application before any request is processed.
 * @return false if a global subscriber was already installed (the new one
 *         is not used)
 */
[[nodiscard]] bool set_global_default(std::shared_ptr<ISubscriber> subscriber);

/// Flush the process-wide subscriber, if any (shutdown path)
void flush_global_default();

/**
 * @brief Subscriber spans and events go to from this thread right now
 *
 * The innermost DefaultGuard of this thread, else the global default,
 * else null (everything is disabled).
 */
[[nodiscard]] std::shared_ptr<ISubscriber> current_dispatch();

/**
 * @brief Thread-scoped subscriber override
 *
 * Only affects the installing thread; work resumed on other threads uses
 * their own dispatch. Spans keep the subscriber they were created with.
 */
class DefaultGuard {
public:
    explicit DefaultGuard(std::shared_ptr<ISubscriber> subscriber);
    ~DefaultGuard();

    DefaultGuard(const DefaultGuard&) = delete;
    DefaultGuard& operator=(const DefaultGuard&) = delete;

private:
    std::shared_ptr<ISubscriber> previous_;
};

/// Whether an event at this level/target would be recorded
[[nodiscard]] bool enabled(Level level, std::string_view target);

/**
 * @brief Emit an event attributed to the current span
 * @param message Stored as the "message" field; empty for field-only events
 */
void event(Level level, std::string_view target, std::string_view message, FieldSet fields = {});

} // namespace reqtrace::tracing

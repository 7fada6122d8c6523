#pragma once

#include "core/utils.hpp"

#include <string>
#include <string_view>

namespace reqtrace::tracing {

/**
 * @brief Abstract interface for formatted diagnostic output destinations
 *
 * Each sink receives fully formatted lines (text or JSON, no trailing
 * newline) from the FmtSubscriber. The subscriber serializes calls, so
 * implementations need no internal locking.
 */
class IEventSink {
public:
    virtual ~IEventSink() = default;

    /// Write a single formatted line. Returns true on success.
    [[nodiscard]] virtual bool write(std::string_view line) = 0;

    /// Flush any buffered data to the underlying storage.
    virtual void flush() = 0;

    /// Graceful shutdown (drain buffers, close handles).
    virtual void shutdown() = 0;

    /// Human-readable sink name for logging (e.g. "file:/var/log/reqtrace.log")
    [[nodiscard]] virtual std::string name() const = 0;
};

/**
 * @brief Writes lines to stderr, sharing the process log lock
 */
class StderrSink : public IEventSink {
public:
    [[nodiscard]] bool write(std::string_view line) override {
        utils::log::detail::write_line(line);
        return true;
    }
    void flush() override {}
    void shutdown() override {}
    [[nodiscard]] std::string name() const override { return "stderr"; }
};

} // namespace reqtrace::tracing

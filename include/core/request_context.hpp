#pragma once

#include "core/error.hpp"
#include "core/http_types.hpp"
#include "core/utils.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

namespace reqtrace {

/**
 * @brief Request context - ambient per-request metadata
 *
 * Owned by the transport for the lifetime of one request. Handlers and
 * instrumentation only read it, through RequestScope::current().
 */
struct RequestContext {
    std::string request_id;

    http::Method method = http::Method::GET;
    std::string path = "/";
    http::Version version = http::Version::HTTP_11;
    std::optional<http::SocketAddr> remote_addr;
    http::HeaderMap headers;
    std::string body;

    // Timestamps
    std::chrono::system_clock::time_point received_at;
    std::chrono::steady_clock::time_point started_at;

    RequestContext()
        : request_id(utils::generate_uuid()),
          received_at(std::chrono::system_clock::now()),
          started_at(std::chrono::steady_clock::now()) {}
};

/**
 * @brief Installs a request as the current one for the running thread
 *
 * Scopes nest; the destructor restores whatever was current before.
 * Coroutines re-install their captured request around every resumption
 * (see core/task.hpp), so the current request follows a task across
 * worker threads.
 */
class RequestScope {
public:
    explicit RequestScope(const RequestContext& ctx) noexcept;
    /// nullptr clears the current request for the scope's duration
    explicit RequestScope(const RequestContext* ctx) noexcept;
    ~RequestScope();

    RequestScope(const RequestScope&) = delete;
    RequestScope& operator=(const RequestScope&) = delete;

    /// Current request of this thread, or nullptr
    [[nodiscard]] static const RequestContext* current() noexcept;

private:
    const RequestContext* previous_;
};

/**
 * @brief Run fn against the current request
 * @throws MissingRequestContext if no request is current
 */
template<typename Fn>
decltype(auto) with_request(Fn&& fn) {
    const RequestContext* ctx = RequestScope::current();
    if (!ctx) {
        throw MissingRequestContext();
    }
    return std::forward<Fn>(fn)(*ctx);
}

} // namespace reqtrace

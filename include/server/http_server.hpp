#pragma once

#include "core/error.hpp"
#include "core/filter.hpp"
#include "core/http_types.hpp"
#include "core/rejection.hpp"
#include "core/reply.hpp"
#include "core/request_context.hpp"
#include "core/task.hpp"

#include <concepts>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// Forward-declare httplib types (avoids pulling in massive header-only library)
namespace httplib {
struct Request;
struct Response;
class Server;
}

namespace reqtrace {

using HttpResult = Result<Response, Rejection>;

/// Type-erased route: runs against the current request
using RouteHandler = std::function<Task<HttpResult>()>;

namespace detail {

template<Filter F>
    requires Reply<typename F::Extract> && std::convertible_to<typename F::Error, Rejection>
Task<HttpResult> run_route(F filter) {
    auto result = co_await filter.filter();
    if (result.is_ok()) {
        co_return HttpResult::ok(std::move(result).value().into_response());
    }
    co_return HttpResult::error(Rejection(std::move(result).error()));
}

} // namespace detail

/**
 * @brief Erase a filter into a RouteHandler
 *
 * The filter is copied into every invocation's frame, so the handler can
 * be called concurrently.
 */
template<Filter F>
    requires Reply<typename F::Extract> && std::convertible_to<typename F::Error, Rejection>
[[nodiscard]] RouteHandler make_route(F filter) {
    return [filter = std::move(filter)]() { return detail::run_route(filter); };
}

/**
 * @brief HTTP front end driving filters on cpp-httplib
 *
 * Each request is converted into a RequestContext, installed with
 * RequestScope on the connection thread, and the route's task is driven
 * with block_on. Replies are written as-is; rejections become their status
 * with the cause as a text body. Routes match in registration order; the
 * fallback route (if any) matches everything else.
 */
class HttpServer {
public:
    HttpServer(std::string host, uint16_t port, size_t thread_pool_size);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    void route(http::Method method, std::string pattern, RouteHandler handler);

    /// Handles every request no route matched
    void fallback(RouteHandler handler);

    /// Listen until stop() (blocking)
    void start();
    void stop();

    /**
     * @brief Run a handler against a request and produce the HTTP response
     *
     * Infrastructure failures (exceptions) become 500.
     */
    [[nodiscard]] static Response execute(const RouteHandler& handler, const RequestContext& ctx);

    /// Response written for a rejection
    [[nodiscard]] static Response render_rejection(const Rejection& rejection);

private:
    struct Route {
        http::Method method;
        std::string pattern;
        RouteHandler handler;
    };

    void handle(const RouteHandler& handler, const httplib::Request& req, httplib::Response& res) const;

    const std::string host_;
    const uint16_t port_;
    const size_t thread_pool_size_;

    std::vector<Route> routes_;
    std::optional<RouteHandler> fallback_;

    std::mutex server_mutex_;
    std::unique_ptr<httplib::Server> server_;
};

} // namespace reqtrace

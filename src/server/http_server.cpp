#include "server/http_server.hpp"
#include "core/utils.hpp"

#include <httplib.h>

#include <format>
#include <stdexcept>

namespace reqtrace {

namespace {

RequestContext to_request_context(const httplib::Request& req) {
    RequestContext ctx;
    ctx.method = http::parse_method(req.method).value_or(http::Method::GET);
    ctx.path = req.path;
    ctx.version = http::parse_version(req.version).value_or(http::Version::HTTP_11);
    if (!req.remote_addr.empty()) {
        ctx.remote_addr = http::SocketAddr{req.remote_addr, static_cast<uint16_t>(req.remote_port)};
    }
    for (const auto& [name, value] : req.headers) {
        ctx.headers.insert(name, value);
    }
    ctx.body = req.body;
    return ctx;
}

void write_response(const Response& response, httplib::Response& res) {
    res.status = response.status;
    std::string content_type = http::kTextContentType;
    for (const auto& [name, value] : response.headers) {
        if (utils::to_lower(name) == "content-type") {
            content_type = value;
        } else {
            res.set_header(name, value);
        }
    }
    res.set_content(response.body, content_type);
}

} // anonymous namespace

HttpServer::HttpServer(std::string host, const uint16_t port, const size_t thread_pool_size)
    : host_(std::move(host)),
      port_(port),
      thread_pool_size_(thread_pool_size) {}

HttpServer::~HttpServer() = default;

void HttpServer::route(const http::Method method, std::string pattern, RouteHandler handler) {
    routes_.push_back(Route{method, std::move(pattern), std::move(handler)});
}

void HttpServer::fallback(RouteHandler handler) {
    fallback_ = std::move(handler);
}

// ============================================================================
// Request execution
// ============================================================================

Response HttpServer::render_rejection(const Rejection& rejection) {
    Response res;
    res.status = rejection.status();
    res.headers.set(std::string(http::kContentTypeHeader), http::kTextContentType);
    res.body = rejection.cause().empty()
        ? std::string(http::reason_phrase(rejection.status()))
        : rejection.cause();
    return res;
}

Response HttpServer::execute(const RouteHandler& handler, const RequestContext& ctx) {
    const RequestScope scope(ctx);
    try {
        auto result = block_on(handler());
        if (result.is_ok()) {
            return std::move(result).value();
        }
        return render_rejection(result.error());
    } catch (const std::exception& e) {
        utils::log::error(std::format("Request {} {} failed: {}",
            http::to_string(ctx.method), ctx.path, e.what()));
        return render_rejection(Rejection(http::status::kInternalServerError,
                                          std::string(http::reason_phrase(http::status::kInternalServerError))));
    }
}

void HttpServer::handle(const RouteHandler& handler, const httplib::Request& req,
                        httplib::Response& res) const {
    if (!http::parse_method(req.method)) {
        write_response(render_rejection(reject::method_not_allowed()), res);
        return;
    }
    const RequestContext ctx = to_request_context(req);
    write_response(execute(handler, ctx), res);
}

// ============================================================================
// start(): creates server, registers routes, listens
// ============================================================================

void HttpServer::start() {
    httplib::Server* svr = nullptr;
    {
        std::lock_guard lock(server_mutex_);
        server_ = std::make_unique<httplib::Server>();
        svr = server_.get();
    }

    const size_t pool_size = thread_pool_size_;
    svr->new_task_queue = [pool_size] {
        return new httplib::ThreadPool(pool_size);
    };

    auto register_route = [this, svr](const http::Method method, const std::string& pattern,
                                      const RouteHandler& handler) {
        auto fn = [this, &handler](const httplib::Request& req, httplib::Response& res) {
            handle(handler, req, res);
        };
        switch (method) {
            case http::Method::GET:     svr->Get(pattern, fn); break;
            case http::Method::POST:    svr->Post(pattern, fn); break;
            case http::Method::PUT:     svr->Put(pattern, fn); break;
            case http::Method::DELETE:  svr->Delete(pattern, fn); break;
            case http::Method::PATCH:   svr->Patch(pattern, fn); break;
            case http::Method::OPTIONS: svr->Options(pattern, fn); break;
            default:
                throw std::invalid_argument(std::format("Cannot route {} requests",
                                                        http::to_string(method)));
        }
    };

    for (const auto& route : routes_) {
        register_route(route.method, route.pattern, route.handler);
    }
    if (fallback_) {
        for (const auto method : {http::Method::GET, http::Method::POST, http::Method::PUT,
                                  http::Method::DELETE, http::Method::PATCH, http::Method::OPTIONS}) {
            register_route(method, ".*", *fallback_);
        }
    }

    utils::log::info(std::format("Starting reqtrace server on {}:{} ({} threads)",
        host_, port_, thread_pool_size_));

    if (!svr->listen(host_, port_)) {
        throw std::runtime_error(std::format("Failed to listen on {}:{}", host_, port_));
    }
}

void HttpServer::stop() {
    std::lock_guard lock(server_mutex_);
    if (server_) {
        server_->stop();
    }
    utils::log::info("Server stopped");
}

} // namespace reqtrace

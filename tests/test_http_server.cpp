#include <catch2/catch_test_macros.hpp>
#include "core/filter.hpp"
#include "core/reply.hpp"
#include "filters/trace.hpp"
#include "mocks/capture_subscriber.hpp"
#include "server/http_server.hpp"

#include <stdexcept>
#include <string>

using namespace reqtrace;
using reqtrace::testing::CaptureSubscriber;

namespace {

Task<HttpResult> greet() {
    const std::string path = with_request([](const RequestContext& ctx) { return ctx.path; });
    co_return HttpResult::ok(reply::with_header(reply::text("hi " + path), "X-Greeting", "yes")
                                 .into_response());
}

Task<HttpResult> refuse() {
    co_return HttpResult::error(reject::bad_request("missing name"));
}

Task<HttpResult> explode() {
    throw std::runtime_error("database on fire");
    co_return HttpResult::ok(reply::text("unreachable"));
}

RequestContext make_request(std::string path) {
    RequestContext ctx;
    ctx.path = std::move(path);
    return ctx;
}

} // anonymous namespace

TEST_CASE("HttpServer: reply is written as produced", "[server]") {
    const auto handler = make_route(make_filter([] { return greet(); }));
    const auto res = HttpServer::execute(handler, make_request("/alice"));

    CHECK(res.status == 200);
    CHECK(res.body == "hi /alice");
    REQUIRE(res.headers.get("x-greeting") != nullptr);
    CHECK(*res.headers.get("x-greeting") == "yes");
}

TEST_CASE("HttpServer: rejection becomes status and cause", "[server]") {
    const auto handler = make_route(make_filter([] { return refuse(); }));
    const auto res = HttpServer::execute(handler, make_request("/"));

    CHECK(res.status == 400);
    CHECK(res.body == "missing name");
    CHECK(res.headers.get_str("Content-Type") == std::string_view(http::kTextContentType));
}

TEST_CASE("HttpServer: exceptions become 500", "[server]") {
    const auto handler = make_route(make_filter([] { return explode(); }));
    const auto res = HttpServer::execute(handler, make_request("/"));

    CHECK(res.status == 500);
    CHECK(res.body == "Internal Server Error");
}

TEST_CASE("HttpServer: rejection without cause uses the reason phrase", "[server]") {
    const auto res = HttpServer::render_rejection(Rejection(http::status::kNotFound, ""));
    CHECK(res.status == 404);
    CHECK(res.body == "Not Found");
}

TEST_CASE("HttpServer: traced route installs the request for the span", "[server][trace]") {
    auto& capture = CaptureSubscriber::install();
    const auto handler = make_route(
        with(with(make_filter([] { return greet(); }), trace::context("greet")), trace::request()));

    auto ctx = make_request("/bob");
    ctx.method = http::Method::POST;
    const auto res = HttpServer::execute(handler, ctx);

    CHECK(res.status == 200);
    CHECK(res.body == "hi /bob");

    const auto requests = capture.spans_named("request");
    REQUIRE(requests.size() == 1);
    CHECK(requests[0].field("method") == "POST");
    CHECK(requests[0].field("path") == "\"/bob\"");
    CHECK(requests[0].field("response.status") == "200");
    CHECK(requests[0].closed);
    CHECK(RequestScope::current() == nullptr);
}

TEST_CASE("HttpServer: traced rejection still renders", "[server][trace]") {
    auto& capture = CaptureSubscriber::install();
    const auto handler = make_route(with(make_filter([] { return refuse(); }), trace::request()));

    const auto res = HttpServer::execute(handler, make_request("/"));
    CHECK(res.status == 400);
    CHECK(res.body == "missing name");

    const auto outcome = capture.events_with_field("response.error");
    REQUIRE(outcome.size() == 1);
    CHECK(outcome[0].field("response.status") == "400");
}

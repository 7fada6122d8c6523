#include <catch2/catch_test_macros.hpp>
#include "core/error.hpp"
#include "core/request_context.hpp"
#include "filters/trace.hpp"

using namespace reqtrace;

namespace {

RequestContext make_request() {
    RequestContext ctx;
    ctx.method = http::Method::POST;
    ctx.path = "/api/items";
    ctx.version = http::Version::HTTP_2;
    ctx.remote_addr = http::SocketAddr{"10.0.0.7", 51234};
    ctx.headers.insert("Referer", "https://example.com/start");
    ctx.headers.insert("user-agent", "reqtrace-test/1.0");
    ctx.headers.insert("Host", "api.example.com");
    return ctx;
}

} // anonymous namespace

TEST_CASE("RequestView: exposes request metadata", "[request_view]") {
    const RequestContext ctx = make_request();
    const trace::RequestView view(ctx);

    CHECK(view.method() == http::Method::POST);
    CHECK(view.path() == "/api/items");
    CHECK(view.version() == http::Version::HTTP_2);
    REQUIRE(view.remote_addr().has_value());
    CHECK(view.remote_addr()->to_string() == "10.0.0.7:51234");
    CHECK(view.referer() == "https://example.com/start");
    CHECK(view.user_agent() == "reqtrace-test/1.0");
    CHECK(view.host() == "api.example.com");
    CHECK(view.headers().size() == 3);
}

TEST_CASE("RequestView: absent or binary headers yield no value", "[request_view]") {
    RequestContext ctx;
    ctx.headers.insert("User-Agent", std::string("bot\x01", 4));
    const trace::RequestView view(ctx);

    CHECK_FALSE(view.referer().has_value());
    CHECK_FALSE(view.user_agent().has_value());
    CHECK_FALSE(view.host().has_value());
    CHECK_FALSE(view.remote_addr().has_value());
    CHECK(view.path() == "/");
}

TEST_CASE("RequestScope: nests and restores", "[request_context]") {
    CHECK(RequestScope::current() == nullptr);

    RequestContext outer;
    RequestContext inner;
    {
        const RequestScope outer_scope(outer);
        CHECK(RequestScope::current() == &outer);
        {
            const RequestScope inner_scope(inner);
            CHECK(RequestScope::current() == &inner);
            {
                const RequestScope cleared(nullptr);
                CHECK(RequestScope::current() == nullptr);
            }
            CHECK(RequestScope::current() == &inner);
        }
        CHECK(RequestScope::current() == &outer);
    }
    CHECK(RequestScope::current() == nullptr);
}

TEST_CASE("RequestScope: with_request needs a current request", "[request_context]") {
    CHECK_THROWS_AS(with_request([](const RequestContext&) { return 1; }), MissingRequestContext);

    RequestContext ctx;
    ctx.path = "/here";
    const RequestScope scope(ctx);
    CHECK(with_request([](const RequestContext& c) { return c.path; }) == "/here");
}

TEST_CASE("RequestContext: every request gets its own id", "[request_context]") {
    const RequestContext a;
    const RequestContext b;
    CHECK(a.request_id.size() == 36);
    CHECK(a.request_id != b.request_id);
}

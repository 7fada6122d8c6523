#include <catch2/catch_test_macros.hpp>
#include "core/http_types.hpp"
#include "core/rejection.hpp"
#include "core/reply.hpp"

using namespace reqtrace;

// ============================================================================
// Methods and versions
// ============================================================================

TEST_CASE("HttpTypes: method tokens round through parse", "[http]") {
    CHECK(http::to_string(http::Method::GET) == "GET");
    CHECK(http::to_string(http::Method::PATCH) == "PATCH");
    CHECK(http::parse_method("DELETE") == http::Method::DELETE);
    CHECK_FALSE(http::parse_method("get").has_value());
    CHECK_FALSE(http::parse_method("BREW").has_value());
}

TEST_CASE("HttpTypes: versions render as protocol tokens", "[http]") {
    CHECK(http::to_string(http::Version::HTTP_11) == "HTTP/1.1");
    CHECK(http::to_string(http::Version::HTTP_2) == "HTTP/2.0");
    CHECK(http::parse_version("HTTP/2") == http::Version::HTTP_2);
    CHECK(http::parse_version("HTTP/1.0") == http::Version::HTTP_10);
    CHECK_FALSE(http::parse_version("SPDY/3").has_value());
}

TEST_CASE("HttpTypes: reason phrases", "[http]") {
    CHECK(http::reason_phrase(404) == "Not Found");
    CHECK(http::reason_phrase(500) == "Internal Server Error");
    CHECK(http::reason_phrase(799).empty());
}

// ============================================================================
// HeaderMap
// ============================================================================

TEST_CASE("HeaderMap: lookups ignore case", "[http][headers]") {
    http::HeaderMap headers;
    headers.insert("User-Agent", "curl/8.0");

    REQUIRE(headers.get("user-agent") != nullptr);
    CHECK(*headers.get("USER-AGENT") == "curl/8.0");
    CHECK(headers.contains("User-agent"));
    CHECK_FALSE(headers.contains("Referer"));
}

TEST_CASE("HeaderMap: get returns the first of repeated values", "[http][headers]") {
    http::HeaderMap headers;
    headers.insert("Accept", "text/html");
    headers.insert("accept", "application/json");

    CHECK(headers.count("ACCEPT") == 2);
    CHECK(*headers.get("Accept") == "text/html");

    headers.set("Accept", "*/*");
    CHECK(headers.count("accept") == 1);
    CHECK(*headers.get("accept") == "*/*");
}

TEST_CASE("HeaderMap: get_str rejects values that are not text", "[http][headers]") {
    http::HeaderMap headers;
    headers.insert("Referer", "https://example.com/\xff\xfe");
    headers.insert("Host", "example.com");

    CHECK(headers.get("Referer") != nullptr);
    CHECK_FALSE(headers.get_str("Referer").has_value());
    CHECK(headers.get_str("host") == "example.com");
    CHECK_FALSE(headers.get_str("X-Missing").has_value());
}

TEST_CASE("SocketAddr: renders ip and port", "[http]") {
    CHECK(http::SocketAddr{"127.0.0.1", 3030}.to_string() == "127.0.0.1:3030");
    CHECK(http::SocketAddr{"::1", 443}.to_string() == "[::1]:443");
}

// ============================================================================
// Replies and rejections
// ============================================================================

TEST_CASE("Reply: text and status helpers", "[reply]") {
    const Response text = reply::text("ok");
    CHECK(text.status == 200);
    CHECK(text.body == "ok");
    CHECK(text.headers.get_str("content-type") == http::kTextContentType);

    Response created = reply::with_status(reply::text("made"), 201).into_response();
    CHECK(created.status == 201);
    CHECK(created.body == "made");

    Response tagged = reply::with_header(reply::status(204), "X-Trace", "1").into_response();
    CHECK(tagged.status == 204);
    CHECK(tagged.headers.get_str("x-trace") == "1");
}

TEST_CASE("Reply: json serializes the value", "[reply]") {
    const Response res = reply::json({{"status", "ok"}});
    CHECK(res.body == R"({"status":"ok"})");
    CHECK(res.headers.get_str("Content-Type") == http::kJsonContentType);
}

TEST_CASE("Rejection: debug rendering carries status and cause", "[rejection]") {
    CHECK(reject::not_found().debug_string() == R"(Rejection { status: 404, cause: "not found" })");
    CHECK(reject::bad_request(R"(bad "id")").debug_string() ==
          R"(Rejection { status: 400, cause: "bad \"id\"" })");
    CHECK(reject::custom(418, "teapot") == Rejection(418, "teapot"));
    CHECK(reject::method_not_allowed().status() == 405);
}

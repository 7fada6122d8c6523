#include <catch2/catch_test_macros.hpp>
#include "mocks/capture_subscriber.hpp"
#include "tracing/dispatcher.hpp"
#include "tracing/ids.hpp"
#include "tracing/span.hpp"

using namespace reqtrace;
using namespace reqtrace::tracing;
using reqtrace::testing::CaptureSubscriber;

// ============================================================================
// Identifiers
// ============================================================================

TEST_CASE("Span ids: shape and validation", "[tracing][ids]") {
    const auto span_id = generate_span_id();
    const auto trace_id = generate_trace_id();
    CHECK(span_id.size() == 16);
    CHECK(trace_id.size() == 32);
    CHECK(is_valid_id(span_id, 16));
    CHECK(is_valid_id(trace_id, 32));
    CHECK_FALSE(is_valid_id("0000000000000000", 16));
    CHECK_FALSE(is_valid_id("xyz", 3));
    CHECK(generate_span_id() != generate_span_id());
}

// ============================================================================
// Fields
// ============================================================================

TEST_CASE("FieldValue: renders by kind", "[tracing][fields]") {
    CHECK(FieldValue(true).render() == "true");
    CHECK(FieldValue(-3).render() == "-3");
    CHECK(FieldValue(uint16_t{404}).render() == "404");
    CHECK(FieldValue("plain").render() == "plain");
    CHECK(quoted("/hello").repr == "\"/hello\"");
    CHECK(FieldValue(quoted("a\"b")).render() == R"("a\"b")");
    CHECK(quoted("tab\there").repr == R"("tab\there")");
    CHECK(quoted("\x1b[31mred").repr == R"("\u{1b}[31mred")");
    CHECK(quoted(std::string_view("nul\0", 4)).repr == R"("nul\u{0}")");
    CHECK(quoted("del\x7f").repr == R"("del\u{7f}")");
    CHECK(quoted("/\xFF").repr == R"("/\xff")");
    CHECK(quoted("caf\xC3\xA9").repr == "\"caf\xC3\xA9\"");
    CHECK(quoted("cut\xE2\x82").repr == R"("cut\xe2\x82")");
    CHECK(quoted("\xC0\xAF").repr == R"("\xc0\xaf")");
    CHECK(FieldValue(uint16_t{200}) == FieldValue(200u));
}

TEST_CASE("Level: ordering and parsing", "[tracing][level]") {
    CHECK(Level::TRACE < Level::DEBUG);
    CHECK(Level::DEBUG < Level::INFO);
    CHECK(Level::WARN < Level::ERROR);
    CHECK(parse_level("Warning") == Level::WARN);
    CHECK(parse_level(" debug ") == Level::DEBUG);
    CHECK_FALSE(parse_level("verbose").has_value());
    CHECK(to_string(Level::INFO) == "INFO");
}

// ============================================================================
// Span lifecycle
// ============================================================================

TEST_CASE("Span: parent is the span current at creation", "[tracing][span]") {
    auto& capture = CaptureSubscriber::install();

    const Span outer = Span::create(Level::INFO, "test", "outer");
    REQUIRE_FALSE(outer.is_none());
    CHECK(Span::current().is_none());

    Span inner;
    {
        const auto guard = outer.enter();
        CHECK(Span::current() == outer);
        inner = Span::create(Level::DEBUG, "test", "inner", {{"k", 1}});
    }
    CHECK(Span::current().is_none());

    CHECK(inner.parent() == outer);
    const auto captured = capture.span(std::string(inner.id()));
    REQUIRE(captured.has_value());
    CHECK(captured->parent_id == outer.id());
    CHECK(captured->trace_id == capture.span(std::string(outer.id()))->trace_id);
    CHECK(captured->field("k") == "1");
}

TEST_CASE("Span: closes when the last handle goes away", "[tracing][span]") {
    auto& capture = CaptureSubscriber::install();

    std::string id;
    {
        const Span span = Span::create(Level::INFO, "test", "short");
        id = std::string(span.id());
        const Span copy = span;
        CHECK_FALSE(capture.span(id)->closed);
    }
    CHECK(capture.span(id)->closed);
}

TEST_CASE("Span: a child keeps its parent open", "[tracing][span]") {
    auto& capture = CaptureSubscriber::install();

    std::string parent_id;
    Span child;
    {
        const Span parent = Span::create(Level::INFO, "test", "parent");
        parent_id = std::string(parent.id());
        child = parent.in_scope([] { return Span::create(Level::INFO, "test", "child"); });
    }
    CHECK_FALSE(capture.span(parent_id)->closed);
    child = Span::none();
    CHECK(capture.span(parent_id)->closed);
}

TEST_CASE("Span: enter and exit are reported and nest", "[tracing][span]") {
    auto& capture = CaptureSubscriber::install();

    const Span a = Span::create(Level::INFO, "test", "a");
    const Span b = Span::create(Level::INFO, "test", "b");
    {
        const auto ga = a.enter();
        {
            const auto gb = b.enter();
            CHECK(Span::current() == b);
        }
        CHECK(Span::current() == a);
    }
    CHECK(Span::current().is_none());

    const auto captured = capture.span(std::string(a.id()));
    CHECK(captured->enters == 1);
    CHECK(captured->exits == 1);
}

TEST_CASE("Span: record adds and overwrites fields", "[tracing][span]") {
    CaptureSubscriber::install();

    const Span span = Span::create(Level::INFO, "test", "fields", {{"a", 1}});
    span.record("b", "two");
    span.record("a", 3);

    const auto fields = span.data()->fields();
    REQUIRE(fields.size() == 2);
    CHECK(find_field(fields, "a")->render() == "3");
    CHECK(find_field(fields, "b")->render() == "two");
}

TEST_CASE("Span: disabled spans are none and harmless", "[tracing][span]") {
    auto& capture = CaptureSubscriber::install();
    capture.set_min_level(Level::INFO);

    const Span span = Span::create(Level::DEBUG, "test", "hidden");
    CHECK(span.is_none());
    CHECK(span.id().empty());
    span.record("x", 1);
    span.in_scope([] { CHECK(Span::current().is_none()); });
    CHECK(capture.spans().empty());
}

// ============================================================================
// Events and dispatch
// ============================================================================

TEST_CASE("Event: attributed to the current span", "[tracing][event]") {
    auto& capture = CaptureSubscriber::install();

    event(Level::INFO, "test", "outside");
    const Span span = Span::create(Level::INFO, "test", "holder");
    span.in_scope([] { event(Level::WARN, "test", "inside", {{"n", 7}}); });

    const auto events = capture.events();
    REQUIRE(events.size() == 2);
    CHECK(events[0].span_id.empty());
    CHECK(events[1].span_id == span.id());
    CHECK(events[1].message == "inside");
    CHECK(events[1].field("n") == "7");
    CHECK(events[1].level == Level::WARN);
}

TEST_CASE("Event: filtered by the subscriber", "[tracing][event]") {
    auto& capture = CaptureSubscriber::install();
    capture.set_min_level(Level::DEBUG);

    CHECK_FALSE(enabled(Level::TRACE, "test"));
    CHECK(enabled(Level::DEBUG, "test"));
    event(Level::TRACE, "test", "dropped");
    event(Level::ERROR, "test", "kept");

    const auto events = capture.events();
    REQUIRE(events.size() == 1);
    CHECK(events[0].message == "kept");
}

TEST_CASE("DefaultGuard: overrides dispatch on this thread only", "[tracing][dispatch]") {
    auto& global = CaptureSubscriber::install();
    auto scoped = std::make_shared<CaptureSubscriber>();

    {
        const DefaultGuard guard(scoped);
        CHECK(current_dispatch() == scoped);
        event(Level::INFO, "test", "scoped");
    }
    event(Level::INFO, "test", "global");

    CHECK(scoped->events_with_message("scoped").size() == 1);
    CHECK(scoped->events_with_message("global").empty());
    CHECK(global.events_with_message("global").size() == 1);
    CHECK(global.events_with_message("scoped").empty());
}

TEST_CASE("Dispatch: global default is installed only once", "[tracing][dispatch]") {
    CaptureSubscriber::install();
    CHECK_FALSE(set_global_default(std::make_shared<CaptureSubscriber>()));
}

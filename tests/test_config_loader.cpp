#include <catch2/catch_test_macros.hpp>
#include "config/config_loader.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

using namespace reqtrace;

namespace {

// RAII temporary directory
struct TmpDir {
    std::filesystem::path path;
    TmpDir() : path(std::filesystem::temp_directory_path() / "reqtrace_test_config") {
        std::filesystem::create_directories(path);
    }
    ~TmpDir() { std::filesystem::remove_all(path); }
    std::string file(const std::string& name, const std::string& content) {
        auto p = path / name;
        std::ofstream f(p);
        f << content;
        return p.string();
    }
};

bool mentions(const ConfigLoader::LoadResult& result, std::string_view needle) {
    return result.error_message.find(needle) != std::string::npos;
}

} // namespace

// ============================================================================
// Parsing
// ============================================================================

TEST_CASE("Config: empty document yields defaults", "[config]") {
    auto result = ConfigLoader::load_from_string("");
    REQUIRE(result.success);
    const auto& cfg = result.config;
    CHECK(cfg.server.host == "127.0.0.1");
    CHECK(cfg.server.port == 3030);
    CHECK(cfg.logging.level == "info");
    CHECK(cfg.tracing.filter == "reqtrace_server=info,reqtrace=debug");
    CHECK(cfg.tracing.format == "text");
    CHECK_FALSE(cfg.tracing.with_target);
    CHECK(cfg.tracing.span_events == "none");
    CHECK(cfg.tracing.output == "stderr");
}

TEST_CASE("Config: every section is read", "[config]") {
    const std::string toml = R"(
[server]
host = "0.0.0.0"
port = 8080
http_threads = 16
worker_threads = 2

[logging]
level = "debug"

[tracing]
filter = "warn,reqtrace=trace"
format = "json"
with_target = true
span_events = "close"
output = "file"

[tracing.file]
path = "/var/log/reqtrace.log"
max_file_size_bytes = 1024
max_files = 3
time_based_rotation = true
rotation_interval_hours = 6
)";
    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);
    const auto& cfg = result.config;
    CHECK(cfg.server.host == "0.0.0.0");
    CHECK(cfg.server.port == 8080);
    CHECK(cfg.server.http_threads == 16);
    CHECK(cfg.server.worker_threads == 2);
    CHECK(cfg.logging.level == "debug");
    CHECK(cfg.tracing.filter == "warn,reqtrace=trace");
    CHECK(cfg.tracing.format == "json");
    CHECK(cfg.tracing.with_target);
    CHECK(cfg.tracing.span_events == "close");
    CHECK(cfg.tracing.output == "file");
    CHECK(cfg.tracing.file.path == "/var/log/reqtrace.log");
    CHECK(cfg.tracing.file.max_file_size_bytes == 1024);
    CHECK(cfg.tracing.file.max_files == 3);
    CHECK(cfg.tracing.file.time_based_rotation);
    CHECK(cfg.tracing.file.rotation_interval == std::chrono::hours(6));
}

TEST_CASE("Config: environment variables are expanded", "[config]") {
    ::setenv("REQTRACE_TEST_LOG_PATH", "/tmp/from_env.log", 1);
    const std::string toml = R"(
[tracing]
output = "file"

[tracing.file]
path = "${REQTRACE_TEST_LOG_PATH}"
)";
    auto result = ConfigLoader::load_from_string(toml);
    ::unsetenv("REQTRACE_TEST_LOG_PATH");

    REQUIRE(result.success);
    CHECK(result.config.tracing.file.path == "/tmp/from_env.log");
}

TEST_CASE("Config: unclosed substitution is an error", "[config]") {
    auto result = ConfigLoader::load_from_string(R"(
[server]
host = "${UNCLOSED"
)");
    CHECK_FALSE(result.success);
    CHECK(mentions(result, "Unclosed"));
}

TEST_CASE("Config: malformed TOML is reported, not thrown", "[config]") {
    auto result = ConfigLoader::load_from_string("[server\nport = ");
    CHECK_FALSE(result.success);
    CHECK(mentions(result, "Failed to parse config"));
}

TEST_CASE("Config: missing file is reported", "[config]") {
    auto result = ConfigLoader::load_from_file("/nonexistent/reqtrace.toml");
    CHECK_FALSE(result.success);
    CHECK(mentions(result, "Failed to load config"));
}

// ============================================================================
// Includes
// ============================================================================

TEST_CASE("Config: included file is the base, including file wins", "[config][include]") {
    TmpDir tmp;
    tmp.file("tracing.toml", R"(
[tracing]
filter = "info"
format = "json"
)");
    const auto main_path = tmp.file("main.toml", R"(
include = "tracing.toml"

[tracing]
filter = "debug"
)");

    auto result = ConfigLoader::load_from_file(main_path);
    REQUIRE(result.success);
    CHECK(result.config.tracing.filter == "debug");
    CHECK(result.config.tracing.format == "json");
}

TEST_CASE("Config: two includes may share a common file", "[config][include]") {
    TmpDir tmp;
    tmp.file("common.toml", R"(
[server]
port = 9100

[tracing]
format = "json"
)");
    tmp.file("server.toml", "include = \"common.toml\"\n\n[server]\nworker_threads = 3\n");
    tmp.file("tracing.toml", "include = \"common.toml\"\n\n[tracing]\nfilter = \"debug\"\n");
    const auto main_path = tmp.file("main.toml", R"(include = ["server.toml", "tracing.toml"])");

    auto result = ConfigLoader::load_from_file(main_path);
    REQUIRE(result.success);
    CHECK(result.config.server.port == 9100);
    CHECK(result.config.server.worker_threads == 3);
    CHECK(result.config.tracing.filter == "debug");
    CHECK(result.config.tracing.format == "json");
}

TEST_CASE("Config: circular include is rejected", "[config][include]") {
    TmpDir tmp;
    tmp.file("a.toml", "include = \"b.toml\"\n");
    const auto b = tmp.file("b.toml", "include = \"a.toml\"\n");

    auto result = ConfigLoader::load_from_file(b);
    CHECK_FALSE(result.success);
    CHECK(mentions(result, "Circular"));
}

// ============================================================================
// Validation
// ============================================================================

TEST_CASE("Config: port out of range fails", "[config][validation]") {
    auto result = ConfigLoader::load_from_string("[server]\nport = 70000\n");
    CHECK_FALSE(result.success);
    CHECK(mentions(result, "server.port"));
}

TEST_CASE("Config: zero threads fails", "[config][validation]") {
    auto result = ConfigLoader::load_from_string("[server]\nworker_threads = 0\n");
    CHECK_FALSE(result.success);
    CHECK(mentions(result, "server.worker_threads"));
}

TEST_CASE("Config: invalid filter directive fails", "[config][validation]") {
    auto result = ConfigLoader::load_from_string("[tracing]\nfilter = \"reqtrace=loud\"\n");
    CHECK_FALSE(result.success);
    CHECK(mentions(result, "tracing.filter"));
}

TEST_CASE("Config: unknown format and span events fail", "[config][validation]") {
    auto result = ConfigLoader::load_from_string(R"(
[tracing]
format = "xml"
span_events = "sometimes"
)");
    CHECK_FALSE(result.success);
    CHECK(mentions(result, "tracing.format"));
    CHECK(mentions(result, "tracing.span_events"));
}

TEST_CASE("Config: unknown log level fails", "[config][validation]") {
    auto result = ConfigLoader::load_from_string("[logging]\nlevel = \"chatty\"\n");
    CHECK_FALSE(result.success);
    CHECK(mentions(result, "logging.level"));
}

TEST_CASE("Config: file output needs a path", "[config][validation]") {
    AppConfig cfg;
    cfg.tracing.output = "file";
    cfg.tracing.file.path = "";
    const auto errors = ConfigLoader::validate_config(cfg);
    REQUIRE(errors.size() == 1);
    CHECK(errors[0].find("tracing.file.path") != std::string::npos);

    cfg.tracing.output = "syslog";
    cfg.tracing.file.path = "x.log";
    const auto more = ConfigLoader::validate_config(cfg);
    REQUIRE(more.size() == 1);
    CHECK(more[0].find("tracing.output") != std::string::npos);
}

TEST_CASE("Config: shipped example config is valid", "[config]") {
    const auto path = std::filesystem::path(__FILE__).parent_path().parent_path() / "config" / "reqtrace.toml";
    if (!std::filesystem::exists(path)) {
        SKIP("example config not found next to the sources");
    }
    auto result = ConfigLoader::load_from_file(path.string());
    REQUIRE(result.success);
    CHECK(result.config.server.port == 3030);
}

#include "config/config_loader.hpp"
#include "core/executor.hpp"
#include "core/filter.hpp"
#include "core/reply.hpp"
#include "core/utils.hpp"
#include "filters/trace.hpp"
#include "server/http_server.hpp"
#include "tracing/dispatcher.hpp"
#include "tracing/env_filter.hpp"
#include "tracing/file_sink.hpp"
#include "tracing/fmt_subscriber.hpp"

#include <csignal>
#include <filesystem>
#include <format>
#include <memory>
#include <stdexcept>

using namespace reqtrace;

namespace {

constexpr std::string_view kAppTarget = "reqtrace_server";

// Global instances for signal handling
std::shared_ptr<HttpServer> g_server;

void signal_handler(int signal) {
    utils::log::info(std::format("Received signal {}, shutting down...", signal));
    if (g_server) {
        g_server->stop();
    }
}

std::shared_ptr<tracing::FmtSubscriber> build_subscriber(const TracingConfig& cfg) {
    auto filter = tracing::EnvFilter::from_env_or(cfg.filter);
    if (filter.is_error()) {
        throw std::runtime_error(std::format("Invalid trace filter: {}", filter.error()));
    }

    tracing::FmtSubscriber::Config sub_cfg;
    sub_cfg.filter = std::move(filter).value();
    sub_cfg.format = tracing::parse_output_format(cfg.format).value_or(tracing::OutputFormat::TEXT);
    sub_cfg.with_target = cfg.with_target;
    sub_cfg.span_events = tracing::parse_span_events(cfg.span_events).value_or(tracing::SpanEvents::NONE);

    std::unique_ptr<tracing::IEventSink> sink;
    if (cfg.output == "file") {
        tracing::FileSink::Config file_cfg;
        file_cfg.output_file = cfg.file.path;
        file_cfg.max_file_size_bytes = cfg.file.max_file_size_bytes;
        file_cfg.max_files = cfg.file.max_files;
        file_cfg.time_based_rotation = cfg.file.time_based_rotation;
        file_cfg.rotation_interval = cfg.file.rotation_interval;
        sink = std::make_unique<tracing::FileSink>(file_cfg);
    } else {
        sink = std::make_unique<tracing::StderrSink>();
    }

    utils::log::info(std::format("Tracing: filter '{}', {} output to {}",
        sub_cfg.filter.to_string(), cfg.format, sink->name()));
    return std::make_shared<tracing::FmtSubscriber>(std::move(sub_cfg), std::move(sink));
}

/// Logs from the worker pool, then replies with a fixed body
Task<HttpResult> say(IExecutor& pool, std::string message, std::string body) {
    co_await schedule_on(pool);
    tracing::event(tracing::Level::INFO, kAppTarget, message);
    co_return HttpResult::ok(reply::text(std::move(body)));
}

auto greeting(IExecutor& pool, std::string message, std::string body) {
    return make_filter([&pool, message = std::move(message), body = std::move(body)]() {
        return say(pool, message, body);
    });
}

Task<HttpResult> not_found() {
    co_return HttpResult::error(reject::not_found());
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        utils::log::info("reqtrace server starting...");

        std::string config_file = "config/reqtrace.toml";
        if (argc > 1) {
            config_file = argv[1];
        }

        AppConfig config;
        if (std::filesystem::exists(config_file)) {
            utils::log::info(std::format("Loading configuration from {}", config_file));
            auto config_result = ConfigLoader::load_from_file(config_file);
            if (!config_result.success) {
                utils::log::error(config_result.error_message);
                return 1;
            }
            config = std::move(config_result.config);
        } else {
            utils::log::warn(std::format("Config file {} not found, using defaults", config_file));
        }

        utils::log::set_level(utils::log::parse_level(config.logging.level).value_or(utils::log::Level::INFO));

        // Diagnostic dispatcher: installed once, before any request is handled
        if (!tracing::set_global_default(build_subscriber(config.tracing))) {
            throw std::runtime_error("A global trace subscriber is already installed");
        }

        ThreadPool pool(config.server.worker_threads);

        const auto hello = with(
            greeting(pool, "saying hello...", "Hello, World!"),
            trace::context("hello"));
        const auto goodbye = with(
            greeting(pool, "saying goodbye...", "So long and thanks for all the fish!"),
            trace::context("goodbye"));

        g_server = std::make_shared<HttpServer>(
            config.server.host, config.server.port, config.server.http_threads);
        g_server->route(http::Method::GET, "/hello", make_route(with(hello, trace::request())));
        g_server->route(http::Method::GET, "/goodbye", make_route(with(goodbye, trace::request())));
        g_server->fallback(make_route(with(make_filter(&not_found), trace::request())));

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        utils::log::info(std::format("Server ready on http://{}:{}", config.server.host, config.server.port));

        // Start HTTP server (blocking)
        g_server->start();

        tracing::flush_global_default();
        g_server.reset();

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        tracing::flush_global_default();
        return 1;
    }

    return 0;
}

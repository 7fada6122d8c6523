#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace reqtrace {

// ============================================================================
// Configuration Types
// ============================================================================

struct ServerConfig {
    std::string host = "127.0.0.1";
    uint16_t port = 3030;
    size_t http_threads = 8;      // cpp-httplib connection workers
    size_t worker_threads = 4;    // pool handlers hop onto
};

struct LoggingConfig {
    std::string level = "info";   // utils::log threshold
};

struct TraceFileConfig {
    std::string path = "reqtrace.log";
    size_t max_file_size_bytes = 50ULL * 1024 * 1024;
    int max_files = 5;
    bool time_based_rotation = false;
    std::chrono::hours rotation_interval{24};
};

struct TracingConfig {
    std::string filter = "reqtrace_server=info,reqtrace=debug";
    std::string format = "text";          // text | json
    bool with_target = false;
    std::string span_events = "none";     // none | new | close | full
    std::string output = "stderr";        // stderr | file
    TraceFileConfig file;
};

// ============================================================================
// AppConfig - Complete parsed configuration
// ============================================================================

struct AppConfig {
    ServerConfig server;
    LoggingConfig logging;
    TracingConfig tracing;
};

} // namespace reqtrace

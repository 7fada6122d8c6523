#include "config/config_loader.hpp"
#include "core/utils.hpp"
#include "tracing/env_filter.hpp"
#include "tracing/fmt_subscriber.hpp"

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <stdexcept>
#include <unordered_set>
#include <vector>

namespace reqtrace {

// ============================================================================
// TOML Parsing Helpers (env expansion, includes, merging)
// ============================================================================

namespace {

/**
 * @brief Substitute ${NAME} with the environment value (empty if unset)
 */
std::string expand_env_vars(std::string_view input) {
    std::string out;
    out.reserve(input.size());
    size_t pos = 0;
    while (pos < input.size()) {
        const size_t open = input.find("${", pos);
        if (open == std::string_view::npos) {
            out.append(input.substr(pos));
            break;
        }
        out.append(input.substr(pos, open - pos));
        const size_t close = input.find('}', open + 2);
        if (close == std::string_view::npos) {
            throw std::runtime_error(
                std::format("Unclosed env var substitution at position {}", open));
        }
        const std::string name(input.substr(open + 2, close - open - 2));
        if (const char* value = std::getenv(name.c_str())) {
            out += value;
        }
        pos = close + 1;
    }
    return out;
}

/// Expand every string value below node, at any depth
void expand_env_vars_in(toml::node& node) {
    if (auto* str = node.as_string()) {
        if (str->get().find("${") != std::string::npos) {
            *str = expand_env_vars(str->get());
        }
    } else if (auto* tbl = node.as_table()) {
        for (auto&& [key, child] : *tbl) {
            expand_env_vars_in(child);
        }
    } else if (auto* arr = node.as_array()) {
        for (auto& child : *arr) {
            expand_env_vars_in(child);
        }
    }
}

/**
 * @brief Overlay wins for scalars; tables merge recursively, arrays append
 */
void merge_tables(toml::table& base, const toml::table& overlay) {
    for (auto&& [key, val] : overlay) {
        toml::node* existing = base.get(key.str());
        if (existing && existing->is_table() && val.is_table()) {
            merge_tables(*existing->as_table(), *val.as_table());
        } else if (existing && existing->is_array() && val.is_array()) {
            for (const auto& elem : *val.as_array()) {
                existing->as_array()->push_back(elem);
            }
        } else {
            base.insert_or_assign(key, val);
        }
    }
}

constexpr int kMaxIncludeDepth = 10;

/// `include = "a.toml"` or `include = ["a.toml", "b.toml"]`
std::vector<std::string> include_paths(const toml::table& root) {
    std::vector<std::string> paths;
    const auto node = root["include"];
    if (const auto* single = node.as_string()) {
        paths.push_back(single->get());
    } else if (const auto* list = node.as_array()) {
        for (const auto& item : *list) {
            if (const auto* path = item.as_string()) {
                paths.push_back(path->get());
            }
        }
    }
    return paths;
}

/**
 * @brief Replace root by the merge of its includes with root on top
 *
 * Include paths are relative to the including file. `chain` holds the
 * files currently being resolved; a file may appear in several branches
 * but never twice in one chain.
 */
void resolve_includes(toml::table& root, const std::filesystem::path& base_dir,
                      std::unordered_set<std::string>& chain, const int depth) {
    namespace fs = std::filesystem;

    const auto paths = include_paths(root);
    root.erase("include");
    if (paths.empty()) return;

    if (depth >= kMaxIncludeDepth) {
        throw std::runtime_error(std::format(
            "Config include depth exceeds {}, possible circular include", kMaxIncludeDepth));
    }

    for (const auto& rel_path : paths) {
        const fs::path abs_path = fs::canonical(base_dir / rel_path);
        if (!chain.insert(abs_path.string()).second) {
            throw std::runtime_error(
                std::format("Circular config include detected: {}", abs_path.string()));
        }

        auto included = toml::parse_file(abs_path.string());
        resolve_includes(included, abs_path.parent_path(), chain, depth + 1);
        chain.erase(abs_path.string());

        // The including file wins
        merge_tables(included, root);
        root = std::move(included);
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_in(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    namespace fs = std::filesystem;
    auto result = toml::parse_file(file_path);

    const fs::path path = fs::canonical(file_path);
    std::unordered_set<std::string> chain{path.string()};
    resolve_includes(result, path.parent_path(), chain, 0);

    expand_env_vars_in(result);
    return result;
}

// ---- Extraction helpers ----------------------------------------------------

template<typename T>
T checked_integer(const toml::table& tbl, const std::string_view key, const T fallback,
                  const int64_t min, const int64_t max, const std::string_view section) {
    const auto value = tbl[key].value<int64_t>();
    if (!value) return fallback;
    if (*value < min || *value > max) {
        throw std::runtime_error(
            std::format("{}.{} must be {}-{}, got {}", section, key, min, max, *value));
    }
    return static_cast<T>(*value);
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

// ---- Section extractors ----------------------------------------------------

ServerConfig ConfigLoader::extract_server(const toml::table& root) {
    ServerConfig cfg;
    const auto* server = root["server"].as_table();
    if (!server) return cfg;
    const auto& s = *server;

    cfg.host = s["host"].value_or(cfg.host);
    cfg.port = checked_integer<uint16_t>(s, "port", cfg.port, 1, 65535, "server");
    cfg.http_threads = checked_integer<size_t>(s, "http_threads", cfg.http_threads, 1, 1024, "server");
    cfg.worker_threads = checked_integer<size_t>(s, "worker_threads", cfg.worker_threads, 1, 1024, "server");
    return cfg;
}

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = (*logging)["level"].value_or(cfg.level);
    return cfg;
}

TracingConfig ConfigLoader::extract_tracing(const toml::table& root) {
    TracingConfig cfg;
    const auto* tracing = root["tracing"].as_table();
    if (!tracing) return cfg;
    const auto& t = *tracing;

    cfg.filter = t["filter"].value_or(cfg.filter);
    cfg.format = t["format"].value_or(cfg.format);
    cfg.with_target = t["with_target"].value_or(cfg.with_target);
    cfg.span_events = t["span_events"].value_or(cfg.span_events);
    cfg.output = t["output"].value_or(cfg.output);

    if (const auto* file = t["file"].as_table()) {
        const auto& f = *file;
        cfg.file.path = f["path"].value_or(cfg.file.path);
        cfg.file.max_file_size_bytes = checked_integer<size_t>(
            f, "max_file_size_bytes", cfg.file.max_file_size_bytes, 1, INT64_MAX, "tracing.file");
        cfg.file.max_files = checked_integer<int>(f, "max_files", cfg.file.max_files, 1, 1000, "tracing.file");
        cfg.file.time_based_rotation = f["time_based_rotation"].value_or(cfg.file.time_based_rotation);
        cfg.file.rotation_interval = std::chrono::hours(checked_integer<int>(
            f, "rotation_interval_hours", static_cast<int>(cfg.file.rotation_interval.count()),
            1, 24 * 365, "tracing.file"));
    }
    return cfg;
}

AppConfig ConfigLoader::extract_all_sections(const toml::table& root) {
    AppConfig config;
    config.server = extract_server(root);
    config.logging = extract_logging(root);
    config.tracing = extract_tracing(root);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(AppConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const AppConfig& config) {
    std::vector<std::string> errors;

    if (config.server.host.empty()) {
        errors.push_back("server.host must not be empty");
    }
    if (config.server.port == 0) {
        errors.push_back("server.port must be 1-65535, got 0");
    }

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format("logging.level '{}' is not a known level", config.logging.level));
    }

    const auto filter = tracing::EnvFilter::parse(config.tracing.filter);
    if (filter.is_error()) {
        errors.push_back(std::format("tracing.filter: {}", filter.error()));
    }
    if (!tracing::parse_output_format(config.tracing.format)) {
        errors.push_back(std::format("tracing.format must be text or json, got '{}'", config.tracing.format));
    }
    if (!tracing::parse_span_events(config.tracing.span_events)) {
        errors.push_back(std::format("tracing.span_events must be none, new, close or full, got '{}'",
                                     config.tracing.span_events));
    }
    if (config.tracing.output != "stderr" && config.tracing.output != "file") {
        errors.push_back(std::format("tracing.output must be stderr or file, got '{}'", config.tracing.output));
    }
    if (config.tracing.output == "file" && config.tracing.file.path.empty()) {
        errors.push_back("tracing.file.path required when tracing.output is file");
    }

    return errors;
}

} // namespace reqtrace

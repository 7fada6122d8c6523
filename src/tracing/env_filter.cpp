#include "tracing/env_filter.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <format>
#include <utility>

namespace reqtrace::tracing {

namespace {

bool target_matches(std::string_view directive, std::string_view target) {
    if (directive.empty()) return true;
    if (!target.starts_with(directive)) return false;
    if (target.size() == directive.size()) return true;
    return target.substr(directive.size()).starts_with("::");
}

bool valid_target(std::string_view target) {
    return std::all_of(target.begin(), target.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == ':' || c == '-';
    });
}

std::optional<std::optional<Level>> parse_directive_level(std::string_view text) {
    if (utils::to_lower(utils::trim(text)) == "off") {
        return std::optional<std::optional<Level>>(std::in_place);
    }
    if (const auto level = parse_level(text)) {
        return std::optional<std::optional<Level>>(std::in_place, *level);
    }
    return std::nullopt;
}

} // anonymous namespace

EnvFilter::EnvFilter() {
    directives_.push_back(Directive{"", Level::ERROR});
}

Result<EnvFilter, std::string> EnvFilter::parse(std::string_view spec) {
    EnvFilter filter;
    filter.directives_.clear();

    for (const auto raw : utils::split(spec, ',')) {
        const auto part = utils::trim(raw);
        if (part.empty()) continue;

        Directive directive;
        const auto eq = part.find('=');
        const auto level_text = eq == std::string_view::npos ? part : part.substr(eq + 1);
        if (eq != std::string_view::npos) {
            const auto target = utils::trim(part.substr(0, eq));
            if (target.empty() || !valid_target(target)) {
                return Result<EnvFilter, std::string>::error(
                    std::format("invalid target in directive '{}'", part));
            }
            directive.target = std::string(target);
        }

        const auto level = parse_directive_level(level_text);
        if (!level) {
            return Result<EnvFilter, std::string>::error(
                std::format("invalid level in directive '{}'", part));
        }
        directive.level = *level;

        // Later directives for the same target win
        std::erase_if(filter.directives_, [&](const Directive& d) {
            return d.target == directive.target;
        });
        filter.directives_.push_back(std::move(directive));
    }

    const bool has_default = std::any_of(filter.directives_.begin(), filter.directives_.end(),
        [](const Directive& d) { return d.target.empty(); });
    if (!has_default) {
        filter.directives_.push_back(Directive{"", Level::ERROR});
    }

    std::stable_sort(filter.directives_.begin(), filter.directives_.end(),
        [](const Directive& a, const Directive& b) { return a.target.size() > b.target.size(); });

    return Result<EnvFilter, std::string>::ok(std::move(filter));
}

Result<EnvFilter, std::string> EnvFilter::from_env_or(std::string_view fallback) {
    if (const char* env = std::getenv(std::string(kEnvVar).c_str())) {
        auto parsed = parse(env);
        if (parsed.is_ok()) {
            return parsed;
        }
        utils::log::warn(std::format("Ignoring {}: {}", kEnvVar, parsed.error()));
    }
    return parse(fallback);
}

bool EnvFilter::enabled(const Level level, std::string_view target) const {
    for (const auto& directive : directives_) {
        if (target_matches(directive.target, target)) {
            return directive.level && level >= *directive.level;
        }
    }
    return false;
}

std::optional<Level> EnvFilter::max_verbosity() const {
    std::optional<Level> result;
    for (const auto& directive : directives_) {
        if (directive.level && (!result || *directive.level < *result)) {
            result = directive.level;
        }
    }
    return result;
}

std::string EnvFilter::to_string() const {
    std::string out;
    // Most general first, the way directives are usually written
    for (auto it = directives_.rbegin(); it != directives_.rend(); ++it) {
        if (!out.empty()) out += ',';
        const std::string level = it->level ? utils::to_lower(tracing::to_string(*it->level)) : "off";
        if (it->target.empty()) {
            out += level;
        } else {
            out += std::format("{}={}", it->target, level);
        }
    }
    return out;
}

} // namespace reqtrace::tracing

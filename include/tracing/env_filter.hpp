#pragma once

#include "core/error.hpp"
#include "tracing/metadata.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace reqtrace::tracing {

/**
 * @brief Target/level filter built from "target=level,..." directives
 *
 * A directive without '=' sets the default level. The most specific
 * directive whose target is a prefix of the callsite target (on a "::"
 * boundary) decides. "off" disables a target entirely. Without a default
 * directive only ERROR passes.
 *
 * Example: "tracing=info,reqtrace=debug,reqtrace::filters=trace"
 */
class EnvFilter {
public:
    /// Name of the environment variable that overrides configured directives
    static constexpr std::string_view kEnvVar = "REQTRACE_LOG";

    struct Directive {
        std::string target;             // empty for the default directive
        std::optional<Level> level;     // nullopt means off
    };

    EnvFilter();

    [[nodiscard]] static Result<EnvFilter, std::string> parse(std::string_view spec);

    /**
     * @brief REQTRACE_LOG if set and valid, else the fallback directives
     *
     * An invalid REQTRACE_LOG is reported on stderr and ignored.
     */
    [[nodiscard]] static Result<EnvFilter, std::string> from_env_or(std::string_view fallback);

    [[nodiscard]] bool enabled(Level level, std::string_view target) const;

    /// Least severe level any directive lets through, nullopt if all off
    [[nodiscard]] std::optional<Level> max_verbosity() const;

    [[nodiscard]] const std::vector<Directive>& directives() const { return directives_; }

    /// Canonical directive string
    [[nodiscard]] std::string to_string() const;

private:
    // Sorted by target length, longest first
    std::vector<Directive> directives_;
};

} // namespace reqtrace::tracing

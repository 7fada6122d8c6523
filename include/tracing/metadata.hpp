#pragma once

#include <concepts>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace reqtrace::tracing {

/**
 * @brief Diagnostic severity, ordered from most verbose to most severe
 *
 * TRACE < DEBUG < INFO < WARN < ERROR: a lower value is a lower priority.
 */
enum class Level : uint8_t { TRACE, DEBUG, INFO, WARN, ERROR };

[[nodiscard]] std::string_view to_string(Level level);

/// Case-insensitive; accepts "warning" for WARN
[[nodiscard]] std::optional<Level> parse_level(std::string_view name);

enum class Kind : uint8_t { SPAN, EVENT };

/**
 * @brief Static description of a span or event callsite
 */
struct Metadata {
    std::string_view name;
    std::string_view target;
    Level level = Level::INFO;
    Kind kind = Kind::EVENT;
};

/**
 * @brief Value already rendered in debug form (quoted strings, tokens)
 */
struct DebugValue {
    std::string repr;

    bool operator==(const DebugValue&) const = default;
};

/// "/hello" -> "\"/hello\"" with quotes and backslashes escaped
[[nodiscard]] DebugValue quoted(std::string_view text);

/**
 * @brief A single recorded field value
 */
class FieldValue {
public:
    using Storage = std::variant<bool, int64_t, uint64_t, double, std::string, DebugValue>;

    FieldValue(bool v) : value_(v) {}

    template<std::integral T>
        requires (!std::same_as<T, bool>)
    FieldValue(T v) {
        if constexpr (std::is_signed_v<T>) {
            value_ = static_cast<int64_t>(v);
        } else {
            value_ = static_cast<uint64_t>(v);
        }
    }

    FieldValue(double v) : value_(v) {}
    FieldValue(const char* v) : value_(std::string(v)) {}
    FieldValue(std::string v) : value_(std::move(v)) {}
    FieldValue(std::string_view v) : value_(std::string(v)) {}
    FieldValue(DebugValue v) : value_(std::move(v)) {}

    [[nodiscard]] const Storage& storage() const { return value_; }

    /// Display form: strings raw, debug values as rendered, numbers as-is
    [[nodiscard]] std::string render() const;

    bool operator==(const FieldValue&) const = default;

private:
    Storage value_;
};

struct Field {
    std::string name;
    FieldValue value;
};

using FieldSet = std::vector<Field>;

/// Name of the field that carries an event's formatted message
inline constexpr std::string_view kMessageField = "message";

[[nodiscard]] const FieldValue* find_field(const FieldSet& fields, std::string_view name);

} // namespace reqtrace::tracing

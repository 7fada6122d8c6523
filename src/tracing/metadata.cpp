#include "tracing/metadata.hpp"
#include "core/utils.hpp"

#include <format>

namespace reqtrace::tracing {

std::string_view to_string(const Level level) {
    switch (level) {
        case Level::TRACE: return "TRACE";
        case Level::DEBUG: return "DEBUG";
        case Level::INFO:  return "INFO";
        case Level::WARN:  return "WARN";
        case Level::ERROR: return "ERROR";
    }
    return "INFO";
}

std::optional<Level> parse_level(std::string_view name) {
    const std::string lower = utils::to_lower(utils::trim(name));
    if (lower == "trace") return Level::TRACE;
    if (lower == "debug") return Level::DEBUG;
    if (lower == "info")  return Level::INFO;
    if (lower == "warn" || lower == "warning") return Level::WARN;
    if (lower == "error") return Level::ERROR;
    return std::nullopt;
}

namespace {

// Length of the well-formed UTF-8 sequence starting at text[pos], or 0
size_t utf8_sequence_length(std::string_view text, size_t pos) {
    const auto lead = static_cast<unsigned char>(text[pos]);
    size_t len = 0;
    unsigned char lo = 0x80;
    unsigned char hi = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF) {
        len = 2;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        len = 3;
        if (lead == 0xE0) lo = 0xA0;   // overlong
        if (lead == 0xED) hi = 0x9F;   // surrogates
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        len = 4;
        if (lead == 0xF0) lo = 0x90;   // overlong
        if (lead == 0xF4) hi = 0x8F;   // above U+10FFFF
    } else {
        return 0;
    }
    if (pos + len > text.size()) return 0;
    for (size_t i = 1; i < len; ++i) {
        const auto c = static_cast<unsigned char>(text[pos + i]);
        if (c < (i == 1 ? lo : 0x80) || c > (i == 1 ? hi : 0xBF)) return 0;
    }
    return len;
}

} // anonymous namespace

DebugValue quoted(std::string_view text) {
    std::string out;
    out.reserve(text.size() + 2);
    out += '"';
    size_t pos = 0;
    while (pos < text.size()) {
        const char c = text[pos];
        const auto byte = static_cast<unsigned char>(c);
        if (byte >= 0x80) {
            if (const size_t len = utf8_sequence_length(text, pos); len > 0) {
                out.append(text.substr(pos, len));
                pos += len;
            } else {
                out += std::format("\\x{:02x}", byte);
                ++pos;
            }
            continue;
        }
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (byte < 0x20 || byte == 0x7F) {
                    out += std::format("\\u{{{:x}}}", byte);
                } else {
                    out += c;
                }
        }
        ++pos;
    }
    out += '"';
    return DebugValue{std::move(out)};
}

std::string FieldValue::render() const {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, bool>) {
            return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, std::string>) {
            return v;
        } else if constexpr (std::is_same_v<T, DebugValue>) {
            return v.repr;
        } else {
            return std::format("{}", v);
        }
    }, value_);
}

const FieldValue* find_field(const FieldSet& fields, std::string_view name) {
    for (const auto& field : fields) {
        if (field.name == name) return &field.value;
    }
    return nullptr;
}

} // namespace reqtrace::tracing

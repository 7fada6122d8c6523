#pragma once

#include "core/http_constants.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace reqtrace::http {

enum class Method {
    GET,
    HEAD,
    POST,
    PUT,
    DELETE,
    CONNECT,
    OPTIONS,
    TRACE,
    PATCH
};

enum class Version {
    HTTP_09,
    HTTP_10,
    HTTP_11,
    HTTP_2,
    HTTP_3
};

/// Literal method token ("GET")
[[nodiscard]] std::string_view to_string(Method method);

/// Protocol token ("HTTP/1.1")
[[nodiscard]] std::string_view to_string(Version version);

/// Case-sensitive, as on the wire
[[nodiscard]] std::optional<Method> parse_method(std::string_view token);

/// Accepts "HTTP/1.1", "HTTP/2", "HTTP/2.0"
[[nodiscard]] std::optional<Version> parse_version(std::string_view token);

/// Canonical reason phrase, empty for unknown codes
[[nodiscard]] std::string_view reason_phrase(StatusCode code);

/// Header values may carry any octet; text is visible ASCII plus SP/HTAB.
[[nodiscard]] bool is_visible_text(std::string_view value);

struct CaseInsensitiveLess {
    using is_transparent = void;
    bool operator()(std::string_view lhs, std::string_view rhs) const;
};

/**
 * @brief Case-insensitive header multimap holding raw header values
 */
class HeaderMap {
public:
    using Storage = std::multimap<std::string, std::string, CaseInsensitiveLess>;
    using const_iterator = Storage::const_iterator;

    void insert(std::string name, std::string value);
    /// Replaces every existing value of the header
    void set(std::string name, std::string value);

    /// First raw value of the header, if present
    [[nodiscard]] const std::string* get(std::string_view name) const;

    /// First value of the header, only if it is representable as text
    [[nodiscard]] std::optional<std::string_view> get_str(std::string_view name) const;

    [[nodiscard]] bool contains(std::string_view name) const;
    [[nodiscard]] size_t count(std::string_view name) const;
    [[nodiscard]] size_t size() const { return headers_.size(); }
    [[nodiscard]] bool empty() const { return headers_.empty(); }

    const_iterator begin() const { return headers_.begin(); }
    const_iterator end() const { return headers_.end(); }

private:
    Storage headers_;
};

/**
 * @brief Remote peer address
 */
struct SocketAddr {
    std::string ip;
    uint16_t port = 0;

    /// "127.0.0.1:8080" or "[::1]:8080"
    [[nodiscard]] std::string to_string() const;

    bool operator==(const SocketAddr&) const = default;
};

} // namespace reqtrace::http

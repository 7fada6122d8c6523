#pragma once

#include <cstdint>
#include <string_view>

namespace reqtrace::http {

// Well-known header names (lookups are case-insensitive)
inline constexpr std::string_view kRefererHeader = "Referer";
inline constexpr std::string_view kUserAgentHeader = "User-Agent";
inline constexpr std::string_view kHostHeader = "Host";
inline constexpr std::string_view kContentTypeHeader = "Content-Type";

inline constexpr const char* kTextContentType = "text/plain; charset=utf-8";
inline constexpr const char* kJsonContentType = "application/json";

using StatusCode = uint16_t;

namespace status {
inline constexpr StatusCode kOk = 200;
inline constexpr StatusCode kNoContent = 204;
inline constexpr StatusCode kBadRequest = 400;
inline constexpr StatusCode kNotFound = 404;
inline constexpr StatusCode kMethodNotAllowed = 405;
inline constexpr StatusCode kInternalServerError = 500;
inline constexpr StatusCode kServiceUnavailable = 503;
} // namespace status

} // namespace reqtrace::http

#include "core/http_types.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <unordered_map>

namespace reqtrace::http {

std::string_view to_string(const Method method) {
    switch (method) {
        case Method::GET:     return "GET";
        case Method::HEAD:    return "HEAD";
        case Method::POST:    return "POST";
        case Method::PUT:     return "PUT";
        case Method::DELETE:  return "DELETE";
        case Method::CONNECT: return "CONNECT";
        case Method::OPTIONS: return "OPTIONS";
        case Method::TRACE:   return "TRACE";
        case Method::PATCH:   return "PATCH";
    }
    return "GET";
}

std::string_view to_string(const Version version) {
    switch (version) {
        case Version::HTTP_09: return "HTTP/0.9";
        case Version::HTTP_10: return "HTTP/1.0";
        case Version::HTTP_11: return "HTTP/1.1";
        case Version::HTTP_2:  return "HTTP/2.0";
        case Version::HTTP_3:  return "HTTP/3.0";
    }
    return "HTTP/1.1";
}

std::optional<Method> parse_method(std::string_view token) {
    static const std::unordered_map<std::string_view, Method> lookup = {
        {"GET",     Method::GET},
        {"HEAD",    Method::HEAD},
        {"POST",    Method::POST},
        {"PUT",     Method::PUT},
        {"DELETE",  Method::DELETE},
        {"CONNECT", Method::CONNECT},
        {"OPTIONS", Method::OPTIONS},
        {"TRACE",   Method::TRACE},
        {"PATCH",   Method::PATCH},
    };
    const auto it = lookup.find(token);
    if (it == lookup.end()) return std::nullopt;
    return it->second;
}

std::optional<Version> parse_version(std::string_view token) {
    static const std::unordered_map<std::string_view, Version> lookup = {
        {"HTTP/0.9", Version::HTTP_09},
        {"HTTP/1.0", Version::HTTP_10},
        {"HTTP/1.1", Version::HTTP_11},
        {"HTTP/2",   Version::HTTP_2},
        {"HTTP/2.0", Version::HTTP_2},
        {"HTTP/3",   Version::HTTP_3},
        {"HTTP/3.0", Version::HTTP_3},
    };
    const auto it = lookup.find(token);
    if (it == lookup.end()) return std::nullopt;
    return it->second;
}

std::string_view reason_phrase(const StatusCode code) {
    switch (code) {
        case 200: return "OK";
        case 201: return "Created";
        case 202: return "Accepted";
        case 204: return "No Content";
        case 301: return "Moved Permanently";
        case 302: return "Found";
        case 304: return "Not Modified";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 408: return "Request Timeout";
        case 409: return "Conflict";
        case 411: return "Length Required";
        case 413: return "Payload Too Large";
        case 415: return "Unsupported Media Type";
        case 429: return "Too Many Requests";
        case 500: return "Internal Server Error";
        case 501: return "Not Implemented";
        case 502: return "Bad Gateway";
        case 503: return "Service Unavailable";
        case 504: return "Gateway Timeout";
        default:  return {};
    }
}

bool is_visible_text(std::string_view value) {
    return std::all_of(value.begin(), value.end(), [](const char c) {
        const auto b = static_cast<unsigned char>(c);
        return b == '\t' || (b >= 0x20 && b < 0x7F);
    });
}

bool CaseInsensitiveLess::operator()(std::string_view lhs, std::string_view rhs) const {
    return std::lexicographical_compare(
        lhs.begin(), lhs.end(), rhs.begin(), rhs.end(),
        [](const char a, const char b) {
            return std::tolower(static_cast<unsigned char>(a)) <
                   std::tolower(static_cast<unsigned char>(b));
        });
}

// ============================================================================
// HeaderMap
// ============================================================================

void HeaderMap::insert(std::string name, std::string value) {
    headers_.emplace(std::move(name), std::move(value));
}

void HeaderMap::set(std::string name, std::string value) {
    const auto [first, last] = headers_.equal_range(name);
    headers_.erase(first, last);
    headers_.emplace(std::move(name), std::move(value));
}

const std::string* HeaderMap::get(std::string_view name) const {
    const auto it = headers_.find(name);
    if (it == headers_.end()) return nullptr;
    return &it->second;
}

std::optional<std::string_view> HeaderMap::get_str(std::string_view name) const {
    const std::string* value = get(name);
    if (!value || !is_visible_text(*value)) return std::nullopt;
    return std::string_view(*value);
}

bool HeaderMap::contains(std::string_view name) const {
    return headers_.find(name) != headers_.end();
}

size_t HeaderMap::count(std::string_view name) const {
    return headers_.count(name);
}

// ============================================================================
// SocketAddr
// ============================================================================

std::string SocketAddr::to_string() const {
    if (ip.find(':') != std::string::npos) {
        return std::format("[{}]:{}", ip, port);
    }
    return std::format("{}:{}", ip, port);
}

} // namespace reqtrace::http

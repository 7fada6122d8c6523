#include "core/reply.hpp"
#include "core/rejection.hpp"

#include <format>

namespace reqtrace {

namespace reply {

Response text(std::string body) {
    Response res;
    res.headers.set(std::string(http::kContentTypeHeader), http::kTextContentType);
    res.body = std::move(body);
    return res;
}

Response json(const nlohmann::json& value) {
    Response res;
    res.headers.set(std::string(http::kContentTypeHeader), http::kJsonContentType);
    res.body = value.dump();
    return res;
}

Response status(const http::StatusCode code) {
    Response res;
    res.status = code;
    return res;
}

} // namespace reply

// ============================================================================
// Rejection
// ============================================================================

std::string Rejection::debug_string() const {
    std::string escaped;
    escaped.reserve(cause_.size());
    for (const char c : cause_) {
        if (c == '"' || c == '\\') escaped += '\\';
        escaped += c;
    }
    return std::format("Rejection {{ status: {}, cause: \"{}\" }}", status_, escaped);
}

namespace reject {

Rejection not_found() {
    return Rejection(http::status::kNotFound, "not found");
}

Rejection method_not_allowed() {
    return Rejection(http::status::kMethodNotAllowed, "method not allowed");
}

Rejection bad_request(std::string cause) {
    return Rejection(http::status::kBadRequest, std::move(cause));
}

Rejection custom(const http::StatusCode status, std::string cause) {
    return Rejection(status, std::move(cause));
}

} // namespace reject

} // namespace reqtrace

#pragma once

#include "core/http_types.hpp"

#include <nlohmann/json.hpp>

#include <concepts>
#include <string>
#include <utility>

namespace reqtrace {

/**
 * @brief Final wire-level response representation
 */
struct Response {
    http::StatusCode status = http::status::kOk;
    http::HeaderMap headers;
    std::string body;

    Response into_response() && { return std::move(*this); }
};

/**
 * @brief Anything that can be materialized into a Response
 */
template<typename R>
concept Reply = std::movable<R> && requires(R r) {
    { std::move(r).into_response() } -> std::same_as<Response>;
};

namespace reply {

/// 200 with a text/plain body
[[nodiscard]] Response text(std::string body);

/// 200 with a serialized JSON body
[[nodiscard]] Response json(const nlohmann::json& value);

/// Empty body with the given status
[[nodiscard]] Response status(http::StatusCode code);

template<Reply R>
class WithStatus {
public:
    WithStatus(R inner, http::StatusCode code) : inner_(std::move(inner)), status_(code) {}

    Response into_response() && {
        Response res = std::move(inner_).into_response();
        res.status = status_;
        return res;
    }

private:
    R inner_;
    http::StatusCode status_;
};

template<Reply R>
class WithHeader {
public:
    WithHeader(R inner, std::string name, std::string value)
        : inner_(std::move(inner)), name_(std::move(name)), value_(std::move(value)) {}

    Response into_response() && {
        Response res = std::move(inner_).into_response();
        res.headers.set(std::move(name_), std::move(value_));
        return res;
    }

private:
    R inner_;
    std::string name_;
    std::string value_;
};

template<Reply R>
[[nodiscard]] WithStatus<R> with_status(R inner, http::StatusCode code) {
    return WithStatus<R>(std::move(inner), code);
}

template<Reply R>
[[nodiscard]] WithHeader<R> with_header(R inner, std::string name, std::string value) {
    return WithHeader<R>(std::move(inner), std::move(name), std::move(value));
}

} // namespace reply

} // namespace reqtrace

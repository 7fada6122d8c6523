#pragma once

#include "core/http_types.hpp"

#include <concepts>
#include <string>

namespace reqtrace {

/**
 * @brief Expected, status-bearing failure of a handler
 *
 * "This request could not be handled this way". Carried through
 * Result<..., Rejection>; never thrown.
 */
class Rejection {
public:
    Rejection(http::StatusCode status, std::string cause)
        : status_(status), cause_(std::move(cause)) {}

    /// Externally visible status code
    [[nodiscard]] http::StatusCode status() const { return status_; }
    [[nodiscard]] const std::string& cause() const { return cause_; }

    /// Rejection { status: 404, cause: "not found" }
    [[nodiscard]] std::string debug_string() const;

    bool operator==(const Rejection&) const = default;

private:
    http::StatusCode status_;
    std::string cause_;
};

/**
 * @brief Error types a traced handler may produce
 */
template<typename E>
concept IsReject = requires(const E& e) {
    { e.status() } -> std::convertible_to<http::StatusCode>;
    { e.debug_string() } -> std::convertible_to<std::string>;
};

namespace reject {

[[nodiscard]] Rejection not_found();
[[nodiscard]] Rejection method_not_allowed();
[[nodiscard]] Rejection bad_request(std::string cause);
[[nodiscard]] Rejection custom(http::StatusCode status, std::string cause);

} // namespace reject

} // namespace reqtrace

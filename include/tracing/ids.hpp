#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace reqtrace::tracing {

/**
 * @brief Span and trace identifiers
 *
 * Same shape as W3C Trace Context ids so they can be propagated as-is:
 *   trace_id: 32 hex chars (128-bit)
 *   span_id:  16 hex chars (64-bit)
 * Neither is ever all zeros.
 */

/// Generate a random 16-hex-char span ID
[[nodiscard]] std::string generate_span_id();

/// Generate a random 32-hex-char trace ID
[[nodiscard]] std::string generate_trace_id();

/// Lowercase/uppercase hex of the expected length, not all zeros
[[nodiscard]] bool is_valid_id(std::string_view id, size_t expected_length);

} // namespace reqtrace::tracing

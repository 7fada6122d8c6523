#include "tracing/ids.hpp"

#include <algorithm>
#include <cstdint>
#include <format>
#include <random>

namespace reqtrace::tracing {

namespace {

bool is_valid_hex(std::string_view s) {
    for (char c : s) {
        if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F'))) {
            return false;
        }
    }
    return true;
}

bool is_all_zeros(std::string_view s) {
    for (char c : s) {
        if (c != '0') return false;
    }
    return true;
}

std::string random_hex(size_t bytes) {
    static thread_local std::random_device rd;
    static thread_local std::mt19937_64 gen(rd());
    static thread_local std::uniform_int_distribution<uint64_t> dis;

    std::string result;
    result.reserve(bytes * 2);

    size_t remaining = bytes;
    while (remaining > 0) {
        uint64_t val = dis(gen);
        size_t chunk = std::min(remaining, size_t(8));
        for (size_t i = 0; i < chunk; ++i) {
            result += std::format("{:02x}", static_cast<uint8_t>(val >> (i * 8)));
        }
        remaining -= chunk;
    }

    if (is_all_zeros(result)) {
        result.back() = '1';
    }
    return result;
}

} // anonymous namespace

std::string generate_span_id() {
    return random_hex(8); // 8 bytes = 16 hex chars
}

std::string generate_trace_id() {
    return random_hex(16); // 16 bytes = 32 hex chars
}

bool is_valid_id(std::string_view id, size_t expected_length) {
    return id.size() == expected_length && is_valid_hex(id) && !is_all_zeros(id);
}

} // namespace reqtrace::tracing

#include "core/request_context.hpp"

#include <utility>

namespace reqtrace {

namespace {

thread_local const RequestContext* current_request = nullptr;

} // anonymous namespace

RequestScope::RequestScope(const RequestContext& ctx) noexcept
    : RequestScope(&ctx) {}

RequestScope::RequestScope(const RequestContext* ctx) noexcept
    : previous_(std::exchange(current_request, ctx)) {}

RequestScope::~RequestScope() {
    current_request = previous_;
}

const RequestContext* RequestScope::current() noexcept {
    return current_request;
}

} // namespace reqtrace

#include <arbor/server/stream.hpp>

#include <timber/timber>

namespace arbor::server {
    auto to_string(stage value) noexcept -> std::string_view {
        switch (value) {
            case stage::received: return "received";
            case stage::middleware: return "middleware";
            case stage::route_match: return "route match";
            case stage::param_bind: return "param bind";
            case stage::body_parse: return "body parse";
            case stage::handler_exec: return "handler exec";
            case stage::not_found: return "not found";
            case stage::error: return "error";
            case stage::response_sent: return "response sent";
        }

        return "unknown";
    }

    stream::stream() : id(0) {}

    stream::stream(std::uint64_t id) : id(id) {}

    auto stream::advance(stage next) -> void {
        TIMBER_TRACE("Request {}: {} -> {}", id, state, next);
        state = next;
    }

    auto stream::close() noexcept -> void {
        open = false;
    }
}

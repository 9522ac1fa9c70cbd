#pragma once

#include "handler.hpp"

#include <map>

namespace arbor::server {
    /// The handlers registered at one route, keyed by method name.
    class method_router {
        std::map<std::string, handler_ptr, std::less<>> methods;
    public:
        auto allowed() const -> std::string;

        auto empty() const noexcept -> bool;

        auto find(std::string_view method) const -> handler_ptr;

        /// Copies every handler from `other`, replacing existing entries for
        /// the same method.
        auto merge(const method_router& other) -> void;

        auto use(std::string_view method, handler_ptr handler)
            -> method_router&;
    };
}

template <>
struct fmt::formatter<arbor::server::method_router> :
    formatter<std::string_view>
{
    template <typename FormatContext>
    auto format(
        const arbor::server::method_router& router,
        FormatContext& ctx
    ) const {
        return formatter<std::string_view>::format(router.allowed(), ctx);
    }
};

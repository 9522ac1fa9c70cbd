#include <arbor/server/method_router.hpp>

#include <fmt/ranges.h>

namespace arbor::server {
    auto method_router::allowed() const -> std::string {
        auto names = std::vector<std::string_view>();
        names.reserve(methods.size());

        for (const auto& entry : methods) names.push_back(entry.first);

        return fmt::format("{}", fmt::join(names, ", "));
    }

    auto method_router::empty() const noexcept -> bool {
        return methods.empty();
    }

    auto method_router::find(std::string_view method) const -> handler_ptr {
        const auto result = methods.find(method);

        if (result == methods.end()) return nullptr;
        return result->second;
    }

    auto method_router::merge(const method_router& other) -> void {
        for (const auto& [method, handler] : other.methods) {
            methods.insert_or_assign(method, handler);
        }
    }

    auto method_router::use(
        std::string_view method,
        handler_ptr handler
    ) -> method_router& {
        if (!handler) throw error("null handler for method '{}'", method);

        methods.insert_or_assign(std::string(method), std::move(handler));
        return *this;
    }
}

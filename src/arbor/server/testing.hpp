#pragma once

#include <arbor/server/router.hpp>

#include <gtest/gtest.h>
#include <initializer_list>
#include <netcore/netcore>

namespace arbor::test {
    /// A request body delivered as a fixed series of chunks.
    class chunks : public server::body_source {
        std::vector<std::string> parts;
        std::size_t index = 0;
    public:
        std::size_t reads = 0;

        chunks() = default;

        chunks(std::initializer_list<std::string_view> parts) {
            for (const auto part : parts) this->parts.emplace_back(part);
        }

        auto read() -> ext::task<std::span<const std::byte>> override {
            ++reads;

            if (index == parts.size()) co_return std::span<const std::byte>();

            const auto& part = parts[index++];
            co_return std::as_bytes(std::span<const char>(part));
        }
    };

    inline auto prepare(
        server::stream& stream,
        std::string_view method,
        std::string_view target
    ) -> void {
        stream.request.method = method;
        stream.request.target = target;
    }

    inline auto route(server::router& router, server::stream& stream) -> bool {
        auto result = false;

        netcore::run([&]() -> ext::task<> {
            result = co_await router.route(stream);
        }());

        return result;
    }

    inline auto body(const server::response& response) -> std::string_view {
        if (const auto* const text = std::get_if<std::string>(&response.data)) {
            return *text;
        }

        return {};
    }
}

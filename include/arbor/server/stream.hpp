#pragma once

#include "request.hpp"
#include "response.hpp"

#include <cstdint>
#include <fmt/format.h>

namespace arbor::server {
    /// The lifecycle position of an in-flight request.
    enum class stage {
        received,
        middleware,
        route_match,
        param_bind,
        body_parse,
        handler_exec,
        not_found,
        error,
        response_sent
    };

    auto to_string(stage value) noexcept -> std::string_view;

    class stream {
    public:
        const std::uint64_t id;

        server::request request;
        server::response response;

        stage state = stage::received;

        /// Cleared when the connection must be dropped without a response.
        bool open = true;

        stream();

        explicit stream(std::uint64_t id);

        stream(const stream&) = delete;

        stream(stream&&) = delete;

        auto operator=(const stream&) -> stream& = delete;

        auto operator=(stream&&) -> stream& = delete;

        auto advance(stage next) -> void;

        auto close() noexcept -> void;
    };
}

template <>
struct fmt::formatter<arbor::server::stage> : formatter<std::string_view> {
    template <typename FormatContext>
    auto format(arbor::server::stage stage, FormatContext& ctx) const {
        return formatter<std::string_view>::format(
            arbor::server::to_string(stage),
            ctx
        );
    }
};

template <>
struct fmt::formatter<arbor::server::stream> : formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const arbor::server::stream& stream, FormatContext& ctx)
        const {
        auto buffer = fmt::memory_buffer();
        auto out = std::back_inserter(buffer);

        fmt::format_to(
            out,
            "Request {}: {} {}",
            stream.id,
            stream.request.method,
            stream.request.target
        );

        if (!stream.request.headers.empty()) {
            fmt::format_to(
                out,
                "\nHeaders ({}):",
                stream.request.headers.size()
            );

            for (const auto& entry : stream.request.headers) {
                fmt::format_to(out, "\n\t{}: {}", entry.first, entry.second);
            }
        }

        return formatter<std::string_view>::format(
            {buffer.data(), buffer.size()},
            ctx
        );
    }
};

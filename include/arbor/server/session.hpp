#pragma once

#include "http1.hpp"
#include "router.hpp"

#include <netcore/netcore>

namespace arbor::server {
    struct options {
        /// Size of the socket read and file transfer buffers.
        std::size_t buffer_size;

        /// Largest accepted request line plus header block.
        std::size_t max_header_size;

        /// Whether connections may serve more than one request.
        bool keep_alive = true;

        options();
    };

    /// One HTTP/1.1 connection, serving its requests in sequence.
    class session {
        friend struct fmt::formatter<session>;

        session* next = this;
        session* prev = this;

        netcore::buffered_socket socket;
        server::router* router = nullptr;
        const options* opts = nullptr;
        std::string input;
        std::string chunk;
        std::uint64_t served = 0;
        ext::continuation<> closed;

        auto await_close() -> ext::task<>;

        auto fill() -> ext::task<bool>;

        auto handle_request() -> ext::task<bool>;

        auto read_head(http1::request_head& head) -> ext::task<bool>;

        auto reject(int status, std::string_view message) -> ext::task<>;

        auto respond(stream& stream, bool keep_alive) -> ext::task<>;

        auto unlink() noexcept -> void;
    public:
        session() = default;

        session(
            netcore::socket&& socket,
            server::router& router,
            const options& opts
        );

        session(const session&) = delete;

        session(session&&) = delete;

        ~session();

        auto operator=(const session&) -> session& = delete;

        auto operator=(session&&) -> session& = delete;

        /// Asks this session and every session linked to it to stop once
        /// their current request completes.
        auto close() noexcept -> void;

        auto handle_connection() -> ext::task<>;

        auto link(session& other) noexcept -> void;

        /// Reads a CRLF-terminated line of a request body.
        auto read_line() -> ext::task<std::string>;

        /// Returns up to `max` bytes of unread input.
        auto read_some(std::size_t max)
            -> ext::task<std::span<const std::byte>>;
    };
}

template <>
struct fmt::formatter<arbor::server::session> : formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const arbor::server::session& session, FormatContext& ctx)
        const {
        auto buffer = memory_buffer();
        auto out = std::back_inserter(buffer);

        format_to(out, "HTTP Session ({})", fmt::ptr(&session));

        return formatter<std::string_view>::format(
            {buffer.data(), buffer.size()},
            ctx
        );
    }
};

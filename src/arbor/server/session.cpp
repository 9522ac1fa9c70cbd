#include <arbor/server/session.hpp>

#include <cerrno>
#include <ext/data_size.h>
#include <system_error>
#include <timber/timber>
#include <unistd.h>

using namespace ext::literals;

namespace {
    namespace server = arbor::server;

    struct message_body : server::body_source {
        virtual auto drain() -> ext::task<> {
            while (!(co_await read()).empty()) {}
        }
    };

    struct empty_body : message_body {
        auto read() -> ext::task<std::span<const std::byte>> override {
            co_return std::span<const std::byte>();
        }
    };

    class fixed_body : public message_body {
        server::session& session;
        std::size_t remaining;
    public:
        fixed_body(server::session& session, std::size_t length) :
            session(session),
            remaining(length)
        {}

        auto read() -> ext::task<std::span<const std::byte>> override {
            if (remaining == 0) co_return std::span<const std::byte>();

            const auto bytes = co_await session.read_some(remaining);
            remaining -= bytes.size();

            co_return bytes;
        }
    };

    class chunked_body : public message_body {
        server::session& session;
        std::size_t remaining = 0;
        bool started = false;
        bool done = false;
    public:
        chunked_body(server::session& session) : session(session) {}

        auto read() -> ext::task<std::span<const std::byte>> override {
            if (done) co_return std::span<const std::byte>();

            if (remaining == 0) {
                // Each chunk after the first is preceded by the CRLF that
                // ends the previous one.
                if (started) co_await session.read_line();
                started = true;

                remaining = server::http1::parse_chunk_size(
                    co_await session.read_line()
                );

                if (remaining == 0) {
                    while (!(co_await session.read_line()).empty()) {}

                    done = true;
                    co_return std::span<const std::byte>();
                }
            }

            const auto bytes = co_await session.read_some(remaining);
            remaining -= bytes.size();

            co_return bytes;
        }
    };

    auto make_body(
        server::session& session,
        const server::request& request
    ) -> std::unique_ptr<message_body> {
        const auto encoding = request.headers.find("transfer-encoding");

        if (encoding != request.headers.end()) {
            if (encoding->second != "chunked") {
                throw arbor::error_code(
                    501,
                    "Unsupported transfer encoding '{}'",
                    encoding->second
                );
            }

            return std::make_unique<chunked_body>(session);
        }

        if (const auto length = request.content_length()) {
            return std::make_unique<fixed_body>(session, *length);
        }

        return std::make_unique<empty_body>();
    }
}

namespace arbor::server {
    options::options() :
        buffer_size(8_KiB),
        max_header_size(8_KiB)
    {}

    session::session(
        netcore::socket&& socket,
        server::router& router,
        const options& opts
    ) :
        socket(std::forward<netcore::socket>(socket), opts.buffer_size),
        router(&router),
        opts(&opts)
    {
        TIMBER_TRACE("{} created", *this);
    }

    session::~session() {
        unlink();

        if (router) {
            TIMBER_TRACE("{} destroyed after {} request{}",
                *this,
                served,
                served == 1 ? "" : "s"
            );
        }
    }

    auto session::await_close() -> ext::task<> {
        co_await closed;
        TIMBER_TRACE("{} close requested", *this);
    }

    auto session::close() noexcept -> void {
        auto* current = this;

        do {
            // `current` may unlink itself from the list.
            auto* const next = current->next;

            current->closed.resume();

            current = next;
        } while (current != this);
    }

    auto session::fill() -> ext::task<bool> {
        auto result = co_await ext::race(await_close(), socket.read());

        if (result.index() == 0) {
            co_await std::get<0>(std::move(result));
            co_return false;
        }

        const auto bytes = co_await std::get<1>(std::move(result));
        if (bytes.empty()) co_return false;

        input.append(reinterpret_cast<const char*>(bytes.data()), bytes.size());
        co_return true;
    }

    auto session::handle_connection() -> ext::task<> {
        try {
            while (co_await handle_request()) {}
            socket.shutdown();
        }
        catch (const netcore::eof&) {
            TIMBER_DEBUG("{} received unexpected EOF", *this);
        }
        catch (const connection_aborted&) {
            TIMBER_DEBUG("{} lost its peer mid-request", *this);
        }
    }

    auto session::handle_request() -> ext::task<bool> {
        auto head = http1::request_head();
        auto rejected = std::optional<error_code>();
        auto body = std::unique_ptr<message_body>();
        auto stream = server::stream(served + 1);
        auto persistent = false;

        try {
            if (!co_await read_head(head)) co_return false;

            persistent = opts->keep_alive && http1::keep_alive(head);

            stream.request.method = std::move(head.method);
            stream.request.target = std::move(head.target);
            stream.request.headers = std::move(head.headers);

            body = make_body(*this, stream.request);
        }
        catch (const error_code& error) {
            rejected = error;
        }

        ++served;

        if (rejected) {
            TIMBER_DEBUG(
                "{} rejected request: {} ({})",
                *this,
                rejected->code(),
                rejected->what()
            );

            co_await reject(rejected->code(), rejected->what());
            co_return false;
        }

        stream.request.body = body.get();

        TIMBER_DEBUG("{}", stream);

        if (!co_await router->route(stream)) {
            TIMBER_DEBUG("{} dropping request {}", *this, stream.id);
            co_return false;
        }

        const auto connection = stream.response.headers.find("connection");
        const auto keep_alive = persistent && !(
            connection != stream.response.headers.end() &&
            connection->second == "close"
        );

        co_await respond(stream, keep_alive);
        stream.advance(stage::response_sent);

        TIMBER_DEBUG(
            "Request {}: {} {} -> {}",
            stream.id,
            stream.request.method,
            stream.request.target,
            stream.response.status
        );

        if (!keep_alive) co_return false;

        co_await body->drain();
        co_return true;
    }

    auto session::link(session& other) noexcept -> void {
        other.next = this;
        other.prev = prev;

        prev->next = &other;
        prev = &other;
    }

    auto session::read_head(http1::request_head& head) -> ext::task<bool> {
        while (true) {
            if (const auto size = http1::parse_head(
                input,
                opts->max_header_size,
                head
            )) {
                input.erase(0, *size);
                co_return true;
            }

            if (!co_await fill()) {
                if (!input.empty()) throw connection_aborted();
                co_return false;
            }
        }
    }

    auto session::read_line() -> ext::task<std::string> {
        while (true) {
            const auto end = input.find("\r\n");

            if (end != std::string::npos) {
                auto line = input.substr(0, end);
                input.erase(0, end + 2);
                co_return line;
            }

            if (input.size() > opts->max_header_size) {
                throw error_code(400, "Chunk header line too long");
            }

            if (!co_await fill()) throw connection_aborted();
        }
    }

    auto session::read_some(std::size_t max)
        -> ext::task<std::span<const std::byte>>
    {
        if (input.empty() && !co_await fill()) throw connection_aborted();

        const auto size = std::min(max, input.size());

        chunk.assign(input, 0, size);
        input.erase(0, size);

        co_return std::as_bytes(std::span<const char>(chunk));
    }

    auto session::reject(int status, std::string_view message)
        -> ext::task<>
    {
        auto stream = server::stream(served);
        reply(stream.response, status, message);

        co_await respond(stream, false);
    }

    auto session::respond(stream& stream, bool keep_alive) -> ext::task<> {
        auto& res = stream.response;
        const auto head_only = stream.request.method == "HEAD";
        const auto head = http1::serialize(res, keep_alive);

        co_await socket.write(head.data(), head.size());

        if (head_only) {
            co_await socket.flush();
            co_return;
        }

        if (const auto* const body = std::get_if<std::string>(&res.data)) {
            co_await socket.write(body->data(), body->size());
        }
        else if (const auto* const body = std::get_if<file>(&res.data)) {
            auto buffer = std::string(opts->buffer_size, '\0');
            auto written = std::size_t(0);

            while (written < body->size) {
                const auto max = std::min(body->size - written, buffer.size());
                const auto ret = ::read(body->fd, buffer.data(), max);

                if (ret == -1) {
                    throw std::system_error(
                        errno,
                        std::generic_category(),
                        fmt::format("reading from fd ({}) failed", int(body->fd))
                    );
                }

                if (ret == 0) break;

                co_await socket.write(buffer.data(), ret);
                written += ret;

                TIMBER_TRACE(
                    "fd ({}) read {:L} byte{} ({:L} remaining)",
                    int(body->fd),
                    ret,
                    ret == 1 ? "" : "s",
                    body->size - written
                );
            }
        }

        co_await socket.flush();
    }

    auto session::unlink() noexcept -> void {
        next->prev = prev;
        prev->next = next;

        next = this;
        prev = this;
    }
}

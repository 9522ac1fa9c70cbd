#include "testing.hpp"

#include <arbor/server/session.hpp>

#include <cerrno>
#include <fcntl.h>
#include <sys/epoll.h>
#include <sys/socket.h>
#include <system_error>
#include <unistd.h>

using namespace std::literals;

namespace {
    constexpr auto limit = std::size_t(10);

    auto count(std::string_view haystack, std::string_view needle)
        -> std::size_t
    {
        auto result = std::size_t(0);
        auto pos = haystack.find(needle);

        while (pos != std::string_view::npos) {
            ++result;
            pos = haystack.find(needle, pos + needle.size());
        }

        return result;
    }
}

class SessionTest : public testing::Test {
protected:
    arbor::server::router app;
    arbor::server::options opts;

    SessionTest() {
        app.payload<std::vector<int>>(
            "POST",
            "/sum",
            [](arbor::server::stream&, std::vector<int> values) -> std::string {
                auto total = 0;
                for (const auto value : values) total += value;
                return std::to_string(total);
            },
            limit
        );

        app.get("/ping", []() -> std::string { return "pong"; });
    }

    /// Serves `input` on one connection whose peer stops sending after it,
    /// and returns every byte written back to the peer.
    auto converse(std::string_view input) -> std::string {
        int fds[2];

        if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds) == -1) {
            throw std::system_error(
                errno,
                std::generic_category(),
                "failed to create socket pair"
            );
        }

        const auto peer = netcore::fd(fds[1]);

        ::fcntl(fds[0], F_SETFL, ::fcntl(fds[0], F_GETFL) | O_NONBLOCK);

        EXPECT_EQ(
            static_cast<ssize_t>(input.size()),
            ::write(peer, input.data(), input.size())
        );
        ::shutdown(peer, SHUT_WR);

        netcore::run([&]() -> ext::task<> {
            auto session = arbor::server::session(
                netcore::socket(fds[0], EPOLLIN | EPOLLOUT),
                app,
                opts
            );

            co_await session.handle_connection();
        }());

        auto output = std::string();
        char buffer[1024];

        while (true) {
            const auto bytes = ::read(peer, buffer, sizeof(buffer));
            if (bytes <= 0) break;
            output.append(buffer, bytes);
        }

        return output;
    }
};

TEST_F(SessionTest, ChunkedPayload) {
    const auto output = converse(
        "POST /sum HTTP/1.1\r\n"
        "Content-Type: application/json\r\n"
        "Transfer-Encoding: chunked\r\n"
        "\r\n"
        "3\r\n[1,\r\n"
        "4;ext=1\r\n2,3]\r\n"
        "0\r\n"
        "X-Trailer: done\r\n"
        "\r\n"
    );

    EXPECT_TRUE(output.starts_with("HTTP/1.1 200 OK\r\n")) << output;
    EXPECT_EQ(1, count(output, "content-length: 1\r\n"));
    EXPECT_EQ(0, count(output, "connection: close"));
    EXPECT_TRUE(output.ends_with("\r\n\r\n6")) << output;
}

TEST_F(SessionTest, ChunkedOverflowClosesWithoutResponse) {
    const auto output = converse(
        "POST /sum HTTP/1.1\r\n"
        "Content-Type: application/json\r\n"
        "Transfer-Encoding: chunked\r\n"
        "\r\n"
        "6\r\n[1,2,3\r\n"
        "6\r\n,4,5]\r\n"
        "0\r\n\r\n"
        "GET /ping HTTP/1.1\r\n\r\n"
    );

    EXPECT_EQ("", output);
}

TEST_F(SessionTest, FixedPayload) {
    const auto output = converse(
        "POST /sum HTTP/1.1\r\n"
        "Content-Type: application/json\r\n"
        "Content-Length: 5\r\n"
        "Connection: close\r\n"
        "\r\n"
        "[4,5]"
    );

    EXPECT_TRUE(output.starts_with("HTTP/1.1 200 OK\r\n")) << output;
    EXPECT_EQ(1, count(output, "connection: close\r\n"));
    EXPECT_TRUE(output.ends_with("\r\n\r\n9")) << output;
}

TEST_F(SessionTest, DeclaredOverflowClosesAfterResponse) {
    const auto output = converse(
        "POST /sum HTTP/1.1\r\n"
        "Content-Type: application/json\r\n"
        "Content-Length: 11\r\n"
        "\r\n"
        "[1,2,3,4,5]"
        "GET /ping HTTP/1.1\r\n\r\n"
    );

    EXPECT_TRUE(output.starts_with("HTTP/1.1 413 ")) << output;
    EXPECT_EQ(1, count(output, "HTTP/1.1 "));
    EXPECT_EQ(1, count(output, "connection: close\r\n"));
    EXPECT_TRUE(output.ends_with("Request Entity Too Large")) << output;
}

TEST_F(SessionTest, UnreadBodyIsDrained) {
    const auto output = converse(
        "GET /ping HTTP/1.1\r\n"
        "Content-Length: 5\r\n"
        "\r\n"
        "hello"
        "GET /ping HTTP/1.1\r\n"
        "\r\n"
    );

    EXPECT_EQ(2, count(output, "HTTP/1.1 200 OK\r\n")) << output;
    EXPECT_EQ(2, count(output, "\r\n\r\npong"));
    EXPECT_EQ(0, count(output, "404"));
}

TEST_F(SessionTest, ConnectionCloseEndsSession) {
    const auto output = converse(
        "GET /ping HTTP/1.1\r\n"
        "Connection: close\r\n"
        "\r\n"
        "GET /ping HTTP/1.1\r\n"
        "\r\n"
    );

    EXPECT_EQ(1, count(output, "HTTP/1.1 200 OK\r\n")) << output;
    EXPECT_EQ(1, count(output, "connection: close\r\n"));
}

TEST_F(SessionTest, Http10ClosesByDefault) {
    const auto output = converse(
        "GET /ping HTTP/1.0\r\n\r\n"
        "GET /ping HTTP/1.0\r\n\r\n"
    );

    EXPECT_EQ(1, count(output, "HTTP/1.1 200 OK\r\n")) << output;
    EXPECT_EQ(1, count(output, "connection: close\r\n"));
}

TEST_F(SessionTest, Http10KeepAlive) {
    const auto output = converse(
        "GET /ping HTTP/1.0\r\n"
        "Connection: keep-alive\r\n"
        "\r\n"
        "GET /ping HTTP/1.0\r\n"
        "Connection: keep-alive\r\n"
        "\r\n"
    );

    EXPECT_EQ(2, count(output, "HTTP/1.1 200 OK\r\n")) << output;
    EXPECT_EQ(0, count(output, "connection: close"));
}

TEST_F(SessionTest, HeadOmitsBody) {
    app.head("/ping", []() -> std::string { return "pong"; });

    const auto output = converse("HEAD /ping HTTP/1.1\r\n\r\n");

    EXPECT_TRUE(output.starts_with("HTTP/1.1 200 OK\r\n")) << output;
    EXPECT_EQ(1, count(output, "content-length: 4\r\n"));
    EXPECT_TRUE(output.ends_with("\r\n\r\n")) << output;
}

TEST_F(SessionTest, MalformedHeadIsRejected) {
    const auto output = converse("GET\r\n\r\n");

    EXPECT_TRUE(output.starts_with("HTTP/1.1 400 Bad Request\r\n")) << output;
    EXPECT_EQ(1, count(output, "connection: close\r\n"));
}

TEST_F(SessionTest, AbsoluteFormTarget) {
    const auto output = converse(
        "GET http://example.com/ping HTTP/1.1\r\n"
        "Host: example.com\r\n"
        "\r\n"
    );

    EXPECT_TRUE(output.starts_with("HTTP/1.1 200 OK\r\n")) << output;
    EXPECT_TRUE(output.ends_with("pong")) << output;
}

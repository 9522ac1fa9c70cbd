#include <arbor/server/payload.hpp>

#include <ext/data_size.h>
#include <timber/timber>

using namespace ext::literals;

namespace arbor::server {
    const std::size_t default_body_limit = 1_MiB;
}

namespace arbor::server::detail {
    auto accept_payload(stream& stream, std::size_t max_size) -> bool {
        const auto type = stream.request.content_type();

        if (!type || !media::json().prefix_of(*type)) {
            TIMBER_DEBUG(
                "Request {}: rejected content type '{}'",
                stream.id,
                type.value_or("")
            );

            reply(stream.response, 415, "Unsupported Media Type");
            return false;
        }

        auto length = std::optional<std::size_t>();

        try {
            length = stream.request.content_length();
        }
        catch (const error_code& ex) {
            reply(stream.response, ex.code(), ex.what());
            return false;
        }

        if (length && *length > max_size) {
            TIMBER_DEBUG(
                "Request {}: declared body of {:L} bytes exceeds {:L}",
                stream.id,
                *length,
                max_size
            );

            reply(stream.response, 413, "Request Entity Too Large");
            stream.response.headers.insert_or_assign("connection", "close");
            return false;
        }

        return true;
    }

    auto read_payload(stream& stream, std::size_t max_size)
        -> ext::task<std::optional<std::string>>
    {
        auto body = std::string();

        if (const auto length = stream.request.content_length()) {
            body.reserve(*length);
        }

        if (!stream.request.body) co_return body;

        while (true) {
            const auto chunk = co_await stream.request.body->read();
            if (chunk.empty()) break;

            TIMBER_TRACE(
                "Request {}: received {:L} body byte{}",
                stream.id,
                chunk.size(),
                chunk.size() == 1 ? "" : "s"
            );

            if (body.size() + chunk.size() > max_size) {
                TIMBER_DEBUG(
                    "Request {}: body exceeds {:L} bytes; closing connection",
                    stream.id,
                    max_size
                );

                stream.close();
                co_return std::nullopt;
            }

            body.append(
                reinterpret_cast<const char*>(chunk.data()),
                chunk.size()
            );
        }

        co_return body;
    }

    auto reject_payload(stream& stream, std::string_view reason) -> void {
        TIMBER_DEBUG("Request {}: invalid JSON body: {}", stream.id, reason);
        reply(stream.response, 400, "Invalid JSON");
    }

    auto handler_failed(stream& stream, std::string_view reason) -> void {
        TIMBER_ERROR(
            "Request {}: {} {} payload handler failed: {}",
            stream.id,
            stream.request.method,
            stream.request.path,
            reason
        );

        stream.response = response();
        reply(stream.response, 400, "Invalid JSON");
    }
}

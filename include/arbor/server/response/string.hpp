#pragma once

#include "../response.hpp"

namespace arbor::server {
    template <>
    struct response_type<std::string> {
        static auto send(response& res, std::string string) -> void {
            res.content_type(media::utf8_text());
            res.content_length(string.size());
            res.data = std::move(string);
        }
    };

    template <>
    struct response_type<std::string_view> {
        static auto send(response& res, std::string_view string) -> void {
            response_type<std::string>::send(res, std::string(string));
        }
    };

    template <>
    struct response_type<const char*> {
        static auto send(response& res, const char* string) -> void {
            response_type<std::string>::send(res, std::string(string));
        }
    };

    template <>
    struct response_type<char*> : response_type<const char*> {};

    /// Replaces whatever the response held with a plain text message.
    inline auto reply(
        response& res,
        int status,
        std::string_view message
    ) -> void {
        res.status = status;
        res.headers.clear();
        res.data = std::monostate();
        response_type<std::string_view>::send(res, message);
    }
}

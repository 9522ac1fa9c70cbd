#pragma once

#include <arbor/media_type.hpp>

#include <netcore/netcore>
#include <string>
#include <unordered_map>
#include <variant>

namespace arbor::server {
    struct file {
        netcore::fd fd;
        std::size_t size;
        std::string content_type;
    };

    struct response;

    template <typename T>
    struct response_type {};

    template <typename T>
    concept response_data = requires(response& res, T&& t) {
        { response_type<std::decay_t<T>>::send(
            res,
            std::forward<T>(t)
        ) } -> std::same_as<void>;
    };

    struct response {
        int status = 200;
        std::unordered_map<std::string, std::string> headers;
        std::variant<std::monostate, std::string, file> data;

        auto content_length(std::size_t length) -> void {
            headers.insert_or_assign("content-length", std::to_string(length));
        }

        auto content_type(const media_type& type) -> void {
            headers.insert_or_assign("content-type", std::string(type.str()));
        }

        template <response_data T>
        auto send(T&& t) -> void {
            response_type<std::decay_t<T>>::send(
                *this,
                std::forward<T>(t)
            );
        }
    };
}

#pragma once

#include "string.hpp"

#include <arbor/json.hpp>

namespace arbor::server {
    template <>
    struct response_type<json> {
        static auto send(response& res, const json& value) -> void {
            auto body = value.dump();

            res.content_type(media::json());
            res.content_length(body.size());
            res.data = std::move(body);
        }
    };
}

#pragma once

#include "../response.hpp"

namespace arbor::server {
    template <>
    struct response_type<file> {
        static auto send(response& res, file&& body) -> void {
            res.headers.insert_or_assign("content-type", body.content_type);
            res.content_length(body.size);
            res.data = std::move(body);
        }
    };
}

#pragma once

#include "../response.hpp"

namespace arbor::server {
    /// A bare integer result sets the status and leaves the body empty.
    template <>
    struct response_type<int> {
        static auto send(response& res, int status) -> void {
            res.status = status;
            res.data = std::monostate();
            res.content_length(0);
        }
    };
}

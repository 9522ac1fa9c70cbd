#pragma once

#include "string.hpp"

#include <optional>

namespace arbor::server {
    template <typename T>
    struct response_type<std::optional<T>> {
        static auto send(response& res, std::optional<T>&& value) -> void {
            if (value) {
                response_type<T>::send(res, *std::move(value));
                return;
            }

            reply(res, 404, "Not Found");
        }
    };
}

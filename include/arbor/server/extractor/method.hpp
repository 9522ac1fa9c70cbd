#pragma once

#include <arbor/server/request.hpp>

namespace arbor::server::extractor {
    struct method {
        std::string_view value;

        method(request& request) : value(request.method) {}

        auto operator==(std::string_view other) const noexcept -> bool {
            return value == other;
        }
    };
}

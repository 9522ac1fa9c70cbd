#pragma once

#include "fixed_string.hpp"
#include "named.hpp"

#include <arbor/server/request.hpp>

namespace arbor::server::extractor {
    /// A required capture parameter, parsed as `T`.
    template <fixed_string Name, typename T = std::string_view>
    struct path : detail::named<T> {
        path(request& request) :
            detail::named<T>(
                Name.str(),
                request.path_param<T>(Name.str())
            )
        {}
    };
}

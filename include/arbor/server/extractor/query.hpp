#pragma once

#include "fixed_string.hpp"
#include "named.hpp"

#include <arbor/server/request.hpp>

namespace arbor::server::extractor {
    /// A query parameter, optional unless `T` says otherwise. Repeated keys
    /// yield the first value.
    template <fixed_string Name, typename T = std::optional<std::string_view>>
    struct query : detail::named<T> {
        query(request& request) :
            detail::named<T>(
                Name.str(),
                request.query_param<T>(Name.str())
            )
        {}
    };
}

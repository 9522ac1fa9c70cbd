#pragma once

#include "response.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace arbor::server::http1 {
    struct request_head {
        std::string method;
        std::string target;
        int minor_version = 1;
        std::unordered_map<std::string, std::string> headers;
    };

    /// Parses a request line and header block from the front of `buffer`.
    ///
    /// Returns the number of bytes the head occupies, or nothing if the
    /// terminating blank line has not arrived yet. A malformed head throws
    /// `error_code` 400; one longer than `max_size` throws 431.
    auto parse_head(
        std::string_view buffer,
        std::size_t max_size,
        request_head& head
    ) -> std::optional<std::size_t>;

    /// Reads the size from a chunk header line, ignoring extensions.
    auto parse_chunk_size(std::string_view line) -> std::size_t;

    auto keep_alive(const request_head& head) -> bool;

    auto reason(int status) noexcept -> std::string_view;

    /// Renders the status line and headers of `res`, including the blank
    /// line that ends them. A missing content-length is filled in from
    /// the body.
    auto serialize(const response& res, bool keep_alive) -> std::string;
}

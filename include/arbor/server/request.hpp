#pragma once

#include <arbor/parser.hpp>

#include <ext/coroutine>
#include <map>
#include <span>
#include <unordered_map>
#include <vector>

namespace arbor::server {
    namespace detail {
        template <typename T>
        concept nullable =
            std::same_as<T, std::optional<typename T::value_type>>;

        /// Converts a raw request value into `T`. Absent or empty values
        /// yield an empty optional; required values fail with a 400.
        template <typename T>
        auto convert(
            std::string_view kind,
            std::string_view name,
            std::optional<std::string_view> raw
        ) -> T {
            if constexpr (nullable<T>) {
                if (!raw || raw->empty()) return std::nullopt;
            }
            else if (!raw) {
                throw error_code(400, "Missing required {} '{}'", kind, name);
            }

            try {
                return parser<T>::parse(*raw);
            }
            catch (const std::exception& ex) {
                throw error_code(
                    400,
                    "Invalid {} '{}': {}",
                    kind,
                    name,
                    ex.what()
                );
            }
        }
    }

    /// A readable request body. Each call to `read` suspends until the next
    /// chunk is available; an empty span marks the end of the body.
    struct body_source {
        virtual ~body_source() = default;

        virtual auto read() -> ext::task<std::span<const std::byte>> = 0;
    };

    using query_map = std::multimap<std::string, std::string, std::less<>>;

    struct request {
        std::string method;
        std::string target;

        /// Views into `target`, split at the first '?'.
        std::string_view path;
        std::string_view query_string;

        std::unordered_map<std::string_view, std::string_view> params;
        query_map query;
        std::unordered_map<std::string, std::string> headers;
        body_source* body = nullptr;

        auto content_length() const -> std::optional<std::size_t>;

        auto content_type() const -> std::optional<std::string_view>;

        auto find_header(std::string_view name) const
            -> std::optional<std::string_view>;

        auto find_param(std::string_view name) const
            -> std::optional<std::string_view>;

        /// Returns the first value bound to `name` in the query string.
        auto find_query(std::string_view name) const
            -> std::optional<std::string_view>;

        template <typename T>
        auto header(std::string_view name) const -> T {
            return detail::convert<T>("header", name, find_header(name));
        }

        template <typename T>
        auto path_param(std::string_view name) const -> T {
            return detail::convert<T>(
                "path parameter",
                name,
                find_param(name)
            );
        }

        template <typename T>
        auto query_param(std::string_view name) const -> T {
            return detail::convert<T>(
                "query parameter",
                name,
                find_query(name)
            );
        }

        /// Returns every value bound to `name`, in the order they appeared.
        auto query_values(std::string_view name) const
            -> std::vector<std::string_view>;
    };

    /// Splits an `a=1&b=2` query string into decoded name/value pairs.
    auto parse_query(std::string_view query) -> query_map;

    auto percent_decode(std::string_view value, bool plus_as_space = false)
        -> std::string;
}

#include <arbor/server/request.hpp>

#include <charconv>
#include <ext/string.h>

namespace {
    auto decode_escape(std::string_view digits) -> std::optional<char> {
        auto value = 0u;

        const auto* const end = digits.data() + digits.size();
        const auto [ptr, ec] = std::from_chars(digits.data(), end, value, 16);

        if (ec != std::errc() || ptr != end) return std::nullopt;
        return static_cast<char>(value);
    }
}

namespace arbor::server {
    auto request::content_length() const -> std::optional<std::size_t> {
        return header<std::optional<std::size_t>>("content-length");
    }

    auto request::content_type() const -> std::optional<std::string_view> {
        return find_header("content-type");
    }

    auto request::find_header(std::string_view name) const
        -> std::optional<std::string_view>
    {
        const auto it = headers.find(std::string(name));
        if (it == headers.end()) return std::nullopt;
        return it->second;
    }

    auto request::find_param(std::string_view name) const
        -> std::optional<std::string_view>
    {
        const auto it = params.find(name);
        if (it == params.end()) return std::nullopt;
        return it->second;
    }

    auto request::find_query(std::string_view name) const
        -> std::optional<std::string_view>
    {
        const auto it = query.find(name);
        if (it == query.end()) return std::nullopt;
        return it->second;
    }

    auto request::query_values(std::string_view name) const
        -> std::vector<std::string_view> {
        auto values = std::vector<std::string_view>();
        const auto [first, last] = query.equal_range(name);

        for (auto it = first; it != last; ++it) values.push_back(it->second);

        return values;
    }

    auto parse_query(std::string_view query) -> query_map {
        auto result = query_map();

        for (const auto entry : ext::string_range(query, "&")) {
            if (entry.empty()) continue;

            const auto eq = entry.find('=');
            const auto name = entry.substr(0, eq);
            const auto value = eq == std::string_view::npos ?
                std::string_view() :
                entry.substr(eq + 1);

            result.emplace(
                percent_decode(name, true),
                percent_decode(value, true)
            );
        }

        return result;
    }

    auto percent_decode(std::string_view value, bool plus_as_space)
        -> std::string
    {
        auto decoded = std::string();
        decoded.reserve(value.size());

        while (!value.empty()) {
            const auto c = value.front();

            if (c == '%' && value.size() >= 3) {
                if (const auto byte = decode_escape(value.substr(1, 2))) {
                    decoded.push_back(*byte);
                    value.remove_prefix(3);
                    continue;
                }
            }

            decoded.push_back(c == '+' && plus_as_space ? ' ' : c);
            value.remove_prefix(1);
        }

        return decoded;
    }
}

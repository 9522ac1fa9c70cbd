#include <arbor/server/http1.hpp>

#include <algorithm>
#include <array>
#include <arbor/error.hpp>
#include <cctype>
#include <ext/string.h>

using namespace std::literals;

namespace {
    constexpr auto crlf = "\r\n"sv;

    auto lower(std::string_view string) -> std::string {
        auto result = std::string();
        result.reserve(string.size());

        std::transform(
            string.begin(),
            string.end(),
            std::back_inserter(result),
            [](char c) {
                return static_cast<char>(
                    std::tolower(static_cast<unsigned char>(c))
                );
            }
        );

        return result;
    }

    auto trim(std::string_view string) -> std::string_view {
        while (
            !string.empty() &&
            (string.front() == ' ' || string.front() == '\t')
        ) string.remove_prefix(1);

        while (
            !string.empty() &&
            (string.back() == ' ' || string.back() == '\t')
        ) string.remove_suffix(1);

        return string;
    }

    auto is_token(std::string_view string) -> bool {
        constexpr auto specials = "!#$%&'*+-.^_`|~"sv;

        return !string.empty() && std::all_of(
            string.begin(),
            string.end(),
            [specials](char c) {
                return std::isalnum(static_cast<unsigned char>(c)) ||
                    specials.find(c) != std::string_view::npos;
            }
        );
    }

    /// Reduces an absolute-form target to its path and query.
    auto origin_form(std::string_view target) -> std::string {
        if (target.starts_with('/') || target == "*") {
            return std::string(target);
        }

        const auto separator = target.find("://");
        const auto scheme = lower(target.substr(0, separator));

        if (
            separator == std::string_view::npos ||
            (scheme != "http" && scheme != "https")
        ) throw arbor::error_code(400, "Invalid request target");

        const auto rest = target.substr(separator + 3);
        const auto path = rest.find_first_of("/?");

        if (path == 0) throw arbor::error_code(400, "Invalid request target");
        if (path == std::string_view::npos) return "/";
        if (rest[path] == '?') return fmt::format("/{}", rest.substr(path));

        return std::string(rest.substr(path));
    }

    auto parse_request_line(
        std::string_view line,
        arbor::server::http1::request_head& head
    ) -> void {
        const auto first = line.find(' ');
        const auto last = line.rfind(' ');

        if (first == std::string_view::npos || first == last) {
            throw arbor::error_code(400, "Malformed request line");
        }

        const auto method = line.substr(0, first);
        const auto target = line.substr(first + 1, last - first - 1);
        const auto version = line.substr(last + 1);

        if (!is_token(method)) {
            throw arbor::error_code(400, "Invalid request method");
        }

        if (target.empty() || target.find(' ') != std::string_view::npos) {
            throw arbor::error_code(400, "Invalid request target");
        }

        if (version == "HTTP/1.1") head.minor_version = 1;
        else if (version == "HTTP/1.0") head.minor_version = 0;
        else if (version.starts_with("HTTP/")) {
            throw arbor::error_code(505, "HTTP Version Not Supported");
        }
        else throw arbor::error_code(400, "Malformed request line");

        head.method = method;
        head.target = origin_form(target);
    }

    auto parse_header(
        std::string_view line,
        arbor::server::http1::request_head& head
    ) -> void {
        const auto colon = line.find(':');

        if (colon == std::string_view::npos) {
            throw arbor::error_code(400, "Malformed header line");
        }

        const auto name = line.substr(0, colon);

        if (!is_token(name)) {
            throw arbor::error_code(400, "Invalid header name '{}'", name);
        }

        const auto value = trim(line.substr(colon + 1));
        const auto [it, inserted] =
            head.headers.try_emplace(lower(name), value);

        if (!inserted) {
            it->second.append(", ");
            it->second.append(value);
        }
    }

    constexpr auto reasons = std::array<std::pair<int, std::string_view>, 40> {{
        {100, "Continue"},
        {101, "Switching Protocols"},
        {200, "OK"},
        {201, "Created"},
        {202, "Accepted"},
        {204, "No Content"},
        {206, "Partial Content"},
        {301, "Moved Permanently"},
        {302, "Found"},
        {303, "See Other"},
        {304, "Not Modified"},
        {307, "Temporary Redirect"},
        {308, "Permanent Redirect"},
        {400, "Bad Request"},
        {401, "Unauthorized"},
        {403, "Forbidden"},
        {404, "Not Found"},
        {405, "Method Not Allowed"},
        {406, "Not Acceptable"},
        {408, "Request Timeout"},
        {409, "Conflict"},
        {410, "Gone"},
        {411, "Length Required"},
        {412, "Precondition Failed"},
        {413, "Payload Too Large"},
        {414, "URI Too Long"},
        {415, "Unsupported Media Type"},
        {416, "Range Not Satisfiable"},
        {417, "Expectation Failed"},
        {422, "Unprocessable Content"},
        {426, "Upgrade Required"},
        {428, "Precondition Required"},
        {429, "Too Many Requests"},
        {431, "Request Header Fields Too Large"},
        {500, "Internal Server Error"},
        {501, "Not Implemented"},
        {502, "Bad Gateway"},
        {503, "Service Unavailable"},
        {504, "Gateway Timeout"},
        {505, "HTTP Version Not Supported"}
    }};
}

namespace arbor::server::http1 {
    auto parse_head(
        std::string_view buffer,
        std::size_t max_size,
        request_head& head
    ) -> std::optional<std::size_t> {
        auto skipped = std::size_t(0);

        while (buffer.substr(skipped).starts_with(crlf)) {
            skipped += crlf.size();
        }

        const auto text = buffer.substr(skipped);
        const auto end = text.find("\r\n\r\n");

        if (end == std::string_view::npos) {
            if (text.size() > max_size) {
                throw error_code(431, "Request Header Fields Too Large");
            }

            return std::nullopt;
        }

        if (end + 4 > max_size) {
            throw error_code(431, "Request Header Fields Too Large");
        }

        auto first = true;

        for (const auto line : ext::string_range(text.substr(0, end), crlf)) {
            if (first) {
                parse_request_line(line, head);
                first = false;
            }
            else parse_header(line, head);
        }

        return skipped + end + 4;
    }

    auto parse_chunk_size(std::string_view line) -> std::size_t {
        const auto extension = line.find(';');
        const auto digits = trim(line.substr(0, extension));

        if (digits.empty() || digits.size() > sizeof(std::size_t) * 2) {
            throw error_code(400, "Invalid chunk size '{}'", line);
        }

        auto size = std::size_t(0);

        for (const auto c : digits) {
            const auto digit = static_cast<unsigned char>(c);

            if (!std::isxdigit(digit)) {
                throw error_code(400, "Invalid chunk size '{}'", line);
            }

            size <<= 4;

            if (std::isdigit(digit)) size += digit - '0';
            else size += std::tolower(digit) - 'a' + 10;
        }

        return size;
    }

    auto keep_alive(const request_head& head) -> bool {
        const auto connection = head.headers.find("connection");

        if (connection != head.headers.end()) {
            for (const auto option : ext::string_range(connection->second, ",")) {
                const auto token = lower(trim(option));

                if (token == "close") return false;
                if (token == "keep-alive") return true;
            }
        }

        return head.minor_version >= 1;
    }

    auto reason(int status) noexcept -> std::string_view {
        const auto it = std::lower_bound(
            reasons.begin(),
            reasons.end(),
            status,
            [](const auto& entry, int status) { return entry.first < status; }
        );

        if (it == reasons.end() || it->first != status) return "Unknown";
        return it->second;
    }

    auto serialize(const response& res, bool keep_alive) -> std::string {
        auto buffer = fmt::memory_buffer();
        auto out = std::back_inserter(buffer);

        fmt::format_to(out, "HTTP/1.1 {} {}\r\n", res.status, reason(res.status));

        for (const auto& [name, value] : res.headers) {
            if (name == "connection") continue;
            fmt::format_to(out, "{}: {}\r\n", name, value);
        }

        if (!res.headers.contains("content-length")) {
            auto length = std::size_t(0);

            if (const auto* string = std::get_if<std::string>(&res.data)) {
                length = string->size();
            }
            else if (const auto* file = std::get_if<server::file>(&res.data)) {
                length = file->size;
            }

            fmt::format_to(out, "content-length: {}\r\n", length);
        }

        if (!keep_alive) fmt::format_to(out, "connection: close\r\n");

        fmt::format_to(out, "\r\n");

        return fmt::to_string(buffer);
    }
}

#include <arbor/media_type.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace {
    auto lower(char c) noexcept -> char {
        return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    auto iequals(std::string_view a, std::string_view b) noexcept -> bool {
        return std::ranges::equal(a, b, [](char x, char y) {
            return lower(x) == lower(y);
        });
    }

    auto trim_front(std::string_view value) noexcept -> std::string_view {
        while (!value.empty() && value.front() == ' ') value.remove_prefix(1);
        return value;
    }
}

namespace arbor {
    media_type::media_type(const char* str) :
        media_type(std::string_view(str))
    {}

    media_type::media_type(std::string_view type) {
        const auto semicolon = type.find(';');
        const auto essence = type.substr(0, semicolon);
        const auto pos = essence.find('/');

        if (
            pos == std::string_view::npos ||
            pos == 0 ||
            pos + 1 == essence.size()
        ) throw invalid_media_type(type);

        text.reserve(type.size());
        std::ranges::transform(essence, std::back_inserter(text), lower);
        slash = pos;

        if (semicolon == std::string_view::npos) return;

        const auto param = trim_front(type.substr(semicolon + 1));
        const auto eq = param.find('=');

        if (
            eq == std::string_view::npos ||
            eq == 0 ||
            eq + 1 == param.size()
        ) throw invalid_media_type(type);

        separator = text.size();
        text.push_back(';');
        std::ranges::transform(param, std::back_inserter(text), lower);
        equals = separator + 1 + eq;
    }

    auto media_type::essence() const noexcept -> std::string_view {
        return std::string_view(text).substr(0, separator);
    }

    auto media_type::operator==(
        const media_type& other
    ) const noexcept -> bool {
        return text == other.text;
    }

    auto media_type::prefix_of(std::string_view value) const noexcept -> bool {
        const auto self = essence();

        if (value.size() < self.size()) return false;
        return iequals(self, value.substr(0, self.size()));
    }

    auto media_type::parameter() const noexcept -> std::optional<name_value> {
        if (separator == std::string::npos) return std::nullopt;

        const auto view = std::string_view(text);

        return name_value {
            .name = view.substr(separator + 1, equals - separator - 1),
            .value = view.substr(equals + 1)
        };
    }

    auto media_type::str() const noexcept -> std::string_view {
        return text;
    }

    auto media_type::subtype() const noexcept -> std::string_view {
        return essence().substr(slash + 1);
    }

    auto media_type::type() const noexcept -> std::string_view {
        return essence().substr(0, slash);
    }

    invalid_media_type::invalid_media_type(std::string_view type) :
        std::invalid_argument(fmt::format("invalid media type '{}'", type)),
        type(type)
    {}

    auto invalid_media_type::invalid_type() const noexcept -> std::string_view {
        return type;
    }
}

#define ARBOR_MEDIA_TYPE(name, value) \
    auto arbor::media::name() noexcept -> const media_type& { \
        static const auto instance = media_type(value); \
        return instance; \
    }

ARBOR_MEDIA_TYPE(avif, "image/avif")
ARBOR_MEDIA_TYPE(css, "text/css")
ARBOR_MEDIA_TYPE(gif, "image/gif")
ARBOR_MEDIA_TYPE(html, "text/html; charset=UTF-8")
ARBOR_MEDIA_TYPE(icon, "image/x-icon")
ARBOR_MEDIA_TYPE(javascript, "application/javascript")
ARBOR_MEDIA_TYPE(jpeg, "image/jpeg")
ARBOR_MEDIA_TYPE(json, "application/json")
ARBOR_MEDIA_TYPE(octet_stream, "application/octet-stream")
ARBOR_MEDIA_TYPE(plain_text, "text/plain")
ARBOR_MEDIA_TYPE(png, "image/png")
ARBOR_MEDIA_TYPE(svg, "image/svg+xml")
ARBOR_MEDIA_TYPE(utf8_text, "text/plain; charset=UTF-8")
ARBOR_MEDIA_TYPE(webp, "image/webp")

#undef ARBOR_MEDIA_TYPE

namespace arbor::media {
    auto from_extension(std::string_view extension) noexcept
        -> const media_type&
    {
        using entry = std::pair<std::string_view, const media_type& (*)()>;

        static const auto table = std::array {
            entry(".avif", &avif),
            entry(".css", &css),
            entry(".gif", &gif),
            entry(".htm", &html),
            entry(".html", &html),
            entry(".ico", &icon),
            entry(".jpeg", &jpeg),
            entry(".jpg", &jpeg),
            entry(".js", &javascript),
            entry(".json", &json),
            entry(".mjs", &javascript),
            entry(".png", &png),
            entry(".svg", &svg),
            entry(".txt", &utf8_text),
            entry(".webp", &webp)
        };

        for (const auto& [ext, type] : table) {
            if (iequals(ext, extension)) return type();
        }

        return octet_stream();
    }
}

#pragma once

#include <fmt/format.h>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace arbor {
    /// A parsed `type/subtype[;name=value]` media type, stored lowercase.
    class media_type {
        std::string text;
        std::size_t slash = 0;
        std::size_t separator = std::string::npos;
        std::size_t equals = std::string::npos;

        auto essence() const noexcept -> std::string_view;
    public:
        struct name_value {
            std::string_view name;
            std::string_view value;

            auto operator==(const name_value&) const noexcept
                -> bool = default;
        };

        media_type() = default;

        media_type(const char* str);

        media_type(std::string_view type);

        auto operator==(const media_type& other) const noexcept -> bool;

        /// Reports whether `value` (a raw content-type header) names this
        /// type, ignoring case and any trailing parameters.
        auto prefix_of(std::string_view value) const noexcept -> bool;

        auto parameter() const noexcept -> std::optional<name_value>;

        auto str() const noexcept -> std::string_view;

        auto subtype() const noexcept -> std::string_view;

        auto type() const noexcept -> std::string_view;
    };

    class invalid_media_type : public std::invalid_argument {
        std::string type;
    public:
        invalid_media_type(std::string_view type);

        auto invalid_type() const noexcept -> std::string_view;
    };

    namespace media {
        auto avif() noexcept -> const media_type&;
        auto css() noexcept -> const media_type&;
        auto gif() noexcept -> const media_type&;
        auto html() noexcept -> const media_type&;
        auto icon() noexcept -> const media_type&;
        auto javascript() noexcept -> const media_type&;
        auto jpeg() noexcept -> const media_type&;
        auto json() noexcept -> const media_type&;
        auto octet_stream() noexcept -> const media_type&;
        auto plain_text() noexcept -> const media_type&;
        auto png() noexcept -> const media_type&;
        auto svg() noexcept -> const media_type&;
        auto utf8_text() noexcept -> const media_type&;
        auto webp() noexcept -> const media_type&;

        /// Maps a file extension (with its leading dot) to a media type.
        /// Unknown extensions map to `application/octet-stream`.
        auto from_extension(std::string_view extension) noexcept
            -> const media_type&;
    }
}

template <>
struct fmt::formatter<arbor::media_type> : formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const arbor::media_type& type, FormatContext& ctx) const {
        return formatter<std::string_view>::format(type.str(), ctx);
    }
};

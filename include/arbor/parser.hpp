#pragma once

#include "error.hpp"
#include "media_type.hpp"

#include <charconv>
#include <chrono>
#include <concepts>
#include <filesystem>
#include <limits>
#include <optional>
#include <uuid++/uuid++>

namespace arbor {
    struct parser_error : error {
        using error::error;
    };

    /// Converts the text of a header, path or query value into `T`.
    template <typename T>
    struct parser {};

    template <>
    struct parser<std::string_view> {
        static auto parse(std::string_view text) -> std::string_view {
            return text;
        }
    };

    template <>
    struct parser<std::string> {
        static auto parse(std::string_view text) -> std::string {
            return std::string(text);
        }
    };

    template <typename T>
    struct parser<std::optional<T>> {
        static auto parse(std::string_view text) -> std::optional<T> {
            return parser<T>::parse(text);
        }
    };

    template <>
    struct parser<bool> {
        static auto parse(std::string_view text) -> bool {
            if (
                text == "t" || text == "true" ||
                text == "y" || text == "yes" ||
                text == "1"
            ) return true;

            if (
                text == "f" || text == "false" ||
                text == "n" || text == "no" ||
                text == "0"
            ) return false;

            throw parser_error("'{}' is not a boolean", text);
        }
    };

    template <typename T>
    requires std::integral<T> || std::floating_point<T>
    struct parser<T> {
        static auto parse(std::string_view text) -> T {
            auto value = T();

            const auto* const end = text.data() + text.size();
            const auto [ptr, ec] = std::from_chars(text.data(), end, value);

            if (ec == std::errc::result_out_of_range) {
                throw parser_error(
                    "'{}' is outside the range of {} and {}",
                    text,
                    std::numeric_limits<T>::lowest(),
                    std::numeric_limits<T>::max()
                );
            }

            if (ec != std::errc() || ptr != end) {
                throw parser_error("'{}' is not a number", text);
            }

            return value;
        }
    };

    template <typename Rep, typename Period>
    struct parser<std::chrono::duration<Rep, Period>> {
        static auto parse(std::string_view text)
            -> std::chrono::duration<Rep, Period>
        {
            return std::chrono::duration<Rep, Period>(
                parser<Rep>::parse(text)
            );
        }
    };

    template <>
    struct parser<std::filesystem::path> {
        static auto parse(std::string_view text) -> std::filesystem::path {
            return text;
        }
    };

    template <>
    struct parser<media_type> {
        static auto parse(std::string_view text) -> media_type {
            return media_type(text);
        }
    };

    template <>
    struct parser<UUID::uuid> {
        static auto parse(std::string_view text) -> UUID::uuid {
            return UUID::uuid(text);
        }
    };
}

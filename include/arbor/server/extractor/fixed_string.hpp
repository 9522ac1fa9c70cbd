#pragma once

#include <cstddef>
#include <string_view>

namespace arbor::server::extractor {
    /// A string literal usable as a template argument.
    template <std::size_t Size>
    struct fixed_string {
        char chars[Size] = {};

        constexpr fixed_string(const char (&str)[Size]) {
            for (std::size_t i = 0; i < Size; ++i) chars[i] = str[i];
        }

        constexpr auto str() const noexcept -> std::string_view {
            return {chars, Size - 1};
        }
    };
}

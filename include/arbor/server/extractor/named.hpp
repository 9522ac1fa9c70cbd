#pragma once

#include <string_view>
#include <utility>

namespace arbor::server::extractor::detail {
    template <typename T>
    class named {
        std::string_view key;
        T data;
    public:
        named(std::string_view key, T&& data) :
            key(key),
            data(std::forward<T>(data))
        {}

        operator const T&() const noexcept { return data; }

        auto operator*() const noexcept -> const T& { return data; }

        auto operator->() const noexcept -> const T* { return &data; }

        auto name() const noexcept -> std::string_view { return key; }
    };
}

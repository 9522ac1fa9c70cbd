#pragma once

#include "extractor/extractor.hpp"
#include "response/file.hpp"
#include "response/int.hpp"
#include "response/json.hpp"
#include "response/optional.hpp"
#include "response/string.hpp"
#include "stream.hpp"

#include <functional>
#include <memory>
#include <tuple>

namespace arbor::server {
    struct handler {
        virtual ~handler() = default;

        virtual auto handle(stream& stream) -> ext::task<> = 0;
    };

    using handler_ptr = std::shared_ptr<handler>;

    namespace detail {
        template <typename T>
        struct argument {
            static auto get(stream& stream) -> T
                requires std::constructible_from<T, request&>
            {
                return T(stream.request);
            }
        };

        template <>
        struct argument<stream&> {
            static auto get(stream& stream) -> server::stream& {
                return stream;
            }
        };

        template <>
        struct argument<request&> {
            static auto get(stream& stream) -> request& {
                return stream.request;
            }
        };

        template <>
        struct argument<const request&> {
            static auto get(stream& stream) -> const request& {
                return stream.request;
            }
        };

        template <>
        struct argument<response&> {
            static auto get(stream& stream) -> response& {
                return stream.response;
            }
        };

        template <typename T>
        concept context_reference =
            std::is_lvalue_reference_v<T> && (
                std::same_as<std::remove_cvref_t<T>, stream> ||
                std::same_as<std::remove_cvref_t<T>, request> ||
                std::same_as<std::remove_cvref_t<T>, response>
            );

        /// Context objects are passed through by reference; extractors are
        /// built from the request and held by value.
        template <typename T>
        using stored = std::conditional_t<
            context_reference<T>,
            T,
            std::remove_cvref_t<T>
        >;

        template <typename... Args>
        auto extract(stream& stream) -> std::tuple<stored<Args>...> {
            return std::tuple<stored<Args>...> {
                argument<stored<Args>>::get(stream)...
            };
        }

        template <typename... Args>
        auto use(
            stream& stream,
            std::function<void(Args...)>& fn
        ) -> ext::task<> {
            std::apply(fn, extract<Args...>(stream));
            co_return;
        }

        template <response_data R, typename... Args>
        auto use(
            stream& stream,
            std::function<R(Args...)>& fn
        ) -> ext::task<> {
            stream.response.send(std::apply(fn, extract<Args...>(stream)));
            co_return;
        }

        template <typename... Args>
        auto use(
            stream& stream,
            std::function<ext::task<>(Args...)>& fn
        ) -> ext::task<> {
            co_await std::apply(fn, extract<Args...>(stream));
        }

        template <response_data R, typename... Args>
        auto use(
            stream& stream,
            std::function<ext::task<R>(Args...)>& fn
        ) -> ext::task<> {
            stream.response.send(
                co_await std::apply(fn, extract<Args...>(stream))
            );
        }

        template <typename R, typename... Args>
        class function_handler : public server::handler {
            using function = std::function<R(Args...)>;

            function fn;
        public:
            function_handler(function&& fn) :
                fn(std::forward<function>(fn))
            {}

            auto handle(stream& stream) -> ext::task<> override {
                stream.advance(stage::handler_exec);
                co_await use(stream, fn);
            }
        };
    }

    template <typename F>
    auto make_handler(F&& f) -> handler_ptr {
        return handler_ptr(
            new detail::function_handler(std::function(std::forward<F>(f)))
        );
    }
}

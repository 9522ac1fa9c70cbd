#pragma once

#include "method_router.hpp"
#include "node.hpp"
#include "payload.hpp"

#include <exception>
#include <vector>

#define ARBOR_METHOD(name, str) \
    template <typename F> \
    auto name(std::string_view path, F&& f) -> router& { \
        return add(str, path, std::forward<F>(f)); \
    }

namespace arbor::server {
    using route_tree = node<method_router>;

    using callback = std::function<ext::task<>(stream&)>;

    using error_handler =
        std::function<ext::task<>(std::exception_ptr, stream&)>;

    struct route_match {
        handler_ptr handler;
        params_type params;
    };

    namespace detail {
        template <typename F>
        auto make_callback(F&& f) -> callback {
            if constexpr (std::is_void_v<std::invoke_result_t<F&, stream&>>) {
                return [fn = std::forward<F>(f)](stream& stream)
                    -> ext::task<>
                {
                    fn(stream);
                    co_return;
                };
            }
            else return callback(std::forward<F>(f));
        }

        template <typename F>
        auto make_error_handler(F&& f) -> error_handler {
            using result =
                std::invoke_result_t<F&, std::exception_ptr, stream&>;

            if constexpr (std::is_void_v<result>) {
                return [fn = std::forward<F>(f)](
                    std::exception_ptr exception,
                    stream& stream
                ) -> ext::task<> {
                    fn(exception, stream);
                    co_return;
                };
            }
            else return error_handler(std::forward<F>(f));
        }
    }

    /// Maps methods and paths to handlers and drives each request through
    /// middleware, lookup and the fallback policies.
    ///
    /// A router is configured first and served afterwards: once frozen,
    /// every mutating call throws.
    class router {
        route_tree routes;
        std::vector<callback> middleware;
        callback fallback;
        error_handler error_fn;
        bool is_frozen = false;

        auto dispatch(stream& stream) -> ext::task<>;

        auto ensure_mutable() const -> void;

        auto fail(stream& stream, std::exception_ptr exception)
            -> ext::task<>;
    public:
        router() = default;

        router(const router&) = delete;

        router(router&&) = default;

        auto operator=(const router&) -> router& = delete;

        auto operator=(router&&) -> router& = default;

        auto add(
            std::string_view method,
            std::string_view path,
            handler_ptr handler
        ) -> router&;

        template <typename F>
        requires (!std::convertible_to<F, handler_ptr>)
        auto add(
            std::string_view method,
            std::string_view path,
            F&& f
        ) -> router& {
            return add(method, path, make_handler(std::forward<F>(f)));
        }

        ARBOR_METHOD(del,     "DELETE")
        ARBOR_METHOD(get,     "GET")
        ARBOR_METHOD(head,    "HEAD")
        ARBOR_METHOD(options, "OPTIONS")
        ARBOR_METHOD(patch,   "PATCH")
        ARBOR_METHOD(put,     "PUT")

        /// Registers a handler taking `(stream&, T)` whose argument is
        /// parsed from a JSON request body.
        template <typename T, typename F>
        auto payload(
            std::string_view method,
            std::string_view path,
            F&& f,
            std::size_t max_size = default_body_limit
        ) -> router& {
            return add(
                method,
                path,
                make_payload_handler<T>(std::forward<F>(f), max_size)
            );
        }

        template <typename T = json, typename F>
        auto post(
            std::string_view path,
            F&& f,
            std::size_t max_size = default_body_limit
        ) -> router& {
            return payload<T>("POST", path, std::forward<F>(f), max_size);
        }

        /// Appends an interceptor that runs, in registration order, before
        /// every lookup.
        template <typename F>
        auto use(F&& f) -> router& {
            ensure_mutable();
            middleware.push_back(detail::make_callback(std::forward<F>(f)));
            return *this;
        }

        template <typename F>
        auto not_found(F&& f) -> router& {
            ensure_mutable();
            fallback = detail::make_callback(std::forward<F>(f));
            return *this;
        }

        template <typename F>
        auto on_error(F&& f) -> router& {
            ensure_mutable();
            error_fn = detail::make_error_handler(std::forward<F>(f));
            return *this;
        }

        auto find(std::string_view method, std::string_view path) const
            -> std::optional<route_match>;

        auto freeze() noexcept -> void;

        auto frozen() const noexcept -> bool;

        /// Copies every route of `other` into this router. Handlers already
        /// registered here for the same method and path are replaced.
        auto merge(const router& other) -> router&;

        /// Copies every route of `other` into this router beneath `prefix`.
        auto nest(std::string_view prefix, const router& other) -> router&;

        /// Handles one request. Returns false if the connection must be
        /// dropped instead of answered.
        auto route(stream& stream) -> ext::task<bool>;

        auto to_string() const -> std::string;
    };
}

#undef ARBOR_METHOD

#pragma once

#include "handler.hpp"

#include <arbor/json.hpp>

namespace arbor::server {
    /// The body cap applied to payload routes that do not name their own.
    extern const std::size_t default_body_limit;

    namespace detail {
        /// Checks the declared content type and length. Writes the rejection
        /// and returns false if the body must not be read.
        auto accept_payload(stream& stream, std::size_t max_size) -> bool;

        /// Collects the request body. Returns nothing, with the stream
        /// closed, once more than `max_size` bytes arrive.
        auto read_payload(stream& stream, std::size_t max_size)
            -> ext::task<std::optional<std::string>>;

        auto reject_payload(stream& stream, std::string_view reason) -> void;

        /// Answers a fault raised by the payload's own handler.
        auto handler_failed(stream& stream, std::string_view reason) -> void;

        template <typename T>
        auto parse_payload(stream& stream, const std::string& body)
            -> std::optional<T>
        {
            try {
                return json::parse(body).template get<T>();
            }
            catch (const std::exception& ex) {
                reject_payload(stream, ex.what());
            }

            return std::nullopt;
        }
    }

    /// Wraps a handler taking `(stream&, T)` so that it only runs for a
    /// JSON body of at most `max_size` bytes that converts to `T`.
    template <typename T, typename F>
    class payload_handler : public handler {
        F fn;
        std::size_t max_size;

        auto invoke(stream& stream, T&& value) -> ext::task<> {
            using result = std::invoke_result_t<F&, server::stream&, T&&>;

            if constexpr (std::is_void_v<result>) {
                fn(stream, std::forward<T>(value));
            }
            else if constexpr (std::same_as<result, ext::task<>>) {
                co_await fn(stream, std::forward<T>(value));
            }
            else if constexpr (response_data<result>) {
                stream.response.send(fn(stream, std::forward<T>(value)));
            }
            else {
                stream.response.send(
                    co_await fn(stream, std::forward<T>(value))
                );
            }

            co_return;
        }
    public:
        payload_handler(F fn, std::size_t max_size) :
            fn(std::move(fn)),
            max_size(max_size)
        {}

        auto handle(stream& stream) -> ext::task<> override {
            stream.advance(stage::body_parse);

            if (!detail::accept_payload(stream, max_size)) co_return;

            const auto body = co_await detail::read_payload(stream, max_size);
            if (!body) co_return;

            auto value = detail::parse_payload<T>(stream, *body);
            if (!value) co_return;

            stream.advance(stage::handler_exec);

            try {
                co_await invoke(stream, *std::move(value));
            }
            catch (const connection_aborted&) {
                throw;
            }
            catch (const std::exception& ex) {
                detail::handler_failed(stream, ex.what());
            }
            catch (...) {
                detail::handler_failed(stream, "unknown exception");
            }
        }
    };

    template <typename T, typename F>
    auto make_payload_handler(F&& f, std::size_t max_size) -> handler_ptr {
        return handler_ptr(new payload_handler<T, std::decay_t<F>>(
            std::forward<F>(f),
            max_size
        ));
    }
}

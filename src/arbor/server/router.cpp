#include <arbor/server/router.hpp>

#include <timber/timber>

namespace {
    namespace server = arbor::server;

    auto default_error(
        server::response& res,
        std::exception_ptr exception
    ) -> void {
        try {
            std::rethrow_exception(exception);
        }
        catch (const arbor::error_code& error) {
            server::reply(res, error.code(), error.what());
        }
        catch (...) {
            server::reply(res, 500, "Internal Server Error");
        }
    }
}

namespace arbor::server {
    auto router::add(
        std::string_view method,
        std::string_view path,
        handler_ptr handler
    ) -> router& {
        ensure_mutable();

        routes.insert(path).use(method, std::move(handler));
        TIMBER_DEBUG("Route added: {} {}", method, path);

        return *this;
    }

    auto router::dispatch(stream& stream) -> ext::task<> {
        stream.advance(stage::middleware);
        for (auto& fn : middleware) co_await fn(stream);

        stream.advance(stage::route_match);

        auto& request = stream.request;
        const auto target = std::string_view(request.target);
        const auto delim = target.find('?');

        request.path = target.substr(0, delim);
        request.query_string = delim == std::string_view::npos ?
            std::string_view() : target.substr(delim + 1);

        auto match = find(request.method, request.path);

        if (!match) {
            stream.advance(stage::not_found);

            TIMBER_DEBUG(
                "Request {}: no route for {} {}",
                stream.id,
                request.method,
                request.path
            );

            if (fallback) co_await fallback(stream);
            else reply(stream.response, 404, "Route Not Found");

            co_return;
        }

        stream.advance(stage::param_bind);

        request.params = std::move(match->params);
        request.query = parse_query(request.query_string);

        co_await match->handler->handle(stream);
    }

    auto router::ensure_mutable() const -> void {
        if (is_frozen) throw error("router is frozen while serving");
    }

    auto router::fail(
        stream& stream,
        std::exception_ptr exception
    ) -> ext::task<> {
        stream.advance(stage::error);
        stream.response = response();

        if (!error_fn) {
            default_error(stream.response, exception);
            co_return;
        }

        try {
            co_await error_fn(exception, stream);
            co_return;
        }
        catch (const std::exception& ex) {
            TIMBER_ERROR(
                "Request {}: error handler failed: {}",
                stream.id,
                ex.what()
            );
        }
        catch (...) {
            TIMBER_ERROR(
                "Request {}: error handler failed with an unknown exception",
                stream.id
            );
        }

        reply(stream.response, 500, "Internal Server Error");
    }

    auto router::find(
        std::string_view method,
        std::string_view path
    ) const -> std::optional<route_match> {
        auto match = routes.find(path);
        if (!match) return std::nullopt;

        auto handler = match->value->find(method);
        if (!handler) return std::nullopt;

        return route_match {
            .handler = std::move(handler),
            .params = std::move(match->params)
        };
    }

    auto router::freeze() noexcept -> void {
        is_frozen = true;
    }

    auto router::frozen() const noexcept -> bool {
        return is_frozen;
    }

    auto router::merge(const router& other) -> router& {
        ensure_mutable();
        routes.merge(other.routes);
        return *this;
    }

    auto router::nest(std::string_view prefix, const router& other)
        -> router&
    {
        ensure_mutable();

        while (prefix.ends_with('/')) prefix.remove_suffix(1);

        auto scratch = route_tree();

        other.routes.flatten([&](
            std::string_view path,
            const method_router& methods
        ) {
            if (methods.empty()) return;
            scratch.insert(fmt::format("{}{}", prefix, path)).merge(methods);
        });

        routes.merge(scratch);

        TIMBER_DEBUG("Routes nested under '{}'", prefix);
        return *this;
    }

    auto router::route(stream& stream) -> ext::task<bool> {
        auto exception = std::exception_ptr();

        try {
            co_await dispatch(stream);
        }
        catch (const connection_aborted&) {
            TIMBER_DEBUG("Request {} aborted", stream.id);
            co_return false;
        }
        catch (const std::exception& ex) {
            TIMBER_ERROR(
                "Request {}: {} {} failed in {}: {}",
                stream.id,
                stream.request.method,
                stream.request.target,
                stream.state,
                ex.what()
            );

            exception = std::current_exception();
        }
        catch (...) {
            TIMBER_ERROR(
                "Request {}: {} {} failed in {} with an unknown exception",
                stream.id,
                stream.request.method,
                stream.request.target,
                stream.state
            );

            exception = std::current_exception();
        }

        if (exception) co_await fail(stream, exception);

        co_return stream.open;
    }

    auto router::to_string() const -> std::string {
        return routes.to_string();
    }
}

#include <arbor/server/server.hpp>

#include <timber/timber>

namespace arbor::server {
    context::context() : router(nullptr) {}

    context::context(arbor::server::router& router) :
        context(router, options())
    {}

    context::context(
        arbor::server::router& router,
        const options& opts
    ) :
        opts(opts),
        router(&router)
    {
        router.freeze();

        TIMBER_DEBUG("Serving routes:\n{}", router.to_string());
    }

    auto context::connection(netcore::socket&& client) -> ext::task<> {
        if (!router) throw error("server context has no router");

        auto session = arbor::server::session(
            std::forward<netcore::socket>(client),
            *router,
            opts
        );

        sessions.link(session);

        co_await session.handle_connection();
    }

    auto context::shutdown() -> void {
        TIMBER_DEBUG("HTTP server shutdown requested");
        sessions.close();
    }
}

#pragma once

#include "session.hpp"

namespace arbor::server {
    class context {
        options opts;
        server::router* router;
        session sessions;
    public:
        context();

        /// Freezes `router`; its routes cannot change while it is served.
        context(server::router& router);

        context(server::router& router, const options& opts);

        auto connection(netcore::socket&& client) -> ext::task<>;

        auto shutdown() -> void;
    };

    using server = netcore::server<context>;
    using server_list = netcore::server_list<context>;
}

#include <arbor/arbor>

#include <fstream>
#include <sstream>
#include <timber/timber>

namespace fs = std::filesystem;
namespace server = arbor::server;
namespace extractor = arbor::server::extractor;

using arbor::json;

namespace {
    const auto continents = std::vector<std::string> {
        "Africa",
        "Antarctica",
        "Asia",
        "Australia",
        "Europe",
        "North America",
        "South America"
    };

    auto greeting() -> std::string {
        return "Server says hello to Client!";
    }

    auto read_file(const fs::path& path) -> std::string {
        auto file = std::ifstream(path);
        if (!file) throw arbor::error("failed to read '{}'", path.native());

        auto buffer = std::ostringstream();
        buffer << file.rdbuf();

        return buffer.str();
    }

    /// Serves the page with its data embedded as JSON.
    class index_page : public server::handler {
        std::string view;
    public:
        index_page(std::string view) : view(std::move(view)) {}

        auto handle(server::stream& stream) -> ext::task<> override {
            stream.advance(server::stage::handler_exec);

            auto page = fmt::format(
                fmt::runtime(view),
                fmt::arg("greeting", json(greeting()).dump()),
                fmt::arg("continents", json(continents).dump())
            );

            stream.response.send(std::move(page));
            stream.response.content_type(arbor::media::html());

            co_return;
        }
    };

    auto api() -> server::router {
        auto router = server::router();

        router.get("/continents", []() -> json { return continents; });

        router.get("/continents/:index", [](
            extractor::path<"index", std::size_t> index
        ) -> std::optional<json> {
            if (*index >= continents.size()) return std::nullopt;
            return json(continents[*index]);
        });

        router.post("/echo", [](server::stream&, json body) -> json {
            return json {{"received", std::move(body)}};
        });

        return router;
    }
}

auto main(int argc, char** argv) -> int {
    const auto root = fs::path(ARBOR_EXAMPLE_DIR);
    const auto endpoint = std::string(argc > 1 ? argv[1] : "127.0.0.1:5000");

    auto app = server::router();

    app.use([](server::stream& stream) {
        TIMBER_DEBUG("{} {}", stream.request.method, stream.request.target);
    });

    server::serve_static(app, server::static_files {
        .root = root / "static",
        .mount = "/static"
    });

    app.add(
        "GET",
        "/",
        std::make_shared<index_page>(read_file(root / "views/index.html"))
    );

    app.nest("/api", api());

    app.on_error([](std::exception_ptr, server::stream& stream) {
        stream.response.status = 500;
        stream.response.send("Something went wrong");
    });

    fmt::print("{}", app.to_string());

    netcore::run([&]() -> ext::task<> {
        auto listener = server::server(app);

        fmt::print("App @ http://{}\n", endpoint);
        co_await listener.listen(netcore::endpoint::parse(endpoint));
    }());
}

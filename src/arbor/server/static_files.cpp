#include <arbor/server/static_files.hpp>

#include <algorithm>
#include <cerrno>
#include <fcntl.h>
#include <system_error>
#include <timber/timber>

namespace fs = std::filesystem;

namespace {
    namespace server = arbor::server;

    class file_handler : public server::handler {
        fs::path path;
        std::string content_type;
    public:
        file_handler(fs::path path, std::string content_type) :
            path(std::move(path)),
            content_type(std::move(content_type))
        {}

        auto handle(server::stream& stream) -> ext::task<> override {
            stream.advance(server::stage::handler_exec);

            if (!fs::is_regular_file(path)) {
                TIMBER_DEBUG(
                    "Request {}: {} is no longer a regular file",
                    stream.id,
                    path.native()
                );

                server::reply(stream.response, 404, "Not Found");
                co_return;
            }

            const auto size = fs::file_size(path);
            const auto descriptor = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);

            if (descriptor == -1) {
                throw std::system_error(
                    errno,
                    std::generic_category(),
                    fmt::format("failed to open '{}'", path.native())
                );
            }

            TIMBER_TRACE(
                "Request {}: serving {} ({:L} bytes) from fd ({})",
                stream.id,
                path.native(),
                size,
                descriptor
            );

            stream.response.send(server::file {
                .fd = netcore::fd(descriptor),
                .size = size,
                .content_type = content_type
            });
        }
    };
}

namespace arbor::server {
    auto serve_static(router& router, const static_files& files)
        -> std::size_t {
        auto mount = std::string_view(files.mount);
        while (mount.ends_with('/')) mount.remove_suffix(1);

        auto count = std::size_t(0);

        for (const auto& entry : fs::recursive_directory_iterator(files.root)) {
            if (!entry.is_regular_file()) continue;

            const auto path = entry.path().lexically_relative(files.root);
            const auto relative = path.generic_string();

            const auto capture = std::any_of(
                path.begin(),
                path.end(),
                [](const fs::path& part) {
                    return part.native().starts_with(':');
                }
            );

            if (capture) {
                TIMBER_DEBUG(
                    "Skipping static file '{}': a path segment starting "
                    "with ':' would be a capture",
                    relative
                );
                continue;
            }

            const auto& type =
                media::from_extension(entry.path().extension().native());

            router.add(
                "GET",
                fmt::format("{}/{}", mount, relative),
                handler_ptr(new file_handler(
                    entry.path(),
                    std::string(type.str())
                ))
            );

            ++count;
        }

        TIMBER_DEBUG(
            "Serving {} static file{} from {} at '{}/'",
            count,
            count == 1 ? "" : "s",
            files.root.native(),
            mount
        );

        return count;
    }
}

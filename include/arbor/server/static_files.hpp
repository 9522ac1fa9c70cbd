#pragma once

#include "router.hpp"

#include <filesystem>

namespace arbor::server {
    /// A directory served read-only beneath a URL prefix.
    struct static_files {
        std::filesystem::path root;
        std::string mount;
    };

    /// Registers one GET route per regular file found under `files.root`.
    /// The route path is the file's path relative to the root, joined to
    /// the mount point. Files with a path segment starting with ':' are
    /// skipped. Returns the number of routes added.
    auto serve_static(router& router, const static_files& files)
        -> std::size_t;
}

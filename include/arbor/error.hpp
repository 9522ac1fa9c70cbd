#pragma once

#include <fmt/core.h>
#include <stdexcept>
#include <string>
#include <string_view>

namespace arbor {
    /// Base of the exceptions raised by arbor.
    class error : public std::runtime_error {
    public:
        error(std::string_view message) :
            std::runtime_error(std::string(message))
        {}

        template <typename... Args>
        error(fmt::format_string<Args...> format, Args&&... args) :
            std::runtime_error(fmt::format(format, std::forward<Args>(args)...))
        {}
    };

    /// An error answered with its own HTTP status and message.
    class error_code : public error {
        int status;
    public:
        error_code(int status, std::string_view message) :
            error(message),
            status(status)
        {}

        template <typename... Args>
        error_code(
            int status,
            fmt::format_string<Args...> format,
            Args&&... args
        ) :
            error(format, std::forward<Args>(args)...),
            status(status)
        {}

        auto code() const noexcept -> int {
            return status;
        }
    };

    /// Raised when the peer goes away while a request is still in flight.
    struct connection_aborted : std::exception {
        auto what() const noexcept -> const char* override {
            return "Connection aborted";
        }
    };
}

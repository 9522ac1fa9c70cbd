#pragma once

#include <arbor/error.hpp>

#include <fmt/format.h>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace arbor::server {
    using params_type = std::unordered_map<std::string_view, std::string_view>;

    template <typename T>
    struct match {
        const T* value;
        params_type params;
    };

    /// Splits a route or request path into segments. A single leading slash
    /// is dropped; "/" is one empty segment and "" is no segments at all.
    inline auto segments(std::string_view path) -> std::vector<std::string_view> {
        auto result = std::vector<std::string_view>();

        if (path.empty()) return result;
        if (path.front() == '/') path.remove_prefix(1);

        while (true) {
            const auto slash = path.find('/');
            result.push_back(path.substr(0, slash));

            if (slash == std::string_view::npos) break;
            path.remove_prefix(slash + 1);
        }

        return result;
    }

    /// One segment position in a route tree. Literal children are keyed by
    /// their segment text; a node has at most one capture child, bound to a
    /// single parameter name.
    template <typename T>
    class node {
        T val;
        std::map<std::string, std::unique_ptr<node>, std::less<>> children;
        std::unique_ptr<node> capture;
        std::string capture_name;

        static auto capture_of(std::string_view segment)
            -> std::optional<std::string_view>
        {
            if (!segment.starts_with(':')) return std::nullopt;

            segment.remove_prefix(1);
            if (segment.empty()) throw error("empty capture name");

            return segment;
        }

        [[noreturn]]
        static auto collision(
            std::string_view existing,
            std::string_view incoming
        ) -> void {
            throw error(
                "capture collision: ':{}' conflicts with ':{}'",
                incoming,
                existing
            );
        }

        auto check(const std::vector<std::string_view>& route) const -> void {
            const auto* current = this;

            for (const auto segment : route) {
                if (const auto name = capture_of(segment)) {
                    if (!current->capture) return;

                    if (current->capture_name != *name) {
                        collision(current->capture_name, *name);
                    }

                    current = current->capture.get();
                    continue;
                }

                const auto child = current->children.find(segment);
                if (child == current->children.end()) return;

                current = child->second.get();
            }
        }

        auto check(const node& other) const -> void {
            if (other.capture && capture) {
                if (capture_name != other.capture_name) {
                    collision(capture_name, other.capture_name);
                }

                capture->check(*other.capture);
            }

            for (const auto& [segment, child] : other.children) {
                const auto mine = children.find(segment);
                if (mine != children.end()) mine->second->check(*child);
            }
        }

        auto merge_unchecked(const node& other) -> void {
            val.merge(other.val);

            for (const auto& [segment, child] : other.children) {
                auto& mine = children[segment];
                if (!mine) mine = std::make_unique<node>();
                mine->merge_unchecked(*child);
            }

            if (other.capture) {
                if (!capture) {
                    capture = std::make_unique<node>();
                    capture_name = other.capture_name;
                }

                capture->merge_unchecked(*other.capture);
            }
        }

        auto format_to(
            std::back_insert_iterator<fmt::memory_buffer>& out,
            std::string_view label,
            int level
        ) const -> void {
            for (auto i = 0; i < level * 2; ++i) fmt::format_to(out, " ");

            fmt::format_to(out, "{}", label);
            if (!val.empty()) fmt::format_to(out, " [{}]", val);
            fmt::format_to(out, "\n");

            for (const auto& [segment, child] : children) {
                child->format_to(
                    out,
                    segment.empty() ? std::string_view("/") : segment,
                    level + 1
                );
            }

            if (capture) {
                capture->format_to(
                    out,
                    fmt::format(":{}", capture_name),
                    level + 1
                );
            }
        }
    public:
        auto value() noexcept -> T& { return val; }

        auto value() const noexcept -> const T& { return val; }

        /// Resolves `path` with literal segments taking precedence over the
        /// capture. The walk commits to the first candidate at each level and
        /// never backtracks.
        auto find(std::string_view path) const -> std::optional<match<T>> {
            const auto* current = this;
            auto params = params_type();

            for (const auto segment : segments(path)) {
                const auto child = current->children.find(segment);

                if (child != current->children.end()) {
                    current = child->second.get();
                }
                else if (current->capture) {
                    params.insert_or_assign(current->capture_name, segment);
                    current = current->capture.get();
                }
                else return std::nullopt;
            }

            return match<T> {
                .value = &current->val,
                .params = std::move(params)
            };
        }

        /// Creates every missing node along `route` and returns the value of
        /// the terminal node.
        auto insert(std::string_view route) -> T& {
            const auto tokens = segments(route);

            for (const auto segment : tokens) capture_of(segment);
            check(tokens);

            auto* current = this;

            for (const auto segment : tokens) {
                if (const auto name = capture_of(segment)) {
                    if (!current->capture) {
                        current->capture = std::make_unique<node>();
                        current->capture_name = *name;
                    }

                    current = current->capture.get();
                    continue;
                }

                auto child = current->children.find(segment);
                if (child == current->children.end()) {
                    child = current->children.emplace(
                        std::string(segment),
                        std::make_unique<node>()
                    ).first;
                }

                current = child->second.get();
            }

            return current->val;
        }

        /// Unions `other` into this tree. Nothing is modified if any capture
        /// name in `other` disagrees with one already present here.
        auto merge(const node& other) -> void {
            check(other);
            merge_unchecked(other);
        }

        /// Calls `f(route, value)` for every node, with captures written back
        /// as ":name" segments.
        template <typename F>
        auto flatten(F&& f, const std::string& prefix = "") const -> void {
            f(std::string_view(prefix), val);

            for (const auto& [segment, child] : children) {
                child->flatten(f, fmt::format("{}/{}", prefix, segment));
            }

            if (capture) {
                capture->flatten(
                    f,
                    fmt::format("{}/:{}", prefix, capture_name)
                );
            }
        }

        auto to_string() const -> std::string {
            auto buffer = fmt::memory_buffer();
            auto out = std::back_inserter(buffer);

            format_to(out, "(root)", 0);

            return fmt::to_string(buffer);
        }
    };
}

#include <arbor/server/node.hpp>

#include <gtest/gtest.h>

using arbor::server::segments;

namespace {
    struct label {
        std::string text;

        auto empty() const noexcept -> bool { return text.empty(); }

        auto merge(const label& other) -> void {
            if (!other.text.empty()) text = other.text;
        }
    };

    using tree = arbor::server::node<label>;
}

TEST(Segments, EmptyPath) {
    EXPECT_TRUE(segments("").empty());
}

TEST(Segments, Slash) {
    const auto result = segments("/");

    ASSERT_EQ(1, result.size());
    EXPECT_EQ("", result[0]);
}

TEST(Segments, Split) {
    const auto result = segments("/users/:id/");

    ASSERT_EQ(3, result.size());
    EXPECT_EQ("users", result[0]);
    EXPECT_EQ(":id", result[1]);
    EXPECT_EQ("", result[2]);
}

TEST(Segments, EmptyInnerSegment) {
    const auto result = segments("/a//b");

    ASSERT_EQ(3, result.size());
    EXPECT_EQ("", result[1]);
}

TEST(Node, InsertReturnsTerminalValue) {
    auto root = tree();

    root.insert("/a/b").text = "ab";
    root.insert("/a").text = "a";

    EXPECT_EQ("ab", root.find("/a/b")->value->text);
    EXPECT_EQ("a", root.find("/a")->value->text);
    EXPECT_TRUE(root.find("/a")->params.empty());
}

TEST(Node, IntermediateNodesMatchWithEmptyValue) {
    auto root = tree();
    root.insert("/a/b").text = "ab";

    const auto match = root.find("/a");

    ASSERT_TRUE(match);
    EXPECT_TRUE(match->value->empty());
}

TEST(Node, CaptureBindsSegment) {
    auto root = tree();
    root.insert("/files/:name").text = "file";

    const auto match = root.find("/files/report.pdf");

    ASSERT_TRUE(match);
    EXPECT_EQ("file", match->value->text);
    EXPECT_EQ("report.pdf", match->params.at("name"));
}

TEST(Node, CaptureMatchesEmptySegment) {
    auto root = tree();
    root.insert("/files/:name").text = "file";

    const auto match = root.find("/files/");

    ASSERT_TRUE(match);
    EXPECT_EQ("", match->params.at("name"));
}

TEST(Node, MissingSegment) {
    auto root = tree();
    root.insert("/a").text = "a";

    EXPECT_FALSE(root.find("/b"));
    EXPECT_FALSE(root.find("/a/b"));
}

TEST(Node, MergeCopiesStructure) {
    auto root = tree();
    root.insert("/a").text = "a";

    auto other = tree();
    other.insert("/a").text = "other a";
    other.insert("/b/:id/c").text = "c";

    root.merge(other);

    EXPECT_EQ("other a", root.find("/a")->value->text);
    EXPECT_EQ("c", root.find("/b/1/c")->value->text);

    other.insert("/b/:id/c").text = "changed";
    EXPECT_EQ("c", root.find("/b/1/c")->value->text);
}

TEST(Node, MergeCollision) {
    auto root = tree();
    root.insert("/x/:a/y").text = "y";

    auto other = tree();
    other.insert("/x/:b").text = "b";

    EXPECT_THROW(root.merge(other), arbor::error);
    EXPECT_EQ("", root.find("/x/1")->value->text);
}

TEST(Node, FlattenRegeneratesCaptures) {
    auto root = tree();
    root.insert("").text = "root";
    root.insert("/a/:id").text = "id";
    root.insert("/a/:id/b").text = "b";

    auto routes = std::vector<std::pair<std::string, std::string>>();

    root.flatten([&](std::string_view path, const label& value) {
        if (!value.empty()) routes.emplace_back(path, value.text);
    });

    ASSERT_EQ(3, routes.size());
    EXPECT_EQ("", routes[0].first);
    EXPECT_EQ("/a/:id", routes[1].first);
    EXPECT_EQ("id", routes[1].second);
    EXPECT_EQ("/a/:id/b", routes[2].first);
}

#include "testing.hpp"

using arbor::server::make_handler;
using arbor::server::router;
using arbor::server::stream;

namespace {
    auto noop() -> arbor::server::handler_ptr {
        return make_handler([](stream&) {});
    }
}

class RouterTest : public testing::Test {
protected:
    router app;
};

TEST_F(RouterTest, LiteralLookup) {
    const auto handler = noop();
    app.add("GET", "/users", handler);

    const auto match = app.find("GET", "/users");

    ASSERT_TRUE(match);
    EXPECT_EQ(handler, match->handler);
    EXPECT_TRUE(match->params.empty());
}

TEST_F(RouterTest, CaptureExtraction) {
    app.add("GET", "/users/:id/posts/:post", noop());

    const auto match = app.find("GET", "/users/42/posts/7");

    ASSERT_TRUE(match);
    ASSERT_EQ(2, match->params.size());
    EXPECT_EQ("42", match->params.at("id"));
    EXPECT_EQ("7", match->params.at("post"));
}

TEST_F(RouterTest, LastWriteWins) {
    const auto first = noop();
    const auto second = noop();

    app.add("GET", "/x", first);
    app.add("GET", "/x", second);

    const auto match = app.find("GET", "/x");

    ASSERT_TRUE(match);
    EXPECT_EQ(second, match->handler);
    EXPECT_NE(first, match->handler);
}

TEST_F(RouterTest, LiteralBeatsCapture) {
    const auto me = noop();
    const auto user = noop();

    app.add("GET", "/users/:id", user);
    app.add("GET", "/users/me", me);

    const auto literal = app.find("GET", "/users/me");
    ASSERT_TRUE(literal);
    EXPECT_EQ(me, literal->handler);
    EXPECT_TRUE(literal->params.empty());

    const auto captured = app.find("GET", "/users/7");
    ASSERT_TRUE(captured);
    EXPECT_EQ(user, captured->handler);
    EXPECT_EQ("7", captured->params.at("id"));
}

TEST_F(RouterTest, LookupDoesNotBacktrack) {
    app.add("GET", "/a/b/c", noop());
    app.add("GET", "/a/:x/d", noop());

    EXPECT_FALSE(app.find("GET", "/a/b/d"));
    EXPECT_TRUE(app.find("GET", "/a/z/d"));
}

TEST_F(RouterTest, MethodMismatchIsMiss) {
    app.get("/items", [](stream&) {});

    EXPECT_TRUE(app.find("GET", "/items"));
    EXPECT_FALSE(app.find("POST", "/items"));
    EXPECT_FALSE(app.find("GET", "/items/1"));
    EXPECT_FALSE(app.find("GET", "/"));
}

TEST_F(RouterTest, RegistrarMethods) {
    app
        .del("/r", [](stream&) {})
        .head("/r", [](stream&) {})
        .options("/r", [](stream&) {})
        .patch("/r", [](stream&) {})
        .put("/r", [](stream&) {})
        .add("PROPFIND", "/r", [](stream&) {});

    for (const auto* method : {
        "DELETE", "HEAD", "OPTIONS", "PATCH", "PUT", "PROPFIND"
    }) {
        EXPECT_TRUE(app.find(method, "/r")) << method;
    }

    EXPECT_FALSE(app.find("GET", "/r"));
}

TEST_F(RouterTest, RootAndSlashAreDistinct) {
    const auto root = noop();
    const auto slash = noop();

    app.add("GET", "", root);
    app.add("GET", "/", slash);

    EXPECT_EQ(root, app.find("GET", "")->handler);
    EXPECT_EQ(slash, app.find("GET", "/")->handler);
}

TEST_F(RouterTest, TrailingSlashIsASegment) {
    app.get("/docs", [](stream&) {});

    EXPECT_TRUE(app.find("GET", "/docs"));
    EXPECT_FALSE(app.find("GET", "/docs/"));
}

TEST_F(RouterTest, CaptureCollision) {
    app.add("GET", "/users/:id", noop());

    EXPECT_THROW(app.add("GET", "/users/:name", noop()), arbor::error);
    EXPECT_NO_THROW(app.add("PUT", "/users/:id", noop()));
}

TEST_F(RouterTest, EmptyCaptureName) {
    EXPECT_THROW(app.add("GET", "/users/:", noop()), arbor::error);
}

TEST_F(RouterTest, RejectedInsertLeavesTreeUnchanged) {
    app.add("GET", "/p/:a", noop());

    EXPECT_THROW(app.add("GET", "/p/:b/q", noop()), arbor::error);
    EXPECT_THROW(app.add("GET", "/fresh/:", noop()), arbor::error);

    EXPECT_TRUE(app.find("GET", "/p/1"));
    EXPECT_FALSE(app.find("GET", "/p/1/q"));
    EXPECT_EQ(std::string::npos, app.to_string().find("fresh"));
}

TEST_F(RouterTest, Merge) {
    const auto a = noop();
    const auto old_shared = noop();
    const auto b = noop();
    const auto new_shared = noop();

    app.add("GET", "/a", a);
    app.add("GET", "/shared", old_shared);

    auto other = router();
    other.add("GET", "/b/:id", b);
    other.add("GET", "/shared", new_shared);

    app.merge(other);

    EXPECT_EQ(a, app.find("GET", "/a")->handler);
    EXPECT_EQ(b, app.find("GET", "/b/1")->handler);
    EXPECT_EQ(new_shared, app.find("GET", "/shared")->handler);

    EXPECT_FALSE(other.find("GET", "/a"));
    EXPECT_EQ(new_shared, other.find("GET", "/shared")->handler);
}

TEST_F(RouterTest, MergeIsIndependentOfSource) {
    auto other = router();
    other.get("/b", [](stream&) {});

    app.merge(other);
    other.get("/b/later", [](stream&) {});

    EXPECT_TRUE(app.find("GET", "/b"));
    EXPECT_FALSE(app.find("GET", "/b/later"));
}

TEST_F(RouterTest, MergeCollisionIsAtomic) {
    app.add("GET", "/u/:id", noop());

    auto other = router();
    other.add("GET", "/new", noop());
    other.add("GET", "/u/:name", noop());

    EXPECT_THROW(app.merge(other), arbor::error);
    EXPECT_FALSE(app.find("GET", "/new"));
    EXPECT_TRUE(app.find("GET", "/u/1"));
}

TEST_F(RouterTest, Nest) {
    const auto user = noop();

    auto api = router();
    api.add("GET", "/users/:id", user);

    app.nest("/api/", api);

    const auto match = app.find("GET", "/api/users/5");
    ASSERT_TRUE(match);
    EXPECT_EQ(user, match->handler);
    EXPECT_EQ("5", match->params.at("id"));

    const auto source = api.find("GET", "/users/5");
    ASSERT_TRUE(source);
    EXPECT_EQ(user, source->handler);

    api.get("/later", [](stream&) {});
    EXPECT_FALSE(app.find("GET", "/api/later"));
    EXPECT_FALSE(app.find("GET", "/users/5"));
}

TEST_F(RouterTest, NestRootRoutes) {
    const auto root = noop();
    const auto slash = noop();

    auto api = router();
    api.add("GET", "", root);
    api.add("GET", "/", slash);

    app.nest("/api", api);

    EXPECT_EQ(root, app.find("GET", "/api")->handler);
    EXPECT_EQ(slash, app.find("GET", "/api/")->handler);
}

TEST_F(RouterTest, NestKeepsExistingRoutes) {
    const auto mine = noop();
    app.add("GET", "/api/status", mine);

    auto api = router();
    api.get("/users", [](stream&) {});

    app.nest("/api", api);

    EXPECT_EQ(mine, app.find("GET", "/api/status")->handler);
    EXPECT_TRUE(app.find("GET", "/api/users"));
}

TEST_F(RouterTest, FrozenRouterRejectsChanges) {
    app.get("/", [](stream&) {});
    app.freeze();

    auto other = router();

    EXPECT_TRUE(app.frozen());
    EXPECT_THROW(app.get("/x", [](stream&) {}), arbor::error);
    EXPECT_THROW(app.merge(other), arbor::error);
    EXPECT_THROW(app.nest("/n", other), arbor::error);
    EXPECT_THROW(app.use([](stream&) {}), arbor::error);
    EXPECT_TRUE(app.find("GET", "/"));
}

TEST_F(RouterTest, ToString) {
    app.get("/users/:id", [](stream&) {});
    app.put("/users/:id", [](stream&) {});
    app.get("/about", [](stream&) {});

    const auto tree = app.to_string();

    EXPECT_NE(std::string::npos, tree.find(":id [GET, PUT]"));
    EXPECT_NE(std::string::npos, tree.find("about [GET]"));
    EXPECT_TRUE(tree.starts_with("(root)\n"));
}

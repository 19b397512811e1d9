#include "core/auth/LoopbackRedirectListener.hpp"
#include "utils/HttpClient.hpp"

#include <gtest/gtest.h>

#include <chrono>

using craftkit::core::auth::LoopbackRedirectListener;
using craftkit::utils::HttpClient;

TEST(LoopbackListenerTest, ParsesRedirectUri) {
    auto endpoint = LoopbackRedirectListener::parseRedirectUri("http://127.0.0.1:8080/callback");
    EXPECT_EQ(endpoint.host, "127.0.0.1");
    EXPECT_EQ(endpoint.port, 8080);
    EXPECT_EQ(endpoint.path, "/callback");

    auto bare = LoopbackRedirectListener::parseRedirectUri("http://localhost");
    EXPECT_EQ(bare.host, "localhost");
    EXPECT_EQ(bare.port, 80);
    EXPECT_EQ(bare.path, "/");

    auto withQuery = LoopbackRedirectListener::parseRedirectUri("http://localhost:9000/cb?x=1");
    EXPECT_EQ(withQuery.path, "/cb");
}

TEST(LoopbackListenerTest, RejectsUnusableRedirectUri) {
    EXPECT_THROW(LoopbackRedirectListener::parseRedirectUri("https://127.0.0.1:8080/callback"),
                 std::invalid_argument);
    EXPECT_THROW(LoopbackRedirectListener::parseRedirectUri("http://127.0.0.1:http/callback"),
                 std::invalid_argument);
    EXPECT_THROW(LoopbackRedirectListener::parseRedirectUri("http://:8080/callback"),
                 std::invalid_argument);
    EXPECT_THROW(LoopbackRedirectListener::parseRedirectUri("http://127.0.0.1:70000/"),
                 std::invalid_argument);
}

TEST(LoopbackListenerTest, CapturesFirstRedirectQuery) {
    const std::string redirectUri = "http://127.0.0.1:53682/callback";
    LoopbackRedirectListener listener;

    auto future = listener.start(redirectUri);
    EXPECT_TRUE(listener.isRunning());
    EXPECT_THROW(listener.start(redirectUri), std::logic_error);

    HttpClient http;
    auto response = http.get(redirectUri + "?code=M.abc-123&state=NOT_NEEDED");
    EXPECT_EQ(response.statusCode, 200);

    ASSERT_EQ(future.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    auto query = future.get();
    ASSERT_TRUE(query.has_value());

    auto params = HttpClient::parseQueryString(*query);
    EXPECT_EQ(params["code"], "M.abc-123");
    EXPECT_EQ(params["state"], "NOT_NEEDED");

    listener.stop();
    EXPECT_FALSE(listener.isRunning());
    listener.stop();
}

TEST(LoopbackListenerTest, RedirectWithoutQueryYieldsNothing) {
    const std::string redirectUri = "http://127.0.0.1:53683/callback";
    LoopbackRedirectListener listener;

    auto future = listener.start(redirectUri);
    HttpClient http;
    http.get(redirectUri);

    ASSERT_EQ(future.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    EXPECT_FALSE(future.get().has_value());
}

TEST(LoopbackListenerTest, StopRightAfterStartReleasesThePort) {
    const std::string redirectUri = "http://127.0.0.1:53684/callback";
    LoopbackRedirectListener listener;

    for (int i = 0; i < 20; ++i) {
        auto future = listener.start(redirectUri);
        listener.stop();
        EXPECT_FALSE(listener.isRunning());
    }
}

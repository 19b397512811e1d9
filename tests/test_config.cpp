#include "core/Config.hpp"
#include "core/auth/AuthSettings.hpp"
#include "TestSupport.hpp"

#include <gtest/gtest.h>

using craftkit::core::Config;
using craftkit::core::auth::AuthSettings;
using craftkit::test::TempDir;
using craftkit::test::writeFile;

TEST(ConfigTest, DefaultsAreAvailableWithoutAFile) {
    Config config;

    EXPECT_TRUE(config.getAll() == Config::defaults());
    EXPECT_TRUE(config.path().empty());
    EXPECT_EQ(config.get<std::string>("auth.redirectUri"), "http://127.0.0.1:8080/callback");
    EXPECT_EQ(config.get<std::string>("auth.cacheFile"), "msa-auth.json");
    EXPECT_EQ(config.get<int>("auth.loginTimeoutSeconds"), 300);
    EXPECT_EQ(config.get<int>("http.timeoutSeconds"), 30);
    EXPECT_EQ(config.get<std::string>("instances.root"), "instances");
    EXPECT_EQ(config.get<std::string>("log.level"), "info");
}

TEST(ConfigTest, LoadOverlaysDefaults) {
    TempDir dir;
    writeFile(dir / "craftkit.json", R"({"auth":{"clientId":"my-app"},"log":{"level":"debug"}})");

    Config config;
    ASSERT_TRUE(config.load((dir / "craftkit.json").string()));
    EXPECT_EQ(config.path().string(), (dir / "craftkit.json").string());

    EXPECT_EQ(config.get<std::string>("auth.clientId"), "my-app");
    EXPECT_EQ(config.get<std::string>("log.level"), "debug");
    // Siblings of overridden keys keep their defaults
    EXPECT_EQ(config.get<std::string>("auth.cacheFile"), "msa-auth.json");
    EXPECT_EQ(config.get<std::string>("log.directory"), "logs");
}

TEST(ConfigTest, LoadRejectsMissingOrMalformedFiles) {
    TempDir dir;
    Config config;

    EXPECT_FALSE(config.load((dir / "absent.json").string()));

    writeFile(dir / "bad.json", "{ nope");
    EXPECT_FALSE(config.load((dir / "bad.json").string()));

    writeFile(dir / "array.json", "[1, 2, 3]");
    EXPECT_FALSE(config.load((dir / "array.json").string()));
    EXPECT_EQ(config.get<int>("http.timeoutSeconds"), 30);
}

TEST(ConfigTest, GetFallsBackOnMissingKeyOrWrongType) {
    Config config;

    EXPECT_EQ(config.get<int>("no.such.key", 7), 7);
    EXPECT_EQ(config.get<int>("auth.redirectUri", 7), 7);
    EXPECT_FALSE(config.has("no.such.key"));
    EXPECT_TRUE(config.has("auth.clientId"));
}

TEST(ConfigTest, SetThenSaveRoundTrips) {
    TempDir dir;
    Config config;
    config.set("auth.clientId", std::string("saved-client"));
    config.set("instances.root", std::string("/srv/instances"));
    ASSERT_TRUE(config.save((dir / "sub" / "craftkit.json").string()));

    Config reloaded;
    ASSERT_TRUE(reloaded.load((dir / "sub" / "craftkit.json").string()));
    EXPECT_EQ(reloaded.get<std::string>("auth.clientId"), "saved-client");
    EXPECT_EQ(reloaded.get<std::string>("instances.root"), "/srv/instances");
}

TEST(ConfigTest, AuthSettingsReadsTypedView) {
    Config config;
    config.merge({{"auth", {{"clientId", "abc"}, {"loginTimeoutSeconds", 0}}},
                  {"http", {{"timeoutSeconds", 5}, {"userAgent", "Test/2"}}}});

    auto settings = AuthSettings::fromConfig(config);

    EXPECT_EQ(settings.clientId, "abc");
    EXPECT_EQ(settings.redirectUri, "http://127.0.0.1:8080/callback");
    EXPECT_EQ(settings.loginTimeout.count(), 0);
    EXPECT_EQ(settings.http.timeoutSeconds, 5);
    EXPECT_EQ(settings.http.userAgent, "Test/2");
}

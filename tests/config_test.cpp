#include <gtest/gtest.h>
#include <map>
#include <memory>
#include <string>
#include "tapcore/config.hpp"
#include "tapcore/errors.hpp"

using namespace tapcore;

namespace {

ServerConfig::EnvLookup env(std::map<std::string, std::string> values) {
    auto shared = std::make_shared<std::map<std::string, std::string>>(std::move(values));
    return [shared](const char* name) -> const char* {
        auto it = shared->find(name);
        return it == shared->end() ? nullptr : it->second.c_str();
    };
}

} // anonymous namespace

TEST(ServerConfigTest, MissingBotToken_ShouldBeFatal) {
    EXPECT_THROW(ServerConfig::from_env(env({})), ConfigError);
    EXPECT_THROW(ServerConfig::from_env(env({{"BOT_TOKEN", ""}})), ConfigError);
}

TEST(ServerConfigTest, Defaults_ShouldApplyWhenOptionalSettingsAbsent) {
    auto config = ServerConfig::from_env(env({{"BOT_TOKEN", "secret"}}));

    EXPECT_EQ(config.bot_token, "secret");
    EXPECT_EQ(config.port, ServerConfig::DEFAULT_PORT);
    EXPECT_EQ(config.client_origin, "*");
    EXPECT_EQ(config.listen_address(), "0.0.0.0:50600");
}

TEST(ServerConfigTest, ExplicitSettings_ShouldOverrideDefaults) {
    auto config = ServerConfig::from_env(env({
        {"BOT_TOKEN", "secret"},
        {"PORT", "8081"},
        {"CLIENT_ORIGIN", "https://game.example.org"},
    }));

    EXPECT_EQ(config.port, 8081);
    EXPECT_EQ(config.client_origin, "https://game.example.org");
}

TEST(ServerConfigTest, MalformedPort_ShouldBeRejected) {
    EXPECT_THROW(ServerConfig::from_env(env({{"BOT_TOKEN", "s"}, {"PORT", "http"}})), ConfigError);
    EXPECT_THROW(ServerConfig::from_env(env({{"BOT_TOKEN", "s"}, {"PORT", "80a"}})), ConfigError);
    EXPECT_THROW(ServerConfig::from_env(env({{"BOT_TOKEN", "s"}, {"PORT", "70000"}})), ConfigError);
    EXPECT_THROW(ServerConfig::from_env(env({{"BOT_TOKEN", "s"}, {"PORT", "99999999999"}})), ConfigError);
}

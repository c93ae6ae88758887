#include <cstdlib>
#include <string>

#include <gtest/gtest.h>

#include "chatbox/config.hpp"

namespace {
class ConfigEnvTest : public ::testing::Test {
 protected:
  void TearDown() override {
    for (const char* key : {"SERVER_PORT", "PATH_PREFIX", "ALLOWED_ORIGINS", "LLM_MODELS", "DEFAULT_MODEL",
                            "DB_ENABLED", "MESSAGE_RATE_LIMIT", "RECONNECT_TIMEOUT_SECONDS"}) {
      unsetenv(key);
    }
  }
};
}  // namespace

TEST_F(ConfigEnvTest, DefaultsAreValid) {
  auto config = chatbox::LoadConfigFromEnv();
  EXPECT_EQ(config.port, 8080);
  EXPECT_EQ(config.path_prefix, "/chatbox");
  EXPECT_EQ(config.max_message_size, 1048576u);
  EXPECT_EQ(config.max_connections_per_user, 10u);
  EXPECT_EQ(config.reconnect_timeout_seconds, 900u);
  EXPECT_EQ(config.default_model, "gpt-4");
  EXPECT_FALSE(config.db_enabled);

  config.jwt_secret = "unused-by-validation";
  std::string error;
  EXPECT_TRUE(chatbox::ValidateConfig(config, error)) << error;
}

TEST_F(ConfigEnvTest, ReadsEnvironmentOverrides) {
  setenv("SERVER_PORT", "9090", 1);
  setenv("PATH_PREFIX", "/api/", 1);
  setenv("ALLOWED_ORIGINS", "https://a.example, https://b.example ,", 1);
  setenv("LLM_MODELS", "claude,gpt-4", 1);
  setenv("DB_ENABLED", "TRUE", 1);
  setenv("MESSAGE_RATE_LIMIT", "5", 1);

  auto config = chatbox::LoadConfigFromEnv();
  EXPECT_EQ(config.port, 9090);
  EXPECT_EQ(config.path_prefix, "/api");
  ASSERT_EQ(config.allowed_origins.size(), 2u);
  EXPECT_EQ(config.allowed_origins[1], "https://b.example");
  ASSERT_EQ(config.llm_models.size(), 2u);
  EXPECT_EQ(config.default_model, "claude");
  EXPECT_TRUE(config.db_enabled);
  EXPECT_EQ(config.message_rate_limit, 5u);
}

TEST_F(ConfigEnvTest, RejectsNonPositiveLimits) {
  chatbox::AppConfig config;
  std::string error;
  config.reconnect_timeout_seconds = 0;
  EXPECT_FALSE(chatbox::ValidateConfig(config, error));
  EXPECT_FALSE(error.empty());

  config = chatbox::AppConfig{};
  config.message_rate_limit = 0;
  EXPECT_FALSE(chatbox::ValidateConfig(config, error));

  config = chatbox::AppConfig{};
  config.max_connections_per_user = 0;
  EXPECT_FALSE(chatbox::ValidateConfig(config, error));

  config = chatbox::AppConfig{};
  config.notify_rate_limit = 0;
  EXPECT_FALSE(chatbox::ValidateConfig(config, error));
  config.notify_rate_limit = 1;
  EXPECT_TRUE(chatbox::ValidateConfig(config, error)) << error;
}

TEST_F(ConfigEnvTest, RejectsUnknownDefaultModelAndLogLevel) {
  chatbox::AppConfig config;
  std::string error;
  config.default_model = "llama";
  EXPECT_FALSE(chatbox::ValidateConfig(config, error));

  config = chatbox::AppConfig{};
  config.log_level = "loud";
  EXPECT_FALSE(chatbox::ValidateConfig(config, error));

  config = chatbox::AppConfig{};
  config.path_prefix = "chatbox";
  EXPECT_FALSE(chatbox::ValidateConfig(config, error));
}

TEST(ConfigTest, SplitCommaListTrimsAndDropsEmpty) {
  auto items = chatbox::SplitCommaList(" a , ,b,");
  ASSERT_EQ(items.size(), 2u);
  EXPECT_EQ(items[0], "a");
  EXPECT_EQ(items[1], "b");
  EXPECT_TRUE(chatbox::SplitCommaList("").empty());
}

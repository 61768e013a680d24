#include <gtest/gtest.h>
#include "ligaproxy/config.hpp"
#include <cstdlib>

using namespace ligaproxy;

namespace {

constexpr const char* kVars[] = {
    "PROVIDER_NAME", "UPSTREAM_HOST", "RATE_LIMIT_REQUESTS", "RATE_LIMIT_WINDOW",
    "MAX_RETRIES", "BASE_DELAY", "MAX_DELAY", "BACKOFF_MULTIPLIER", "JITTER_RANGE",
    "LOG_LEVEL", "LOG_PATTERN", "HOST", "PORT",
};

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override { clear(); }
    void TearDown() override { clear(); }

    static void clear() {
        for (const char* key : kVars) ::unsetenv(key);
    }
};

} // namespace

TEST_F(ConfigTest, DefaultsWhenUnset) {
    auto config = load_config();

    ASSERT_TRUE(config.has_value()) << config.error();
    EXPECT_EQ(config->provider_name, "openliga");
    EXPECT_EQ(config->upstream_host, "api.openligadb.de");
    EXPECT_EQ(config->rate_limit_requests, 10);
    EXPECT_EQ(config->rate_limit_window, 60);
    EXPECT_EQ(config->retry.max_retries, 3);
    EXPECT_DOUBLE_EQ(config->retry.base_delay.count(), 1.0);
    EXPECT_DOUBLE_EQ(config->retry.max_delay.count(), 30.0);
    EXPECT_DOUBLE_EQ(config->retry.backoff_multiplier, 2.0);
    EXPECT_DOUBLE_EQ(config->retry.jitter_range, 0.1);
    EXPECT_EQ(config->port, 8000);
}

TEST_F(ConfigTest, EnvironmentOverridesDefaults) {
    ::setenv("RATE_LIMIT_REQUESTS", "5", 1);
    ::setenv("RATE_LIMIT_WINDOW", "30", 1);
    ::setenv("MAX_RETRIES", "0", 1);
    ::setenv("BASE_DELAY", "0.5", 1);
    ::setenv("JITTER_RANGE", "0", 1);
    ::setenv("PORT", "9090", 1);
    ::setenv("LOG_LEVEL", "debug", 1);

    auto config = load_config();

    ASSERT_TRUE(config.has_value()) << config.error();
    EXPECT_EQ(config->rate_limit_requests, 5);
    EXPECT_EQ(config->retry.max_retries, 0);
    EXPECT_DOUBLE_EQ(config->retry.base_delay.count(), 0.5);
    EXPECT_DOUBLE_EQ(config->retry.jitter_range, 0.0);
    EXPECT_EQ(config->port, 9090);
    EXPECT_EQ(config->log_level, "debug");

    auto settings = config->provider_settings();
    EXPECT_EQ(settings.rate_limit_requests, 5);
    EXPECT_EQ(settings.rate_limit_window, std::chrono::seconds(30));
    EXPECT_EQ(settings.retry.max_retries, 0);
}

TEST_F(ConfigTest, MalformedNumberIsRejected) {
    ::setenv("MAX_RETRIES", "three", 1);

    auto config = load_config();

    ASSERT_FALSE(config.has_value());
    EXPECT_NE(config.error().find("MAX_RETRIES"), std::string::npos);
}

TEST_F(ConfigTest, OutOfRangeValuesAreRejected) {
    ::setenv("RATE_LIMIT_REQUESTS", "0", 1);
    EXPECT_FALSE(load_config().has_value());
    ::unsetenv("RATE_LIMIT_REQUESTS");

    ::setenv("JITTER_RANGE", "1.5", 1);
    EXPECT_FALSE(load_config().has_value());
    ::unsetenv("JITTER_RANGE");

    ::setenv("PORT", "70000", 1);
    EXPECT_FALSE(load_config().has_value());
}

TEST_F(ConfigTest, OpenLigaProviderIsCreated) {
    auto config = load_config();
    ASSERT_TRUE(config.has_value());

    auto provider = create_provider(*config);

    ASSERT_TRUE(provider.has_value()) << provider.error();
    EXPECT_EQ((*provider)->name(), "OpenLigaProvider");
}

TEST_F(ConfigTest, UnknownProviderIsRejected) {
    ::setenv("PROVIDER_NAME", "sportmonks", 1);
    auto config = load_config();
    ASSERT_TRUE(config.has_value());

    auto provider = create_provider(*config);

    ASSERT_FALSE(provider.has_value());
    EXPECT_EQ(provider.error(), "Unknown provider: sportmonks");
}

TEST_F(ConfigTest, LogLevelIsCaseInsensitive) {
    ::setenv("LOG_LEVEL", "INFO", 1);
    auto config = load_config();
    ASSERT_TRUE(config.has_value()) << config.error();
    EXPECT_EQ(config->log_level, "info");

    ::setenv("LOG_LEVEL", "Warn", 1);
    config = load_config();
    ASSERT_TRUE(config.has_value()) << config.error();
    EXPECT_EQ(config->log_level, "warn");
}

TEST_F(ConfigTest, UnknownLogLevelIsRejected) {
    ::setenv("LOG_LEVEL", "verbose", 1);

    auto config = load_config();

    ASSERT_FALSE(config.has_value());
    EXPECT_NE(config.error().find("LOG_LEVEL"), std::string::npos);
}

TEST_F(ConfigTest, OffIsAValidLogLevel) {
    ::setenv("LOG_LEVEL", "OFF", 1);
    auto config = load_config();
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->log_level, "off");
}

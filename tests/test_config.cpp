#include <memguard/core/config.hpp>
#include <memguard/core/logger.hpp>
#include <memguard/security/secure_backend.hpp>
#include <gtest/gtest.h>
#include <cstdlib>

using namespace memguard;

namespace {

const char* SAMPLE =
    "{"
    "  \"log_level\": \"warn\","
    "  \"security\": {"
    "    \"audit_log_path\": \"/tmp/memguard-audit.log\","
    "    \"enable_anomaly_detection\": false,"
    "    \"max_requests_per_minute\": 30,"
    "    \"limits\": {\"depth\": 3}"
    "  }"
    "}";

class ConfigTest : public ::testing::Test {
protected:
    void TearDown() override {
        unsetenv("MEMGUARD_SECURITY_AUDIT_LOG_PATH");
        unsetenv("MEMGUARD_SECURITY_MAX_REQUESTS_PER_MINUTE");
        unsetenv("MEMGUARD_SECURITY_ENABLE_ANOMALY_DETECTION");
        Logger::instance().set_level(LogLevel::INFO);
    }
};

} // namespace

TEST_F(ConfigTest, DotNotationLookup) {
    Config config;
    ASSERT_TRUE(config.load_string(SAMPLE));
    EXPECT_EQ("/tmp/memguard-audit.log", config.get_string("security.audit_log_path"));
    EXPECT_EQ(30, config.get_int("security.max_requests_per_minute"));
    EXPECT_EQ(3, config.get_int("security.limits.depth"));
    EXPECT_FALSE(config.get_bool("security.enable_anomaly_detection", true));
    EXPECT_EQ("none", config.get_string("security.missing", "none"));
    EXPECT_EQ(7, config.get_int("nope.nope", 7));
    EXPECT_TRUE(config.get_section("security").is_object());
}

TEST_F(ConfigTest, WrongTypeFallsBackToDefault) {
    Config config;
    ASSERT_TRUE(config.load_string(SAMPLE));
    EXPECT_EQ(5, config.get_int("security.audit_log_path", 5));
    EXPECT_EQ("d", config.get_string("security.max_requests_per_minute", "d"));
}

TEST_F(ConfigTest, EnvironmentOverridesFile) {
    Config config;
    ASSERT_TRUE(config.load_string(SAMPLE));
    setenv("MEMGUARD_SECURITY_AUDIT_LOG_PATH", "/var/tmp/other.log", 1);
    setenv("MEMGUARD_SECURITY_MAX_REQUESTS_PER_MINUTE", "12", 1);
    setenv("MEMGUARD_SECURITY_ENABLE_ANOMALY_DETECTION", "yes", 1);
    EXPECT_EQ("/var/tmp/other.log", config.get_string("security.audit_log_path"));
    EXPECT_EQ(12, config.get_int("security.max_requests_per_minute"));
    EXPECT_TRUE(config.get_bool("security.enable_anomaly_detection"));
}

TEST_F(ConfigTest, EnvKeyNaming) {
    EXPECT_EQ("MEMGUARD_SECURITY_AUDIT_LOG_PATH", Config::to_env_key("security.audit_log_path"));
    EXPECT_EQ("MEMGUARD_LOG_LEVEL", Config::to_env_key("log_level"));
}

TEST_F(ConfigTest, RejectsInvalidDocuments) {
    Config config;
    EXPECT_FALSE(config.load_string("{not json"));
    EXPECT_FALSE(config.load_string("[1, 2]"));
    EXPECT_FALSE(config.load_file("/nonexistent/memguard/config.json"));
}

TEST_F(ConfigTest, AppliesLogLevel) {
    Config config;
    ASSERT_TRUE(config.load_string(SAMPLE));
    config.apply_log_level();
    EXPECT_EQ(LogLevel::WARN, Logger::instance().level());
}

TEST_F(ConfigTest, SecurityOptionsFromConfig) {
    Config config;
    ASSERT_TRUE(config.load_string(SAMPLE));
    SecurityOptions opts = SecurityOptions::from_config(config);
    EXPECT_EQ("/tmp/memguard-audit.log", opts.audit_log_path);
    EXPECT_FALSE(opts.enable_anomaly_detection);
    EXPECT_EQ(30, opts.max_requests_per_minute);
    EXPECT_EQ(10, opts.max_consecutive_failures);
    EXPECT_TRUE(opts.parent_session_id.empty());
}

TEST_F(ConfigTest, SecurityOptionsDefaults) {
    Config config;
    SecurityOptions opts = SecurityOptions::from_config(config);
    EXPECT_TRUE(opts.audit_log_path.empty());
    EXPECT_TRUE(opts.enable_anomaly_detection);
    EXPECT_EQ(100, opts.max_requests_per_minute);
}

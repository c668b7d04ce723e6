#include <gtest/gtest.h>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include "regbot_config.h"

using namespace regbot;

namespace {

const char* kEnvKeys[] = {
    "BASE_URL", "TELEGRAM_BOT_TOKEN", "TELEGRAM_API_URL", "ADMINS", "REQUEST_TIMEOUT",
    "MAX_WORKERS", "USE_2CAPTCHA", "TWO_CAPTCHA_API_KEY", "CAPTCHA_SOFT_TIMEOUT",
    "CAPTCHA_POLL_INTERVAL", "CAPTCHA_MAX_TRIES", "MANUAL_FALLBACK", "ASSIGNMENT_MODE",
    "DAY_RETRY_POLICY", "REGBOT_LOG_FILE"};

class ConfigTest : public ::testing::Test {
protected:
  void SetUp() override { ClearEnv(); }
  void TearDown() override {
    ClearEnv();
    if (!temp_file_.empty()) {
      std::remove(temp_file_.c_str());
    }
  }

  static void ClearEnv() {
    for (const char* key : kEnvKeys) {
      unsetenv(key);
    }
  }

  std::string WriteTempFile(const std::string& content) {
    temp_file_ = ::testing::TempDir() + "regbot_config_test.json";
    std::ofstream out(temp_file_);
    out << content;
    return temp_file_;
  }

  std::string temp_file_;
};

}  // namespace

TEST_F(ConfigTest, DefaultsMatchTheDocumentedValues) {
  RegbotConfig config;
  EXPECT_EQ(config.base_url, "https://popmartstt.com");
  EXPECT_EQ(config.request_timeout_sec, 30);
  EXPECT_EQ(config.max_day_workers, 10);
  EXPECT_EQ(config.captcha_max_attempts, 4);
  EXPECT_EQ(config.captcha_soft_timeout_sec, 120);
  EXPECT_EQ(config.captcha_poll_interval_sec, 5);
  EXPECT_FALSE(config.use_2captcha);
  EXPECT_EQ(config.assignment_mode, AssignmentMode::ROUND_ROBIN);
  EXPECT_EQ(config.day_retry_policy, DayRetryPolicy::NEVER_RETRY);
  EXPECT_NO_THROW(ValidateConfig(config));
}

TEST_F(ConfigTest, EnvironmentOverridesDefaults) {
  setenv("BASE_URL", "https://example.test/", 1);
  setenv("ADMINS", " 11, 22 ,,", 1);
  setenv("MAX_WORKERS", "3", 1);
  setenv("USE_2CAPTCHA", "1", 1);
  setenv("TWO_CAPTCHA_API_KEY", "key123", 1);
  setenv("CAPTCHA_MAX_TRIES", "6", 1);
  setenv("ASSIGNMENT_MODE", "all-rows", 1);
  setenv("DAY_RETRY_POLICY", "retry-on-failure", 1);

  RegbotConfig config;
  LoadConfigFromEnvironment(config);

  EXPECT_EQ(config.base_url, "https://example.test");
  ASSERT_EQ(config.admins.size(), 2u);
  EXPECT_EQ(config.admins[0], "11");
  EXPECT_EQ(config.admins[1], "22");
  EXPECT_EQ(config.max_day_workers, 3);
  EXPECT_EQ(config.captcha_max_attempts, 6);
  EXPECT_EQ(config.assignment_mode, AssignmentMode::ALL_ROWS);
  EXPECT_EQ(config.day_retry_policy, DayRetryPolicy::RETRY_ON_FAILURE);
  EXPECT_TRUE(AutoSolveEnabled(config));
}

TEST_F(ConfigTest, SolverNeedsBothFlagAndKey) {
  RegbotConfig config;
  config.use_2captcha = true;
  EXPECT_FALSE(AutoSolveEnabled(config));
  config.two_captcha_api_key = "k";
  EXPECT_TRUE(AutoSolveEnabled(config));
  config.use_2captcha = false;
  EXPECT_FALSE(AutoSolveEnabled(config));
}

TEST_F(ConfigTest, RejectsUnparsableValues) {
  setenv("REQUEST_TIMEOUT", "thirty", 1);
  RegbotConfig config;
  EXPECT_THROW(LoadConfigFromEnvironment(config), ConfigError);

  ClearEnv();
  setenv("ASSIGNMENT_MODE", "random", 1);
  EXPECT_THROW(LoadConfigFromEnvironment(config), ConfigError);
}

TEST_F(ConfigTest, ValidateRejectsNonPositiveLimits) {
  RegbotConfig config;
  config.max_day_workers = 0;
  EXPECT_THROW(ValidateConfig(config), ConfigError);

  config = RegbotConfig();
  config.captcha_max_attempts = 0;
  EXPECT_THROW(ValidateConfig(config), ConfigError);

  config = RegbotConfig();
  config.base_url = "popmartstt.com";
  EXPECT_THROW(ValidateConfig(config), ConfigError);
}

TEST_F(ConfigTest, FileIsAppliedBeforeEnvironment) {
  std::string path = WriteTempFile(R"({
    "base_url": "https://from-file.test/",
    "max_day_workers": 2,
    "admins": ["7"],
    "day_retry_policy": "retry-on-failure"
  })");

  RegbotConfig config;
  LoadConfigFile(config, path);
  EXPECT_EQ(config.base_url, "https://from-file.test");
  EXPECT_EQ(config.max_day_workers, 2);
  EXPECT_EQ(config.day_retry_policy, DayRetryPolicy::RETRY_ON_FAILURE);

  setenv("MAX_WORKERS", "8", 1);
  LoadConfigFromEnvironment(config);
  EXPECT_EQ(config.max_day_workers, 8);
  EXPECT_EQ(config.base_url, "https://from-file.test");
}

TEST_F(ConfigTest, MalformedFileThrows) {
  RegbotConfig config;
  EXPECT_THROW(LoadConfigFile(config, WriteTempFile("{not json")), ConfigError);
  EXPECT_THROW(LoadConfigFile(config, WriteTempFile(R"({"max_day_workers": "many"})")), ConfigError);
  EXPECT_THROW(LoadConfigFile(config, "/nonexistent/regbot.json"), ConfigError);
}

TEST_F(ConfigTest, EnumNamesRoundTrip) {
  EXPECT_EQ(ParseAssignmentMode(AssignmentModeToString(AssignmentMode::ALL_ROWS)),
            AssignmentMode::ALL_ROWS);
  EXPECT_EQ(ParseDayRetryPolicy(DayRetryPolicyToString(DayRetryPolicy::NEVER_RETRY)),
            DayRetryPolicy::NEVER_RETRY);
  EXPECT_THROW(ParseDayRetryPolicy("sometimes"), ConfigError);
}

#include <gtest/gtest.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>
#include <vector>

#include "util/logger.h"
#include "util/sentinel_config.h"

using SentinelConfig::EngineConfig;

namespace {

class ScopedEnv {
 public:
  ScopedEnv(const char* name, const char* value) : name_(name) {
    setenv(name, value, 1);
  }
  ~ScopedEnv() { unsetenv(name_); }

 private:
  const char* name_;
};

}  // namespace

TEST(SentinelConfigTest, Defaults) {
  EngineConfig config;
  EXPECT_TRUE(config.load_default_profile);
  EXPECT_TRUE(config.generic_detector_enabled);
  EXPECT_TRUE(config.disabled_patterns.empty());
  EXPECT_EQ(config.log_level, "info");
  EXPECT_TRUE(config.log_file.empty());
}

TEST(SentinelConfigTest, LoadString) {
  EngineConfig config;
  std::string error;

  ASSERT_TRUE(SentinelConfig::LoadConfigString(R"({
    "load_default_profile": false,
    "enabled_categories": ["IP_ADDRESS", "MAC_ADDRESS"],
    "whitelisted_email_domains": ["example.com"],
    "disabled_patterns": ["aws_secret_key"],
    "log_level": "debug"
  })", &config, &error)) << error;

  EXPECT_FALSE(config.load_default_profile);
  EXPECT_TRUE(config.generic_detector_enabled);  // absent key keeps its value
  EXPECT_EQ(config.enabled_categories, (std::vector<std::string>{"IP_ADDRESS", "MAC_ADDRESS"}));
  EXPECT_EQ(config.whitelisted_email_domains, std::vector<std::string>{"example.com"});
  EXPECT_EQ(config.disabled_patterns, std::vector<std::string>{"aws_secret_key"});
  EXPECT_EQ(config.log_level, "debug");
}

TEST(SentinelConfigTest, InvalidJson) {
  EngineConfig config;
  std::string error;

  EXPECT_FALSE(SentinelConfig::LoadConfigString("{ not json", &config, &error));
  EXPECT_EQ(error.rfind("JSON parse error", 0), 0u);
}

TEST(SentinelConfigTest, RootMustBeObject) {
  EngineConfig config;
  std::string error;

  EXPECT_FALSE(SentinelConfig::LoadConfigString("[1, 2]", &config, &error));
  EXPECT_FALSE(error.empty());
}

TEST(SentinelConfigTest, WrongTypeLeavesConfigUntouched) {
  EngineConfig config;
  std::string error;

  EXPECT_FALSE(SentinelConfig::LoadConfigString(
      R"({"load_default_profile": false, "disabled_patterns": "ssn"})", &config, &error));
  EXPECT_NE(error.find("disabled_patterns"), std::string::npos);
  EXPECT_TRUE(config.load_default_profile);
  EXPECT_TRUE(config.disabled_patterns.empty());
}

TEST(SentinelConfigTest, MissingFile) {
  EngineConfig config;
  std::string error;

  EXPECT_FALSE(SentinelConfig::LoadConfigFile("/nonexistent/sentinel.json", &config, &error));
  EXPECT_EQ(error, "Cannot open config file: /nonexistent/sentinel.json");
}

TEST(SentinelConfigTest, LoadFile) {
  std::string path = testing::TempDir() + "sentinel_config_test.json";
  {
    std::ofstream out(path);
    out << R"({"generic_detector_enabled": false, "disabled_categories": ["PHONE"]})";
  }

  EngineConfig config;
  EXPECT_TRUE(SentinelConfig::LoadConfigFile(path, &config, nullptr));
  EXPECT_FALSE(config.generic_detector_enabled);
  EXPECT_EQ(config.disabled_categories, std::vector<std::string>{"PHONE"});

  std::remove(path.c_str());
}

TEST(SentinelConfigTest, EnvironmentOverrides) {
  EngineConfig config;
  {
    ScopedEnv profile(SENTINEL_ENV_LOAD_DEFAULT_PROFILE, "off");
    ScopedEnv detector(SENTINEL_ENV_GENERIC_DETECTOR, "No");
    ScopedEnv level(SENTINEL_ENV_LOG_LEVEL, "warn");
    SentinelConfig::ApplyEnvironment(&config);
  }

  EXPECT_FALSE(config.load_default_profile);
  EXPECT_FALSE(config.generic_detector_enabled);
  EXPECT_EQ(config.log_level, "warn");
  EXPECT_TRUE(config.log_file.empty());
}

TEST(SentinelConfigTest, UnparseableEnvironmentBoolIgnored) {
  EngineConfig config;
  {
    ScopedEnv profile(SENTINEL_ENV_LOAD_DEFAULT_PROFILE, "maybe");
    SentinelConfig::ApplyEnvironment(&config);
  }
  EXPECT_TRUE(config.load_default_profile);
}

TEST(SentinelConfigTest, JsonRoundTrip) {
  EngineConfig original;
  original.load_default_profile = false;
  original.disabled_patterns = {"ssn_no_dash", "aws_secret_key"};
  original.log_file = "/tmp/sentinel.log";

  EngineConfig reloaded;
  std::string error;
  ASSERT_TRUE(SentinelConfig::LoadConfigString(SentinelConfig::ToJson(original), &reloaded, &error))
      << error;

  EXPECT_EQ(reloaded.load_default_profile, original.load_default_profile);
  EXPECT_EQ(reloaded.disabled_patterns, original.disabled_patterns);
  EXPECT_EQ(reloaded.log_file, original.log_file);
}

TEST(SentinelConfigTest, LoggingConfig) {
  EngineConfig config;
  config.log_level = "Warning";
  EXPECT_TRUE(SentinelConfig::ApplyLoggingConfig(config));
  EXPECT_EQ(SentinelLogger::Logger::GetLevel(), SentinelLogger::WARN);

  config.log_level = "loud";
  EXPECT_FALSE(SentinelConfig::ApplyLoggingConfig(config));
  EXPECT_EQ(SentinelLogger::Logger::GetLevel(), SentinelLogger::INFO);
}

TEST(LoggerTest, ParseLevel) {
  SentinelLogger::Level level = SentinelLogger::INFO;
  EXPECT_TRUE(SentinelLogger::Logger::ParseLevel("DEBUG", &level));
  EXPECT_EQ(level, SentinelLogger::DEBUG);
  EXPECT_TRUE(SentinelLogger::Logger::ParseLevel("error", &level));
  EXPECT_EQ(level, SentinelLogger::ERROR);
  EXPECT_FALSE(SentinelLogger::Logger::ParseLevel("verbose", &level));
  EXPECT_EQ(level, SentinelLogger::ERROR);
}

#include "util/sentinel_config.h"
#include "util/logger.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace SentinelConfig {

namespace {

void SetError(std::string* error, const std::string& message) {
  if (error) *error = message;
}

// Reads |key| into |out| if present. Wrong types are reported, not ignored.
template <typename T>
bool ReadKey(const json& root, const char* key, T* out, std::string* error) {
  auto it = root.find(key);
  if (it == root.end() || it->is_null()) {
    return true;
  }
  try {
    *out = it->get<T>();
  } catch (const json::exception& e) {
    SetError(error, std::string("Invalid value for '") + key + "': " + e.what());
    return false;
  }
  return true;
}

bool ParseBool(const std::string& value, bool* out) {
  std::string lower = value;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") {
    *out = true;
    return true;
  }
  if (lower == "0" || lower == "false" || lower == "no" || lower == "off") {
    *out = false;
    return true;
  }
  return false;
}

void ApplyBoolEnv(const char* name, bool* out) {
  const char* value = std::getenv(name);
  if (!value) return;
  if (!ParseBool(value, out)) {
    LOG_WARN("Config", std::string("Ignoring ") + name + "=" + value + " (expected true/false)");
  }
}

}  // namespace

bool LoadConfigString(const std::string& json_text, EngineConfig* config, std::string* error) {
  json root;
  try {
    root = json::parse(json_text);
  } catch (const json::parse_error& e) {
    SetError(error, std::string("JSON parse error: ") + e.what());
    return false;
  }

  if (!root.is_object()) {
    SetError(error, "Configuration root must be a JSON object");
    return false;
  }

  // Parse into a copy so a bad key leaves |config| untouched
  EngineConfig parsed = *config;
  if (!ReadKey(root, "load_default_profile", &parsed.load_default_profile, error) ||
      !ReadKey(root, "generic_detector_enabled", &parsed.generic_detector_enabled, error) ||
      !ReadKey(root, "enabled_categories", &parsed.enabled_categories, error) ||
      !ReadKey(root, "disabled_categories", &parsed.disabled_categories, error) ||
      !ReadKey(root, "whitelisted_email_domains", &parsed.whitelisted_email_domains, error) ||
      !ReadKey(root, "disabled_patterns", &parsed.disabled_patterns, error) ||
      !ReadKey(root, "log_level", &parsed.log_level, error) ||
      !ReadKey(root, "log_file", &parsed.log_file, error)) {
    return false;
  }

  *config = std::move(parsed);
  return true;
}

bool LoadConfigFile(const std::string& path, EngineConfig* config, std::string* error) {
  std::ifstream file(path);
  if (!file.is_open()) {
    SetError(error, "Cannot open config file: " + path);
    return false;
  }

  std::stringstream buffer;
  buffer << file.rdbuf();

  if (!LoadConfigString(buffer.str(), config, error)) {
    return false;
  }

  LOG_INFO("Config", "Loaded configuration from " + path);
  return true;
}

void ApplyEnvironment(EngineConfig* config) {
  ApplyBoolEnv(SENTINEL_ENV_LOAD_DEFAULT_PROFILE, &config->load_default_profile);
  ApplyBoolEnv(SENTINEL_ENV_GENERIC_DETECTOR, &config->generic_detector_enabled);

  if (const char* level = std::getenv(SENTINEL_ENV_LOG_LEVEL)) {
    config->log_level = level;
  }
  if (const char* file = std::getenv(SENTINEL_ENV_LOG_FILE)) {
    config->log_file = file;
  }
}

bool ApplyLoggingConfig(const EngineConfig& config) {
  if (config.log_file.empty()) {
    SentinelLogger::Logger::Init();
  } else {
    SentinelLogger::Logger::Init(config.log_file);
  }

  SentinelLogger::Level level = SentinelLogger::INFO;
  bool known = SentinelLogger::Logger::ParseLevel(config.log_level, &level);
  SentinelLogger::Logger::SetLevel(level);
  if (!known) {
    LOG_WARN("Config", "Unknown log level '" + config.log_level + "', using info");
  }
  return known;
}

std::string ToJson(const EngineConfig& config) {
  json root = {
    {"load_default_profile", config.load_default_profile},
    {"generic_detector_enabled", config.generic_detector_enabled},
    {"enabled_categories", config.enabled_categories},
    {"disabled_categories", config.disabled_categories},
    {"whitelisted_email_domains", config.whitelisted_email_domains},
    {"disabled_patterns", config.disabled_patterns},
    {"log_level", config.log_level},
    {"log_file", config.log_file},
  };
  return root.dump(2);
}

}  // namespace SentinelConfig

/**
 * Log Sentinel - Configuration
 *
 * Supports loading engine configuration from a JSON file.
 * Priority order: Environment variables > Config file > Defaults
 */

#ifndef SENTINEL_CONFIG_H_
#define SENTINEL_CONFIG_H_

#include <string>
#include <vector>

namespace SentinelConfig {

// Environment variable names
#define SENTINEL_ENV_LOAD_DEFAULT_PROFILE "SENTINEL_LOAD_DEFAULT_PROFILE"
#define SENTINEL_ENV_GENERIC_DETECTOR "SENTINEL_GENERIC_DETECTOR"
#define SENTINEL_ENV_LOG_LEVEL "SENTINEL_LOG_LEVEL"
#define SENTINEL_ENV_LOG_FILE "SENTINEL_LOG_FILE"

struct EngineConfig {
  // Load the built-in us_global profile at construction
  bool load_default_profile = true;

  // Run the built-in PII categories. Supplemental detectors contributed by
  // profiles run either way.
  bool generic_detector_enabled = true;

  // PII category names (EMAIL, PHONE, IP_ADDRESS, ...) to switch on or off
  std::vector<std::string> enabled_categories;
  std::vector<std::string> disabled_categories;

  std::vector<std::string> whitelisted_email_domains;

  // Pattern names the engine skips, e.g. "aws_secret_key"
  std::vector<std::string> disabled_patterns;

  std::string log_level = "info";
  std::string log_file;
};

/**
 * Load configuration from a JSON file. Keys that are absent keep their
 * current value in |config|.
 *
 * @param path Path to the JSON configuration file
 * @param config Output: configuration to populate
 * @param error Output: reason for failure, may be null
 * @return true on success
 */
bool LoadConfigFile(const std::string& path, EngineConfig* config, std::string* error);

/**
 * Same as LoadConfigFile, from a JSON document already in memory.
 */
bool LoadConfigString(const std::string& json_text, EngineConfig* config, std::string* error);

/**
 * Apply SENTINEL_* environment variable overrides.
 */
void ApplyEnvironment(EngineConfig* config);

/**
 * Initialize the logger from log_level and log_file.
 * Returns false if log_level is not a known level (INFO is used then).
 */
bool ApplyLoggingConfig(const EngineConfig& config);

/**
 * Serialize a configuration as pretty-printed JSON.
 */
std::string ToJson(const EngineConfig& config);

}  // namespace SentinelConfig

#endif  // SENTINEL_CONFIG_H_

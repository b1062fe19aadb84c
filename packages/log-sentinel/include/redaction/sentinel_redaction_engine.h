#ifndef SENTINEL_REDACTION_ENGINE_H_
#define SENTINEL_REDACTION_ENGINE_H_

#include <map>
#include <memory>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <vector>

#include "redaction/sentinel_compliance_profile.h"
#include "redaction/sentinel_detector.h"
#include "util/sentinel_config.h"

namespace SentinelRedaction {

struct RedactionResult {
  std::string text;
  bool redacted = false;
};

// Result of RedactOptional(); an absent input stays absent
struct OptionalRedactionResult {
  std::optional<std::string> text;
  bool redacted = false;
};

struct BatchRedactionResult {
  std::vector<std::string> texts;
  bool any_redacted = false;
};

/**
 * Per-call redaction statistics. Counts are summed when the same stats
 * object is passed to several calls.
 */
struct RedactionStats {
  int texts_processed = 0;
  int texts_redacted = 0;
  int generic_detector_hits = 0;     // texts the generic stage changed
  int generic_detector_failures = 0;
  int pattern_failures = 0;
  int total_substitutions = 0;
  std::map<std::string, int> by_pattern;
  std::map<std::string, int> generic_by_category;  // e.g. EMAIL, PHONE

  std::string ToString() const;
};

/**
 * RedactionEngine - Sanitizes sensitive data in log text.
 *
 * Layered approach:
 * 1. The generic detector replaces common PII (emails, phones, ...)
 * 2. Every loaded profile's patterns run, profile-then-pattern, in load order
 *
 * Failures never reach the caller. A throwing generic detector is skipped for
 * that call and a throwing pattern is skipped on its own; both are logged as
 * warnings. Output is therefore always produced, at the cost of possible
 * silent under-redaction.
 *
 * Thread Safety:
 * Redact(), RedactOptional(), RedactBatch() and ListProfiles() may run from
 * many threads at once. LoadProfile()/UnloadProfile() take an exclusive lock
 * and may be called at any time, though they are intended for setup.
 *
 * Usage:
 *   RedactionEngine engine;
 *   auto result = engine.Redact("password=hunter22");
 *   // result.text == "password={{REDACTED_PASSWORD}}", result.redacted == true
 */
class RedactionEngine {
 public:
  // Uses a default SentinelPII::PiiScrubber as generic detector.
  explicit RedactionEngine(bool load_default_profile = true);

  RedactionEngine(std::unique_ptr<GenericDetector> generic_detector,
                  bool load_default_profile = true);

  ~RedactionEngine();

  RedactionEngine(const RedactionEngine&) = delete;
  RedactionEngine& operator=(const RedactionEngine&) = delete;

  /**
   * Build an engine from configuration: PII categories, e-mail whitelist,
   * default profile and disabled patterns.
   */
  static std::unique_ptr<RedactionEngine> FromConfig(const SentinelConfig::EngineConfig& config);

  /**
   * Load a profile. A profile with the same name is replaced in place and
   * keeps its position in the application order; its detectors are
   * deregistered once the new profile's detectors are registered.
   *
   * If the new profile's detectors cannot be registered the exception
   * propagates and the engine is left as it was.
   */
  void LoadProfile(std::shared_ptr<const ComplianceProfile> profile);

  /**
   * Remove a profile and deregister the detectors it contributed.
   *
   * @return true if the profile was loaded, false otherwise
   */
  bool UnloadProfile(const std::string& profile_name);

  // Loaded profile names, in application order.
  std::vector<std::string> ListProfiles() const;

  bool HasProfile(const std::string& profile_name) const;
  std::shared_ptr<const ComplianceProfile> GetProfile(const std::string& profile_name) const;

  // Total patterns across loaded profiles, disabled ones included.
  size_t PatternCount() const;

  /**
   * Skip (or re-enable) every pattern with this name, in any profile.
   */
  void SetPatternEnabled(const std::string& pattern_name, bool enabled);
  bool IsPatternEnabled(const std::string& pattern_name) const;

  /**
   * Redact sensitive data from |text|.
   *
   * Empty input returns immediately with redacted == false.
   * redacted is true exactly when the returned text differs from |text|.
   */
  RedactionResult Redact(const std::string& text, RedactionStats* stats = nullptr) const;

  /**
   * Like Redact(), but an absent input is passed through unchanged.
   */
  OptionalRedactionResult RedactOptional(const std::optional<std::string>& text,
                                         RedactionStats* stats = nullptr) const;

  /**
   * Redact each text in order. The output has the same length and order as
   * the input; any_redacted is the OR of the per-text flags.
   */
  BatchRedactionResult RedactBatch(const std::vector<std::string>& texts,
                                   RedactionStats* stats = nullptr) const;

  const GenericDetector& GetGenericDetector() const { return *generic_detector_; }

 private:
  struct LoadedProfile {
    std::shared_ptr<const ComplianceProfile> profile;
    std::string name;
    // Detector instances this profile registered, for deregistration
    std::vector<std::shared_ptr<const Detector>> registered_detectors;
  };

  // Registers |detectors| for |entry|. On failure the ones already added
  // are removed again and the exception is rethrown.
  void RegisterDetectors(LoadedProfile& entry,
                         std::vector<std::shared_ptr<const Detector>> detectors);
  void DeregisterDetectors(LoadedProfile& entry);

  std::vector<LoadedProfile>::iterator FindProfile(const std::string& profile_name);
  std::vector<LoadedProfile>::const_iterator FindProfile(const std::string& profile_name) const;

  // Must be called with |mutex_| held (shared is enough).
  std::string RedactLocked(const std::string& text, RedactionStats* stats) const;

  mutable std::shared_mutex mutex_;
  std::unique_ptr<GenericDetector> generic_detector_;
  std::vector<LoadedProfile> profiles_;  // load order
  std::set<std::string> disabled_patterns_;
};

}  // namespace SentinelRedaction

#endif  // SENTINEL_REDACTION_ENGINE_H_

#ifndef SENTINEL_COMPLIANCE_PROFILE_H_
#define SENTINEL_COMPLIANCE_PROFILE_H_

#include <memory>
#include <string>
#include <vector>

#include "redaction/sentinel_detector.h"
#include "redaction/sentinel_redaction_pattern.h"

namespace SentinelRedaction {

/**
 * ComplianceProfile - A named bundle of redaction rules for one compliance
 * or data-sensitivity domain (e.g. "us_global", "eu", "india", "hipaa").
 *
 * Implement this interface to add regional or industry-specific rules
 * without touching RedactionEngine. Patterns are applied in list order, so
 * overlapping rules must be listed most-specific-first.
 *
 * Implementations build their patterns once, in the constructor. An
 * invalid matcher throws ProfileDefinitionError from there.
 */
class ComplianceProfile {
 public:
  virtual ~ComplianceProfile() = default;

  // Unique key used for load/unload/listing.
  virtual std::string GetName() const = 0;

  virtual std::string GetDescription() const = 0;

  // Must return the same sequence, in the same order, on every call.
  virtual const std::vector<PatternRecord>& GetPatterns() const = 0;

  // Hooks registered into the generic detector when the profile is loaded.
  virtual std::vector<std::shared_ptr<const Detector>> GetSupplementalDetectors() const {
    return {};
  }

  std::string ToString() const { return "<ComplianceProfile: " + GetName() + ">"; }
};

/**
 * StaticProfile - A ComplianceProfile assembled from values, for profiles
 * that need no code of their own.
 *
 *   auto india = std::make_shared<StaticProfile>(
 *       "india", "Indian PII (PAN, Aadhaar)",
 *       std::vector<PatternRecord>{
 *           {"pan_card", R"(\b[A-Z]{5}[0-9]{4}[A-Z]\b)", "{{PAN_CARD}}"},
 *           {"aadhaar", R"(\b[2-9][0-9]{11}\b)", "{{AADHAAR}}"}});
 *   engine.LoadProfile(india);
 */
class StaticProfile : public ComplianceProfile {
 public:
  StaticProfile(std::string name,
                std::string description,
                std::vector<PatternRecord> patterns,
                std::vector<std::shared_ptr<const Detector>> detectors = {});

  std::string GetName() const override { return name_; }
  std::string GetDescription() const override { return description_; }
  const std::vector<PatternRecord>& GetPatterns() const override { return patterns_; }
  std::vector<std::shared_ptr<const Detector>> GetSupplementalDetectors() const override {
    return detectors_;
  }

 private:
  std::string name_;
  std::string description_;
  std::vector<PatternRecord> patterns_;
  std::vector<std::shared_ptr<const Detector>> detectors_;
};

}  // namespace SentinelRedaction

#endif  // SENTINEL_COMPLIANCE_PROFILE_H_

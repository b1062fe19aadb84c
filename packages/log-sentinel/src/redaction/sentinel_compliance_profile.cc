#include "redaction/sentinel_compliance_profile.h"

#include <set>
#include <stdexcept>
#include <utility>

namespace SentinelRedaction {

StaticProfile::StaticProfile(std::string name,
                             std::string description,
                             std::vector<PatternRecord> patterns,
                             std::vector<std::shared_ptr<const Detector>> detectors)
    : name_(std::move(name)),
      description_(std::move(description)),
      patterns_(std::move(patterns)),
      detectors_(std::move(detectors)) {
  if (name_.empty()) {
    throw std::invalid_argument("Compliance profile name must not be empty");
  }

  // Pattern names are unique within a profile
  std::set<std::string> seen;
  for (const auto& pattern : patterns_) {
    if (!seen.insert(pattern.GetName()).second) {
      throw ProfileDefinitionError(pattern.GetName(),
                                   "duplicate pattern name in profile '" + name_ + "'");
    }
  }

  for (const auto& detector : detectors_) {
    if (!detector) {
      throw std::invalid_argument("Profile '" + name_ + "' has a null supplemental detector");
    }
  }
}

}  // namespace SentinelRedaction

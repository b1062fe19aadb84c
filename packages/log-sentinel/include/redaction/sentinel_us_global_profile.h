#ifndef SENTINEL_US_GLOBAL_PROFILE_H_
#define SENTINEL_US_GLOBAL_PROFILE_H_

#include <memory>
#include <string>
#include <vector>

#include "redaction/sentinel_compliance_profile.h"

namespace SentinelRedaction {

/**
 * UsGlobalProfile - Default profile for US and globally common secrets.
 *
 * Covers:
 * - Private key blocks (PEM)
 * - JWTs, with and without a "Bearer" prefix
 * - GitHub and Slack tokens
 * - AWS access key IDs and secret access keys
 * - API keys, secret keys, access tokens and passwords in key=value form
 *   (the key name is kept, only the value is replaced)
 * - Credit card numbers (Visa, Mastercard, Amex, Discover, JCB), bare and
 *   separated by spaces or dashes
 * - US Social Security Numbers, with and without dashes
 *
 * Rules run most-specific-first. The broad 40-character secret key shape
 * runs last so it never eats part of a more specific token.
 */
class UsGlobalProfile : public ComplianceProfile {
 public:
  static constexpr const char* kName = "us_global";

  UsGlobalProfile();

  std::string GetName() const override { return kName; }
  std::string GetDescription() const override;
  const std::vector<PatternRecord>& GetPatterns() const override { return patterns_; }

 private:
  std::vector<PatternRecord> patterns_;
};

/**
 * Shared immutable instance of the default profile.
 */
std::shared_ptr<const ComplianceProfile> DefaultProfile();

}  // namespace SentinelRedaction

#endif  // SENTINEL_US_GLOBAL_PROFILE_H_

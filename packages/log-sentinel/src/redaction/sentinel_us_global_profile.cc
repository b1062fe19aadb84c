#include "redaction/sentinel_us_global_profile.h"

namespace SentinelRedaction {

namespace {

// Area 000, 666 and 900-999, group 00 and serial 0000 are never issued
bool IsIssuedSsn(const std::vector<re2::StringPiece>& groups) {
  const re2::StringPiece& area = groups[1];
  if (area == "000" || area == "666" || area[0] == '9') return false;
  if (groups[2] == "00") return false;
  return groups[3] != "0000";
}

// Values that already hold a {{TAG}} are left alone
bool ValueIsNotTag(const std::vector<re2::StringPiece>& groups) {
  return !StartsWithTag(groups[2]);
}

}  // namespace

UsGlobalProfile::UsGlobalProfile() {
  patterns_.reserve(13);

  // Whole PEM block, non-greedy so two keys in one message stay separate
  patterns_.emplace_back(
    "private_key",
    R"re(-----BEGIN\s+(?:(?:RSA|EC|DSA|OPENSSH|ENCRYPTED)\s+)?PRIVATE\s+KEY-----[\s\S]*?-----END\s+(?:(?:RSA|EC|DSA|OPENSSH|ENCRYPTED)\s+)?PRIVATE\s+KEY-----)re",
    "{{PRIVATE_KEY_REDACTED}}",
    "Private key block");

  patterns_.emplace_back(
    "bearer_token",
    R"re(Bearer\s+eyJ[A-Za-z0-9_-]+\.eyJ[A-Za-z0-9_-]+\.[A-Za-z0-9_-]+)re",
    "Bearer {{JWT_TOKEN}}",
    "JWT bearer token");

  patterns_.emplace_back(
    "jwt_token",
    R"re(\beyJ[A-Za-z0-9_-]{10,}\.eyJ[A-Za-z0-9_-]{10,}\.[A-Za-z0-9_-]{10,}\b)re",
    "{{JWT_TOKEN}}",
    "JWT token");

  // Classic (ghp_, gho_, ghu_, ghs_, ghr_) and fine-grained (github_pat_)
  patterns_.emplace_back(
    "github_token",
    R"re(\b(?:gh[pousr]_[A-Za-z0-9]{36}|github_pat_[A-Za-z0-9_]{22,255})\b)re",
    "{{GITHUB_TOKEN}}",
    "GitHub personal access token");

  patterns_.emplace_back(
    "slack_token",
    R"re(\bxox[baprs]-[A-Za-z0-9-]+\b)re",
    "{{SLACK_TOKEN}}",
    "Slack API token");

  patterns_.emplace_back(
    "aws_access_key",
    R"re(\b(?:AKIA|ABIA|ACCA|ASIA)[A-Z0-9]{16}\b)re",
    "{{AWS_ACCESS_KEY}}",
    "AWS access key ID");

  patterns_.emplace_back(
    "api_key_value",
    R"re((?i)(api[_-]?key|apikey|api[_-]?secret|secret[_-]?key|access[_-]?token|auth[_-]?token)\s*[=:]\s*["']?([A-Za-z0-9_\-+=/.{}]{16,})["']?)re",
    R"re(\1={{REDACTED_KEY}})re",
    "API key in key=value format",
    ValueIsNotTag);

  patterns_.emplace_back(
    "password",
    R"re((?i)(password|passwd|pwd)\s*[=:]\s*["']?([^\s"']{4,})["']?)re",
    R"re(\1={{REDACTED_PASSWORD}})re",
    "Password in key=value format",
    ValueIsNotTag);

  patterns_.emplace_back(
    "credit_card",
    R"re(\b(?:4[0-9]{12}(?:[0-9]{3})?|5[1-5][0-9]{14}|3[47][0-9]{13}|6(?:011|5[0-9]{2})[0-9]{12}|(?:2131|1800|35[0-9]{3})[0-9]{11})\b)re",
    "{{CREDIT_CARD}}",
    "Credit card number (Visa, Mastercard, Amex, Discover, JCB)");

  patterns_.emplace_back(
    "credit_card_formatted",
    R"re(\b(?:[0-9]{4}[-\s]?){3}[0-9]{4}\b)re",
    "{{CREDIT_CARD}}",
    "Credit card number with space or dash separators");

  patterns_.emplace_back(
    "ssn",
    R"re(\b([0-9]{3})-([0-9]{2})-([0-9]{4})\b)re",
    "{{SSN}}",
    "US Social Security Number",
    IsIssuedSsn);

  patterns_.emplace_back(
    "ssn_no_dash",
    R"re(\b([0-9]{3})([0-9]{2})([0-9]{4})\b)re",
    "{{SSN}}",
    "US Social Security Number without dashes",
    IsIssuedSsn);

  patterns_.emplace_back(
    "aws_secret_key",
    R"re(\b[A-Za-z0-9/+=]{40}\b)re",
    "{{AWS_SECRET_KEY}}",
    "Potential AWS secret access key");
}

std::string UsGlobalProfile::GetDescription() const {
  return "US and global compliance patterns (PCI-DSS, credentials, common PII)";
}

std::shared_ptr<const ComplianceProfile> DefaultProfile() {
  static const std::shared_ptr<const ComplianceProfile> profile =
      std::make_shared<const UsGlobalProfile>();
  return profile;
}

}  // namespace SentinelRedaction

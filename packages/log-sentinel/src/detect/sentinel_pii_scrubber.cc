#include "detect/sentinel_pii_scrubber.h"
#include "util/logger.h"

#include <algorithm>
#include <cctype>
#include <mutex>
#include <sstream>
#include <utility>

namespace SentinelPII {

namespace {

const PIICategory kAllCategories[] = {
  PIICategory::EMAIL,
  PIICategory::PHONE,
  PIICategory::SENSITIVE_URL,
  PIICategory::PERSON_NAME,
  PIICategory::IP_ADDRESS,
  PIICategory::MAC_ADDRESS,
  PIICategory::FILE_PATH,
};

std::string ToLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

}  // namespace

// Helper function to get category name
std::string GetCategoryName(PIICategory category) {
  switch (category) {
    case PIICategory::EMAIL: return "EMAIL";
    case PIICategory::PHONE: return "PHONE";
    case PIICategory::SENSITIVE_URL: return "SENSITIVE_URL";
    case PIICategory::PERSON_NAME: return "PERSON_NAME";
    case PIICategory::IP_ADDRESS: return "IP_ADDRESS";
    case PIICategory::MAC_ADDRESS: return "MAC_ADDRESS";
    case PIICategory::FILE_PATH: return "FILE_PATH";
    default: return "UNKNOWN";
  }
}

bool ParseCategoryName(const std::string& name, PIICategory* category) {
  std::string upper = name;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  for (PIICategory candidate : kAllCategories) {
    if (GetCategoryName(candidate) == upper) {
      *category = candidate;
      return true;
    }
  }
  return false;
}

std::string ScrubStats::ToString() const {
  std::stringstream ss;
  ss << "PII Scrubbing Stats: " << total_items_found << " items redacted";
  if (!by_category.empty()) {
    ss << " (";
    bool first = true;
    for (const auto& [cat, count] : by_category) {
      if (!first) ss << ", ";
      ss << GetCategoryName(cat) << ":" << count;
      first = false;
    }
    ss << ")";
  }
  return ss.str();
}

PiiScrubber::PiiScrubber() {
  // Broad categories stay off unless a deployment asks for them: in
  // infrastructure logs they mostly hit hosts, versions and build paths
  for (PIICategory category : kAllCategories) {
    category_enabled_[category] = true;
  }
  category_enabled_[PIICategory::IP_ADDRESS] = false;
  category_enabled_[PIICategory::MAC_ADDRESS] = false;
  category_enabled_[PIICategory::FILE_PATH] = false;

  InitializePatterns();
}

void PiiScrubber::InitializePatterns() {
  using SentinelRedaction::PatternRecord;

  patterns_.emplace_back(PIICategory::EMAIL, PatternRecord(
    "email",
    R"re(\b[A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\.[A-Za-z]{2,}\b)re",
    "{{EMAIL}}", "",
    [this](const std::vector<re2::StringPiece>& groups) {
      return !IsWhitelistedEmail(std::string(groups[0].data(), groups[0].size()));
    }));

  // Secret-bearing query parameters; the parameter name is kept
  patterns_.emplace_back(PIICategory::SENSITIVE_URL, PatternRecord(
    "sensitive_url",
    R"re((?i)([?&](?:token|access_token|id_token|refresh_token|api_key|apikey|key|secret|client_secret|sig|signature|auth|code)=)([^&\s#"']+))re",
    R"re(\1{{URL_SECRET}})re", "",
    [](const std::vector<re2::StringPiece>& groups) {
      return !SentinelRedaction::StartsWithTag(groups[2]);
    }));

  // Groups must be separated: (555) 123-4567, 555-123-4567, +1 555.123.4567
  patterns_.emplace_back(PIICategory::PHONE, PatternRecord(
    "phone",
    R"re((?:\+[0-9]{1,3}[-.\s]?)?(?:\([0-9]{3}\)\s?|\b[0-9]{3}[-.\s])[0-9]{3}[-.\s][0-9]{4}\b)re",
    "{{PHONE}}"));

  // Honorific followed by one or more capitalized words: Dr. John Smith
  patterns_.emplace_back(PIICategory::PERSON_NAME, PatternRecord(
    "person_name",
    R"re(\b(?:Mr|Mrs|Ms|Miss|Dr|Prof)\.?\s+[A-Z][a-z]+(?:\s+[A-Z][a-z]+)*\b)re",
    "{{NAME}}"));

  // Only addresses whose octets are all in range
  patterns_.emplace_back(PIICategory::IP_ADDRESS, PatternRecord(
    "ip_address",
    R"re(\b(?:[0-9]{1,3}\.){3}[0-9]{1,3}\b)re",
    "{{IP_ADDRESS}}", "",
    [this](const std::vector<re2::StringPiece>& groups) {
      return IsValidIPAddress(std::string(groups[0].data(), groups[0].size()));
    }));

  // 6 pairs of hex separated by : or -
  patterns_.emplace_back(PIICategory::MAC_ADDRESS, PatternRecord(
    "mac_address",
    R"re(\b(?:[0-9A-Fa-f]{2}[:-]){5}[0-9A-Fa-f]{2}\b)re",
    "{{MAC_ADDRESS}}"));

  // Home directory prefix is kept, the user name is replaced
  patterns_.emplace_back(PIICategory::FILE_PATH, PatternRecord(
    "file_path",
    R"re((?i)(/home/|/Users/|C:\\Users\\)([A-Za-z0-9_.-]+))re",
    R"re(\1{{USERNAME}})re"));
}

std::string PiiScrubber::Scrub(const std::string& text, ScrubStats* stats) const {
  std::string result = text;

  // Contact information first, it is the most specific
  for (const auto& [category, pattern] : patterns_) {
    if (!IsCategoryEnabled(category)) {
      continue;
    }

    int count = 0;
    result = pattern.Apply(result, &count);
    if (count > 0) {
      if (stats) stats->AddDetection(category, count);
      LOG_DEBUG("PIIScrubber", "Redacted " + std::to_string(count) + " " +
                GetCategoryName(category) + " item(s)");
    }
  }

  std::vector<std::shared_ptr<const SentinelRedaction::Detector>> detectors;
  {
    std::shared_lock<std::shared_mutex> lock(detectors_mutex_);
    detectors = detectors_;
  }
  for (const auto& detector : detectors) {
    result = detector->Scrub(result);
  }

  return result;
}

std::string PiiScrubber::ApplyAndCount(const std::string& text,
                                       std::map<std::string, int>* detections) const {
  ScrubStats stats;
  std::string result = Scrub(text, &stats);
  if (detections) {
    for (const auto& [category, count] : stats.by_category) {
      (*detections)[GetCategoryName(category)] += count;
    }
  }
  return result;
}

bool PiiScrubber::IsValidIPAddress(const std::string& ip) const {
  std::stringstream ss(ip);
  std::string octet;
  int parts = 0;

  while (std::getline(ss, octet, '.')) {
    if (octet.empty() || octet.size() > 3) return false;
    int value = std::stoi(octet);
    if (value > 255) return false;
    parts++;
  }

  return parts == 4;
}

bool PiiScrubber::IsWhitelistedEmail(const std::string& email) const {
  if (whitelisted_email_domains_.empty()) return false;

  size_t at_pos = email.find('@');
  if (at_pos == std::string::npos) return false;

  std::string domain = ToLower(email.substr(at_pos + 1));
  for (const auto& allowed : whitelisted_email_domains_) {
    if (domain == allowed) return true;
    // Subdomains of a whitelisted domain are whitelisted too
    if (domain.size() > allowed.size() &&
        domain.compare(domain.size() - allowed.size(), allowed.size(), allowed) == 0 &&
        domain[domain.size() - allowed.size() - 1] == '.') {
      return true;
    }
  }

  return false;
}

void PiiScrubber::SetCategoryEnabled(PIICategory category, bool enabled) {
  category_enabled_[category] = enabled;
  LOG_DEBUG("PIIScrubber", "Category " + GetCategoryName(category) + " " +
            (enabled ? "enabled" : "disabled"));
}

bool PiiScrubber::IsCategoryEnabled(PIICategory category) const {
  auto it = category_enabled_.find(category);
  return it != category_enabled_.end() && it->second;
}

void PiiScrubber::DisableAllCategories() {
  for (auto& entry : category_enabled_) {
    entry.second = false;
  }
}

void PiiScrubber::SetWhitelistedEmailDomains(std::vector<std::string> domains) {
  for (auto& domain : domains) {
    domain = ToLower(domain);
  }
  whitelisted_email_domains_ = std::move(domains);
}

void PiiScrubber::AddDetector(std::shared_ptr<const SentinelRedaction::Detector> detector) {
  if (!detector) return;

  std::string name = detector->GetName();
  {
    std::unique_lock<std::shared_mutex> lock(detectors_mutex_);
    detectors_.push_back(std::move(detector));
  }
  LOG_INFO("PIIScrubber", "Registered supplemental detector: " + name);
}

bool PiiScrubber::RemoveDetector(
    const std::shared_ptr<const SentinelRedaction::Detector>& detector) {
  std::unique_lock<std::shared_mutex> lock(detectors_mutex_);
  auto it = std::find(detectors_.begin(), detectors_.end(), detector);
  if (it == detectors_.end()) {
    return false;
  }
  detectors_.erase(it);
  return true;
}

std::vector<std::string> PiiScrubber::GetDetectorNames() const {
  std::shared_lock<std::shared_mutex> lock(detectors_mutex_);
  std::vector<std::string> names;
  names.reserve(detectors_.size());
  for (const auto& detector : detectors_) {
    names.push_back(detector->GetName());
  }
  return names;
}

}  // namespace SentinelPII

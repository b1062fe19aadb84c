#include "redaction/sentinel_redaction_engine.h"
#include "detect/sentinel_pii_scrubber.h"
#include "redaction/sentinel_us_global_profile.h"
#include "util/logger.h"

#include <algorithm>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace SentinelRedaction {

std::string RedactionStats::ToString() const {
  std::stringstream ss;
  ss << "Redaction Stats: " << texts_redacted << "/" << texts_processed
     << " texts redacted, " << total_substitutions << " pattern substitutions";
  if (!by_pattern.empty()) {
    ss << " (";
    bool first = true;
    for (const auto& [pattern, count] : by_pattern) {
      if (!first) ss << ", ";
      ss << pattern << ":" << count;
      first = false;
    }
    ss << ")";
  }
  if (generic_detector_hits > 0) {
    ss << ", generic detector changed " << generic_detector_hits << " text(s)";
  }
  if (!generic_by_category.empty()) {
    ss << " (";
    bool first = true;
    for (const auto& [category, count] : generic_by_category) {
      if (!first) ss << ", ";
      ss << category << ":" << count;
      first = false;
    }
    ss << ")";
  }
  if (generic_detector_failures > 0 || pattern_failures > 0) {
    ss << ", failures: detector=" << generic_detector_failures
       << " pattern=" << pattern_failures;
  }
  return ss.str();
}

RedactionEngine::RedactionEngine(bool load_default_profile)
    : RedactionEngine(std::make_unique<SentinelPII::PiiScrubber>(), load_default_profile) {}

RedactionEngine::RedactionEngine(std::unique_ptr<GenericDetector> generic_detector,
                                 bool load_default_profile)
    : generic_detector_(std::move(generic_detector)) {
  if (!generic_detector_) {
    throw std::invalid_argument("RedactionEngine requires a generic detector");
  }

  if (load_default_profile) {
    LoadProfile(DefaultProfile());
  }
}

RedactionEngine::~RedactionEngine() = default;

std::unique_ptr<RedactionEngine> RedactionEngine::FromConfig(
    const SentinelConfig::EngineConfig& config) {
  auto scrubber = std::make_unique<SentinelPII::PiiScrubber>();

  if (!config.generic_detector_enabled) {
    scrubber->DisableAllCategories();
  } else {
    for (const auto& name : config.enabled_categories) {
      SentinelPII::PIICategory category;
      if (SentinelPII::ParseCategoryName(name, &category)) {
        scrubber->SetCategoryEnabled(category, true);
      } else {
        LOG_WARN("RedactionEngine", "Unknown PII category in enabled_categories: " + name);
      }
    }
    for (const auto& name : config.disabled_categories) {
      SentinelPII::PIICategory category;
      if (SentinelPII::ParseCategoryName(name, &category)) {
        scrubber->SetCategoryEnabled(category, false);
      } else {
        LOG_WARN("RedactionEngine", "Unknown PII category in disabled_categories: " + name);
      }
    }
  }
  scrubber->SetWhitelistedEmailDomains(config.whitelisted_email_domains);

  auto engine = std::make_unique<RedactionEngine>(std::move(scrubber),
                                                  config.load_default_profile);
  for (const auto& pattern_name : config.disabled_patterns) {
    engine->SetPatternEnabled(pattern_name, false);
  }
  return engine;
}

std::vector<RedactionEngine::LoadedProfile>::iterator
RedactionEngine::FindProfile(const std::string& profile_name) {
  return std::find_if(profiles_.begin(), profiles_.end(),
                      [&](const LoadedProfile& entry) { return entry.name == profile_name; });
}

std::vector<RedactionEngine::LoadedProfile>::const_iterator
RedactionEngine::FindProfile(const std::string& profile_name) const {
  return std::find_if(profiles_.begin(), profiles_.end(),
                      [&](const LoadedProfile& entry) { return entry.name == profile_name; });
}

void RedactionEngine::RegisterDetectors(LoadedProfile& entry,
                                        std::vector<std::shared_ptr<const Detector>> detectors) {
  for (auto& detector : detectors) {
    if (!detector) continue;
    try {
      generic_detector_->AddDetector(detector);
    } catch (const std::exception& e) {
      LOG_ERROR("RedactionEngine", "Cannot register detector '" + detector->GetName() +
                "' of profile '" + entry.name + "': " + e.what());
      DeregisterDetectors(entry);
      throw;
    }
    entry.registered_detectors.push_back(std::move(detector));
  }
}

void RedactionEngine::DeregisterDetectors(LoadedProfile& entry) {
  for (const auto& detector : entry.registered_detectors) {
    if (!generic_detector_->RemoveDetector(detector)) {
      LOG_WARN("RedactionEngine", "Detector '" + detector->GetName() +
               "' of profile '" + entry.name + "' was not registered");
    }
  }
  entry.registered_detectors.clear();
}

void RedactionEngine::LoadProfile(std::shared_ptr<const ComplianceProfile> profile) {
  if (!profile) {
    throw std::invalid_argument("Cannot load a null compliance profile");
  }

  LoadedProfile entry;
  entry.name = profile->GetName();
  entry.profile = std::move(profile);
  auto detectors = entry.profile->GetSupplementalDetectors();

  std::unique_lock<std::shared_mutex> lock(mutex_);

  RegisterDetectors(entry, std::move(detectors));

  auto it = FindProfile(entry.name);
  if (it != profiles_.end()) {
    DeregisterDetectors(*it);
    *it = std::move(entry);
    LOG_INFO("RedactionEngine", "Replaced compliance profile: " + it->name);
    return;
  }

  profiles_.push_back(std::move(entry));
  LOG_INFO("RedactionEngine", "Loaded compliance profile: " + profiles_.back().name);
}

bool RedactionEngine::UnloadProfile(const std::string& profile_name) {
  std::unique_lock<std::shared_mutex> lock(mutex_);

  auto it = FindProfile(profile_name);
  if (it == profiles_.end()) {
    return false;
  }

  DeregisterDetectors(*it);
  profiles_.erase(it);
  LOG_INFO("RedactionEngine", "Unloaded compliance profile: " + profile_name);
  return true;
}

std::vector<std::string> RedactionEngine::ListProfiles() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  std::vector<std::string> names;
  names.reserve(profiles_.size());
  for (const auto& entry : profiles_) {
    names.push_back(entry.name);
  }
  return names;
}

bool RedactionEngine::HasProfile(const std::string& profile_name) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return FindProfile(profile_name) != profiles_.end();
}

std::shared_ptr<const ComplianceProfile> RedactionEngine::GetProfile(
    const std::string& profile_name) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto it = FindProfile(profile_name);
  return it == profiles_.end() ? nullptr : it->profile;
}

size_t RedactionEngine::PatternCount() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  size_t count = 0;
  for (const auto& entry : profiles_) {
    count += entry.profile->GetPatterns().size();
  }
  return count;
}

void RedactionEngine::SetPatternEnabled(const std::string& pattern_name, bool enabled) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  if (enabled) {
    disabled_patterns_.erase(pattern_name);
  } else {
    disabled_patterns_.insert(pattern_name);
  }
  LOG_INFO("RedactionEngine", "Pattern " + pattern_name + (enabled ? " enabled" : " disabled"));
}

bool RedactionEngine::IsPatternEnabled(const std::string& pattern_name) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return disabled_patterns_.count(pattern_name) == 0;
}

std::string RedactionEngine::RedactLocked(const std::string& text, RedactionStats* stats) const {
  std::string result = text;

  // Step 1: generic PII detection. On failure keep the text as it was.
  try {
    std::string scrubbed = stats
        ? generic_detector_->ApplyAndCount(result, &stats->generic_by_category)
        : generic_detector_->Apply(result);
    if (stats && scrubbed != result) {
      stats->generic_detector_hits++;
    }
    result = std::move(scrubbed);
  } catch (const std::exception& e) {
    if (stats) stats->generic_detector_failures++;
    LOG_WARN("RedactionEngine",
             std::string("Generic detector error (continuing with patterns): ") + e.what());
  }

  // Step 2: profile patterns, profile-then-pattern in load order
  for (const auto& entry : profiles_) {
    for (const auto& pattern : entry.profile->GetPatterns()) {
      if (disabled_patterns_.count(pattern.GetName()) != 0) {
        continue;
      }

      try {
        int count = 0;
        result = pattern.Apply(result, &count);
        if (stats && count > 0) {
          stats->by_pattern[pattern.GetName()] += count;
          stats->total_substitutions += count;
        }
      } catch (const std::exception& e) {
        if (stats) stats->pattern_failures++;
        LOG_WARN("RedactionEngine", "Pattern '" + pattern.GetName() + "' of profile '" +
                 entry.name + "' error: " + e.what());
      }
    }
  }

  return result;
}

RedactionResult RedactionEngine::Redact(const std::string& text, RedactionStats* stats) const {
  RedactionResult result;
  if (stats) stats->texts_processed++;

  if (text.empty()) {
    return result;
  }

  {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    result.text = RedactLocked(text, stats);
  }
  result.redacted = result.text != text;

  if (stats && result.redacted) stats->texts_redacted++;
  return result;
}

OptionalRedactionResult RedactionEngine::RedactOptional(const std::optional<std::string>& text,
                                                        RedactionStats* stats) const {
  OptionalRedactionResult result;
  if (!text) {
    return result;
  }

  RedactionResult redacted = Redact(*text, stats);
  result.text = std::move(redacted.text);
  result.redacted = redacted.redacted;
  return result;
}

BatchRedactionResult RedactionEngine::RedactBatch(const std::vector<std::string>& texts,
                                                  RedactionStats* stats) const {
  BatchRedactionResult result;
  result.texts.reserve(texts.size());

  for (const auto& text : texts) {
    RedactionResult item = Redact(text, stats);
    result.texts.push_back(std::move(item.text));
    if (item.redacted) {
      result.any_redacted = true;
    }
  }

  return result;
}

}  // namespace SentinelRedaction

#ifndef SENTINEL_PII_SCRUBBER_H_
#define SENTINEL_PII_SCRUBBER_H_

#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

#include "redaction/sentinel_detector.h"

namespace SentinelPII {

/**
 * PII Category enumeration for tracking what types of PII were found
 */
enum class PIICategory {
  EMAIL,
  PHONE,
  SENSITIVE_URL,
  PERSON_NAME,
  IP_ADDRESS,
  MAC_ADDRESS,
  FILE_PATH
};

/**
 * Statistics about PII scrubbing
 */
struct ScrubStats {
  int total_items_found = 0;
  std::map<PIICategory, int> by_category;

  void AddDetection(PIICategory category, int count = 1) {
    if (count <= 0) return;
    total_items_found += count;
    by_category[category] += count;
  }

  std::string ToString() const;
};

/**
 * PiiScrubber - General-purpose PII scrubber for free-form log text.
 *
 * This is the generic detection stage of the redaction pipeline: it runs
 * before any compliance profile and replaces common PII with double-brace
 * category tags such as {{EMAIL}} and {{PHONE}}. Text that is already a
 * tag is never scrubbed again.
 *
 * Categories detected:
 * - Email addresses (optional domain whitelist)
 * - Phone numbers (US and international, separator-formatted only so bare
 *   digit runs are left to profile rules)
 * - Secret URL query parameters (value replaced, parameter name kept)
 * - Person names introduced by an honorific (Mr., Dr., ...)
 * - IPv4 addresses with octet validation (off by default)
 * - MAC addresses (off by default)
 * - User names in home-directory paths (off by default)
 *
 * Supplemental detectors registered with AddDetector() run after the
 * built-in categories, in registration order.
 *
 * Scrub() and Apply() are const and may run concurrently. Category and
 * whitelist setters are for setup time only.
 *
 * Usage:
 *   PiiScrubber scrubber;
 *   ScrubStats stats;
 *   std::string clean_text = scrubber.Scrub(log_line, &stats);
 */
class PiiScrubber : public SentinelRedaction::GenericDetector {
 public:
  PiiScrubber();
  ~PiiScrubber() override = default;

  PiiScrubber(const PiiScrubber&) = delete;
  PiiScrubber& operator=(const PiiScrubber&) = delete;

  /**
   * Scrub PII from text, replacing it with placeholders like {{EMAIL}}.
   *
   * @param text Input text that may contain PII
   * @param stats Optional: receives per-category detection counts
   * @return Scrubbed text
   */
  std::string Scrub(const std::string& text, ScrubStats* stats = nullptr) const;

  std::string Apply(const std::string& text) const override { return Scrub(text); }
  std::string ApplyAndCount(const std::string& text,
                            std::map<std::string, int>* detections) const override;

  void AddDetector(std::shared_ptr<const SentinelRedaction::Detector> detector) override;
  bool RemoveDetector(const std::shared_ptr<const SentinelRedaction::Detector>& detector) override;
  std::vector<std::string> GetDetectorNames() const override;

  /**
   * Enable/disable specific PII categories
   */
  void SetCategoryEnabled(PIICategory category, bool enabled);
  bool IsCategoryEnabled(PIICategory category) const;

  /**
   * Disable every built-in category. Supplemental detectors still run.
   */
  void DisableAllCategories();

  /**
   * Emails in these domains (and their subdomains) are left untouched.
   * Empty by default.
   */
  void SetWhitelistedEmailDomains(std::vector<std::string> domains);

 private:
  void InitializePatterns();

  /**
   * Validate IPv4 octet ranges
   */
  bool IsValidIPAddress(const std::string& ip) const;

  /**
   * Check if email is in a whitelisted domain
   */
  bool IsWhitelistedEmail(const std::string& email) const;

  // Built-in rules, in scrub order
  std::vector<std::pair<PIICategory, SentinelRedaction::PatternRecord>> patterns_;

  // Category enable/disable flags
  std::map<PIICategory, bool> category_enabled_;

  std::vector<std::string> whitelisted_email_domains_;

  // Supplemental detectors, in registration order
  mutable std::shared_mutex detectors_mutex_;
  std::vector<std::shared_ptr<const SentinelRedaction::Detector>> detectors_;
};

/**
 * Get category name as string
 */
std::string GetCategoryName(PIICategory category);

/**
 * Parse a category name as produced by GetCategoryName (any case).
 * Returns false for unknown names.
 */
bool ParseCategoryName(const std::string& name, PIICategory* category);

}  // namespace SentinelPII

#endif  // SENTINEL_PII_SCRUBBER_H_

#ifndef SENTINEL_DETECTOR_H_
#define SENTINEL_DETECTOR_H_

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "redaction/sentinel_redaction_pattern.h"

namespace SentinelRedaction {

/**
 * Detector - A hook a profile contributes to the generic detection stage.
 *
 * Scrub() must be const and thread-safe: it runs on every Redact() call.
 */
class Detector {
 public:
  virtual ~Detector() = default;

  virtual std::string GetName() const = 0;
  virtual std::string Scrub(const std::string& text) const = 0;
};

/**
 * Detector backed by a single precompiled PatternRecord.
 */
class RegexDetector : public Detector {
 public:
  explicit RegexDetector(PatternRecord pattern);

  std::string GetName() const override { return pattern_.GetName(); }
  std::string Scrub(const std::string& text) const override;

 private:
  PatternRecord pattern_;
};

/**
 * GenericDetector - The general-purpose PII stage that runs before any
 * profile pattern.
 *
 * Given arbitrary text, Apply() returns the text with generically
 * recognizable PII replaced by bracketed category tags. Implementations may
 * throw; the engine treats a throw as "stage skipped" for that call.
 *
 * AddDetector()/RemoveDetector() mutate the registry and are meant for
 * setup time; Apply() must be safe to call concurrently with other Apply()
 * calls.
 */
class GenericDetector {
 public:
  virtual ~GenericDetector() = default;

  virtual std::string Apply(const std::string& text) const = 0;

  /**
   * Like Apply(), also adding the number of items found per category name
   * to |detections|. The default implementation reports nothing.
   */
  virtual std::string ApplyAndCount(const std::string& text,
                                    std::map<std::string, int>* /*detections*/) const {
    return Apply(text);
  }

  virtual void AddDetector(std::shared_ptr<const Detector> detector) = 0;

  // Removes the exact instance previously added. Returns false if absent.
  virtual bool RemoveDetector(const std::shared_ptr<const Detector>& detector) = 0;

  virtual std::vector<std::string> GetDetectorNames() const = 0;
};

}  // namespace SentinelRedaction

#endif  // SENTINEL_DETECTOR_H_

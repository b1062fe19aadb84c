#include "redaction/sentinel_detector.h"

#include <utility>

namespace SentinelRedaction {

RegexDetector::RegexDetector(PatternRecord pattern)
    : pattern_(std::move(pattern)) {}

std::string RegexDetector::Scrub(const std::string& text) const {
  return pattern_.Apply(text);
}

}  // namespace SentinelRedaction

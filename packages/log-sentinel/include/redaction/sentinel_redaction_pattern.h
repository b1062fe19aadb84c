#ifndef SENTINEL_REDACTION_PATTERN_H_
#define SENTINEL_REDACTION_PATTERN_H_

#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <re2/re2.h>

namespace SentinelRedaction {

/**
 * Thrown when a profile definition contains a matcher that does not compile.
 * This is a programmer error and surfaces at profile construction time.
 */
class ProfileDefinitionError : public std::runtime_error {
 public:
  ProfileDefinitionError(const std::string& pattern_name, const std::string& what);

  const std::string& GetPatternName() const { return pattern_name_; }

 private:
  std::string pattern_name_;
};

/**
 * Post-match check. groups[0] is the whole match, groups[1..n] the capture
 * groups (empty when a group did not participate). Returning false rejects
 * the match and the search resumes one character after its start.
 */
using MatchFilter = std::function<bool(const std::vector<re2::StringPiece>& groups)>;

/**
 * True when |value| begins with a complete redaction tag such as
 * {{REDACTED_KEY}}. Used to keep redaction idempotent.
 */
bool StartsWithTag(re2::StringPiece value);

/**
 * PatternRecord - One immutable detection rule.
 *
 * The matcher is an RE2 expression, compiled once in the constructor and
 * shared by every copy of the record. RE2 matches in linear time without
 * recursion, so inputs of any length are safe, and Apply() may be called
 * from several threads at once.
 *
 * Flags go inline, e.g. "(?i)password". The replacement uses RE2 rewrite
 * syntax: \1..\9 reference capture groups, \0 the whole match.
 *
 * RE2 has no lookaround. Conditions a match must also satisfy go in an
 * optional MatchFilter.
 *
 * Usage:
 *   PatternRecord pan("pan_card", R"(\b[A-Z]{5}[0-9]{4}[A-Z]\b)",
 *                     "{{PAN_CARD}}", "Indian PAN card number");
 *   std::string clean = pan.Apply(text);
 */
class PatternRecord {
 public:
  PatternRecord(std::string name,
                const std::string& expression,
                std::string replacement,
                std::string description = "",
                MatchFilter filter = nullptr);

  const std::string& GetName() const { return name_; }
  const std::string& GetExpression() const { return matcher_->pattern(); }
  const std::string& GetReplacement() const { return replacement_; }
  const std::string& GetDescription() const { return description_; }
  const re2::RE2& GetMatcher() const { return *matcher_; }

  /**
   * Replace every accepted match in |text| with the replacement.
   *
   * @param text Input text
   * @param count Optional: receives the number of substitutions made
   * @return Text with matches replaced
   *
   * Exceptions thrown by the match filter propagate to the caller.
   */
  std::string Apply(const std::string& text, int* count = nullptr) const;

  /**
   * Count non-overlapping accepted matches in |text|.
   */
  int CountMatches(const std::string& text) const;

 private:
  std::string name_;
  std::string replacement_;
  std::string description_;
  std::shared_ptr<const re2::RE2> matcher_;
  MatchFilter filter_;
};

}  // namespace SentinelRedaction

#endif  // SENTINEL_REDACTION_PATTERN_H_

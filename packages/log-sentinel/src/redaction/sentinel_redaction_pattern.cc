#include "redaction/sentinel_redaction_pattern.h"

#include <cctype>
#include <utility>

namespace SentinelRedaction {

ProfileDefinitionError::ProfileDefinitionError(const std::string& pattern_name,
                                               const std::string& what)
    : std::runtime_error("Invalid matcher for pattern '" + pattern_name + "': " + what),
      pattern_name_(pattern_name) {}

bool StartsWithTag(re2::StringPiece value) {
  if (value.size() < 5 || value[0] != '{' || value[1] != '{') {
    return false;
  }
  size_t i = 2;
  while (i < value.size() &&
         (std::isupper(static_cast<unsigned char>(value[i])) || value[i] == '_')) {
    i++;
  }
  return i > 2 && i + 1 < value.size() && value[i] == '}' && value[i + 1] == '}';
}

PatternRecord::PatternRecord(std::string name,
                             const std::string& expression,
                             std::string replacement,
                             std::string description,
                             MatchFilter filter)
    : name_(std::move(name)),
      replacement_(std::move(replacement)),
      description_(std::move(description)),
      filter_(std::move(filter)) {
  if (name_.empty()) {
    throw ProfileDefinitionError(name_, "pattern name must not be empty");
  }

  RE2::Options options;
  options.set_log_errors(false);
  auto matcher = std::make_shared<const re2::RE2>(expression, options);
  if (!matcher->ok()) {
    throw ProfileDefinitionError(name_, matcher->error());
  }

  std::string rewrite_error;
  if (!matcher->CheckRewriteString(replacement_, &rewrite_error)) {
    throw ProfileDefinitionError(name_, rewrite_error);
  }

  matcher_ = std::move(matcher);
}

std::string PatternRecord::Apply(const std::string& text, int* count) const {
  const int group_count = matcher_->NumberOfCapturingGroups() + 1;
  std::vector<re2::StringPiece> groups(group_count);
  const re2::StringPiece input(text);

  std::string result;
  size_t search_pos = 0;
  size_t copied = 0;
  int hits = 0;

  while (search_pos <= text.size() &&
         matcher_->Match(input, search_pos, text.size(), RE2::UNANCHORED,
                         groups.data(), group_count)) {
    size_t start = static_cast<size_t>(groups[0].data() - text.data());
    size_t end = start + groups[0].size();

    if (filter_ && !filter_(groups)) {
      search_pos = start + 1;
      continue;
    }

    result.append(text, copied, start - copied);
    if (!matcher_->Rewrite(&result, replacement_, groups.data(), group_count)) {
      throw std::runtime_error("Rewrite failed for pattern '" + name_ + "'");
    }
    copied = end;
    hits++;

    // Step over empty matches
    search_pos = end > start ? end : end + 1;
  }

  if (count) *count = hits;
  if (hits == 0) {
    return text;
  }

  result.append(text, copied, std::string::npos);
  return result;
}

int PatternRecord::CountMatches(const std::string& text) const {
  int count = 0;
  Apply(text, &count);
  return count;
}

}  // namespace SentinelRedaction

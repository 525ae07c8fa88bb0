#include "corpus/rule.h"

#include <re2/re2.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <vector>

namespace llmguard {
namespace {

std::shared_ptr<const re2::RE2> CompilePattern(const std::string& pattern, bool case_sensitive) {
  re2::RE2::Options options;
  options.set_case_sensitive(case_sensitive);
  options.set_log_errors(false);
  auto regex = std::make_shared<const re2::RE2>(pattern, options);
  if (!regex->ok()) {
    throw std::invalid_argument("malformed pattern: " + regex->error());
  }
  return regex;
}

}  // namespace

const char* CategoryName(RuleCategory category) {
  switch (category) {
    case RuleCategory::kPii:
      return "pii";
    case RuleCategory::kInjection:
      return "injection";
    case RuleCategory::kBias:
      return "bias";
  }
  return "unknown";
}

bool ParseCategory(const std::string& text, RuleCategory* out) {
  std::string lowered = text;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  RuleCategory parsed;
  if (lowered == "pii") {
    parsed = RuleCategory::kPii;
  } else if (lowered == "injection") {
    parsed = RuleCategory::kInjection;
  } else if (lowered == "bias") {
    parsed = RuleCategory::kBias;
  } else {
    return false;
  }
  if (out) {
    *out = parsed;
  }
  return true;
}

RuleMatcher::RuleMatcher(const std::string& pattern, bool case_sensitive,
                         std::size_t capture_group)
    : pattern_(pattern),
      regex_(CompilePattern(pattern, case_sensitive)),
      capture_group_(capture_group) {
  if (capture_group_ > static_cast<std::size_t>(regex_->NumberOfCapturingGroups())) {
    throw std::invalid_argument("capture group " + std::to_string(capture_group_) +
                                " not present in pattern");
  }
}

std::optional<MatchSpan> RuleMatcher::FindFrom(const std::string& text,
                                               std::size_t from) const {
  // The whole text is passed as context so \b sees characters before `from`.
  const re2::StringPiece input(text.data(), text.size());
  std::vector<re2::StringPiece> groups(capture_group_ + 1);
  const int ngroups = static_cast<int>(groups.size());
  std::size_t pos = from;
  while (pos <= text.size()) {
    if (!regex_->Match(input, pos, text.size(), re2::RE2::UNANCHORED, groups.data(), ngroups)) {
      return std::nullopt;
    }
    const re2::StringPiece& sub = groups[capture_group_];
    if (sub.data() != nullptr && !sub.empty()) {
      MatchSpan span;
      span.begin = static_cast<std::size_t>(sub.data() - text.data());
      span.end = span.begin + sub.size();
      return span;
    }
    if (groups[0].data() == nullptr) {
      return std::nullopt;
    }
    // Empty or non-participating group: resume one past the match start.
    pos = static_cast<std::size_t>(groups[0].data() - text.data()) + 1;
  }
  return std::nullopt;
}

bool RuleMatcher::Matches(const std::string& text) const {
  return FindFrom(text, 0).has_value();
}

std::size_t RuleMatcher::CountMatches(const std::string& text) const {
  std::size_t count = 0;
  std::size_t pos = 0;
  while (auto span = FindFrom(text, pos)) {
    ++count;
    pos = span->end;
  }
  return count;
}

}  // namespace llmguard

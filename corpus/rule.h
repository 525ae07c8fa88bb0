#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

namespace re2 {
class RE2;
}

namespace llmguard {

// Closed set of rule categories. Aggregation is selected per category by the
// guards; rules themselves carry no behaviour beyond matching.
enum class RuleCategory { kPii, kInjection, kBias };

const char* CategoryName(RuleCategory category);
bool ParseCategory(const std::string& text, RuleCategory* out);

// Uncompiled rule as declared in code or in a rules file.
struct RuleDefinition {
  std::string id;
  RuleCategory category{RuleCategory::kInjection};
  std::string pattern;
  double weight{1.0};
  // Placeholder label for PII rules ("EMAIL" -> <<EMAIL_1>>), [A-Z][A-Z0-9_]*.
  // Empty otherwise.
  std::string replacement_label;
  std::string description;
  bool case_sensitive{false};
  // Sub-match reported as the matched span. 0 is the whole match.
  std::size_t capture_group{0};
};

// Half-open byte range [begin, end) into the scanned text.
struct MatchSpan {
  std::size_t begin{0};
  std::size_t end{0};
};

// RE2 (Perl-style) pattern. Matching time is linear in the input and does
// not recurse per character, so arbitrarily long text is safe to scan.
class RuleMatcher {
 public:
  // Throws std::invalid_argument for a malformed pattern or when
  // capture_group exceeds the number of groups in the pattern.
  RuleMatcher(const std::string& pattern, bool case_sensitive,
              std::size_t capture_group);

  // First non-empty match whose reported span starts at or after `from`.
  // Characters before `from` are still visible to \b assertions.
  std::optional<MatchSpan> FindFrom(const std::string& text,
                                    std::size_t from) const;
  bool Matches(const std::string& text) const;
  // Non-overlapping match count.
  std::size_t CountMatches(const std::string& text) const;

  const std::string& Pattern() const { return pattern_; }

 private:
  std::string pattern_;
  std::shared_ptr<const re2::RE2> regex_;
  std::size_t capture_group_{0};
};

struct Rule {
  std::string id;
  RuleCategory category;
  RuleMatcher matcher;
  double weight;
  std::string replacement_label;
  std::string description;
};

}  // namespace llmguard

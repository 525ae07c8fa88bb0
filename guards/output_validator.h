#pragma once

#include "corpus/rule.h"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace llmguard {

constexpr std::size_t kDefaultMaxOutputLength = 4096;
// Hedging matches per whitespace token above which output is flagged.
constexpr double kHedgingDensityThreshold = 0.10;

struct ValidationRules {
  // Upper bound in characters (UTF-8 code points).
  std::size_t max_output_length{kDefaultMaxOutputLength};
  std::vector<std::string> required_keywords;
  std::vector<std::string> blocked_keywords;
  bool check_hallucination{true};
};

struct Violation {
  // max_length, blocked_keyword, required_keyword, json_schema, hallucination
  std::string kind;
  std::string detail;
};

struct ValidationResult {
  bool is_valid{true};
  std::vector<Violation> violations;
  // Hedging density clamped to [0, 1], four decimal places.
  double hallucination_score{0.0};
};

// Runs every check and accumulates violations instead of stopping at the
// first one. Keyword matching is case-insensitive substring search.
class OutputValidator {
 public:
  OutputValidator();
  explicit OutputValidator(ValidationRules rules);

  // `schema` is a JSON Schema document; when present the output must be JSON
  // that conforms to it. A schema that does not parse is reported as a
  // json_schema violation.
  ValidationResult Validate(const std::string& text,
                            const std::optional<std::string>& schema = std::nullopt) const;

  // Hedging-phrase matches divided by whitespace token count.
  double HedgingDensity(const std::string& text) const;

  const ValidationRules& Rules() const { return rules_; }

 private:
  ValidationRules rules_;
  std::vector<RuleMatcher> hedging_;
};

}  // namespace llmguard

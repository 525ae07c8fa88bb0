#include "guards/output_validator.h"

#include "guards/json_schema_check.h"
#include "guards/text_util.h"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace llmguard {
namespace {

const char* const kHedgingPhrases[] = {
    "I think",
    "I believe",
    "I'm not sure",
    "I am not sure",
    "it is possible that",
    "it might be",
    "probably",
    "perhaps",
    "maybe",
    "as far as I know",
    "to the best of my knowledge",
    "I cannot confirm",
    "I don't have access",
    "I do not have access",
    "reportedly",
    "allegedly",
    "it seems",
    "it appears",
};

std::vector<std::string> NormalizeKeywords(const std::vector<std::string>& words) {
  std::vector<std::string> normalized;
  normalized.reserve(words.size());
  for (const auto& word : words) {
    if (!word.empty()) {
      normalized.push_back(ToLower(word));
    }
  }
  return normalized;
}

// Whole-phrase pattern; any whitespace run may separate the words.
std::string PhrasePattern(const std::string& phrase) {
  std::string pattern = "\\b";
  for (char c : phrase) {
    if (c == ' ') {
      pattern += "\\s+";
    } else {
      pattern += c;
    }
  }
  pattern += "\\b";
  return pattern;
}

std::size_t TokenCount(const std::string& text) {
  std::istringstream in(text);
  std::string token;
  std::size_t count = 0;
  while (in >> token) {
    ++count;
  }
  return count;
}

std::string FormatScore(double value) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(2) << value;
  return out.str();
}

}  // namespace

OutputValidator::OutputValidator() : OutputValidator(ValidationRules{}) {}

OutputValidator::OutputValidator(ValidationRules rules) : rules_(std::move(rules)) {
  rules_.required_keywords = NormalizeKeywords(rules_.required_keywords);
  rules_.blocked_keywords = NormalizeKeywords(rules_.blocked_keywords);
  for (const char* phrase : kHedgingPhrases) {
    hedging_.emplace_back(PhrasePattern(phrase), /*case_sensitive=*/false, 0);
  }
}

double OutputValidator::HedgingDensity(const std::string& text) const {
  std::size_t tokens = TokenCount(text);
  if (tokens == 0) {
    return 0.0;
  }
  std::size_t hits = 0;
  for (const auto& matcher : hedging_) {
    hits += matcher.CountMatches(text);
  }
  return static_cast<double>(hits) / static_cast<double>(tokens);
}

ValidationResult OutputValidator::Validate(const std::string& text,
                                           const std::optional<std::string>& schema) const {
  ValidationResult result;

  std::size_t length = CodePointCount(text);
  if (length > rules_.max_output_length) {
    result.violations.push_back(
        {"max_length", "Output length (" + std::to_string(length) + ") exceeds maximum (" +
                           std::to_string(rules_.max_output_length) + ")"});
  }

  std::string lowered;
  if (!rules_.blocked_keywords.empty() || !rules_.required_keywords.empty()) {
    lowered = ToLower(text);
  }
  for (const auto& keyword : rules_.blocked_keywords) {
    if (lowered.find(keyword) != std::string::npos) {
      result.violations.push_back({"blocked_keyword", "Blocked keyword found: '" + keyword + "'"});
    }
  }
  for (const auto& keyword : rules_.required_keywords) {
    if (lowered.find(keyword) == std::string::npos) {
      result.violations.push_back(
          {"required_keyword", "Required keyword missing: '" + keyword + "'"});
    }
  }

  if (schema) {
    std::vector<std::string> problems;
    CheckDocumentAgainstSchema(text, *schema, &problems);
    for (auto& problem : problems) {
      result.violations.push_back({"json_schema", std::move(problem)});
    }
  }

  if (rules_.check_hallucination) {
    double density = HedgingDensity(text);
    result.hallucination_score = std::round(std::min(density, 1.0) * 10000.0) / 10000.0;
    if (density > kHedgingDensityThreshold) {
      result.violations.push_back(
          {"hallucination", "High hedging-language density (" + FormatScore(density) +
                                "), possible hallucination"});
    }
  }

  result.is_valid = result.violations.empty();
  return result;
}

}  // namespace llmguard

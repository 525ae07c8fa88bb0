#pragma once

#include "corpus/pattern_corpus.h"

#include <string>
#include <vector>

namespace llmguard {

// Outcome of scoring text against one rule category.
struct RuleScore {
  // Noisy-OR of the matched rule weights, in [0, 1].
  double score{0.0};
  // Ids of every rule that fired, in declaration order.
  std::vector<std::string> matched_rules;
  // Description of each fired rule, parallel to matched_rules.
  std::vector<std::string> flags;
};

using InjectionResult = RuleScore;
using BiasReport = RuleScore;

struct RuleInfo {
  std::string id;
  double weight{0.0};
  std::string description;
};

// 1 - prod(1 - w_i). Empty input yields 0.
double NoisyOr(const std::vector<double>& weights);

// Evaluates every rule of `category` against `text`.
RuleScore ScoreRules(const PatternCorpus& corpus, RuleCategory category,
                     const std::string& text);

std::vector<RuleInfo> DescribeRules(const PatternCorpus& corpus, RuleCategory category);

}  // namespace llmguard

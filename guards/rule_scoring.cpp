#include "guards/rule_scoring.h"

#include <algorithm>
#include <unordered_set>

namespace llmguard {

double NoisyOr(const std::vector<double>& weights) {
  double miss = 1.0;
  for (double w : weights) {
    miss *= 1.0 - w;
  }
  return std::clamp(1.0 - miss, 0.0, 1.0);
}

RuleScore ScoreRules(const PatternCorpus& corpus, RuleCategory category,
                     const std::string& text) {
  RuleScore result;
  if (text.empty()) {
    return result;
  }
  std::vector<double> weights;
  std::unordered_set<std::string> seen;
  for (const auto& rule : corpus.RulesFor(category)) {
    if (!rule.matcher.Matches(text)) {
      continue;
    }
    if (!seen.insert(rule.id).second) {
      continue;
    }
    weights.push_back(rule.weight);
    result.matched_rules.push_back(rule.id);
    result.flags.push_back(rule.description.empty() ? rule.id : rule.description);
  }
  result.score = NoisyOr(weights);
  return result;
}

std::vector<RuleInfo> DescribeRules(const PatternCorpus& corpus, RuleCategory category) {
  std::vector<RuleInfo> infos;
  for (const auto& rule : corpus.RulesFor(category)) {
    infos.push_back(RuleInfo{rule.id, rule.weight, rule.description});
  }
  return infos;
}

}  // namespace llmguard

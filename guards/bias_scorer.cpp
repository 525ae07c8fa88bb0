#include "guards/bias_scorer.h"

#include <cmath>
#include <stdexcept>

namespace llmguard {

BiasScorer::BiasScorer(std::shared_ptr<const PatternCorpus> corpus)
    : corpus_(std::move(corpus)) {
  if (!corpus_) {
    throw std::invalid_argument("BiasScorer requires a pattern corpus");
  }
}

BiasReport BiasScorer::Score(const std::string& text) const {
  BiasReport report = ScoreRules(*corpus_, RuleCategory::kBias, text);
  report.score = std::round(report.score * 10000.0) / 10000.0;
  return report;
}

std::vector<RuleInfo> BiasScorer::ListRules() const {
  return DescribeRules(*corpus_, RuleCategory::kBias);
}

}  // namespace llmguard

#include "guards/injection_detector.h"

#include <stdexcept>

namespace llmguard {
namespace {

void CheckThreshold(double threshold) {
  if (!(threshold >= 0.0 && threshold <= 1.0)) {
    throw std::invalid_argument("injection threshold " + std::to_string(threshold) +
                                " outside [0, 1]");
  }
}

}  // namespace

InjectionDetector::InjectionDetector(double threshold,
                                     std::shared_ptr<const PatternCorpus> corpus)
    : threshold_(threshold), corpus_(std::move(corpus)) {
  CheckThreshold(threshold_);
  if (!corpus_) {
    throw std::invalid_argument("InjectionDetector requires a pattern corpus");
  }
}

double InjectionDetector::Score(const std::string& text) const {
  return Analyse(text).score;
}

bool InjectionDetector::Detect(const std::string& text) const {
  return Exceeds(Score(text));
}

bool InjectionDetector::Detect(const std::string& text, double threshold) const {
  CheckThreshold(threshold);
  return Score(text) >= threshold;
}

InjectionResult InjectionDetector::Analyse(const std::string& text) const {
  return ScoreRules(*corpus_, RuleCategory::kInjection, text);
}

std::vector<RuleInfo> InjectionDetector::ListRules() const {
  return DescribeRules(*corpus_, RuleCategory::kInjection);
}

}  // namespace llmguard

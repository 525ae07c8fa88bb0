#pragma once

#include "corpus/pattern_corpus.h"
#include "guards/rule_scoring.h"

#include <memory>
#include <string>
#include <vector>

namespace llmguard {

constexpr double kDefaultInjectionThreshold = 0.5;

class InjectionDetector {
 public:
  // Throws std::invalid_argument if `threshold` is outside [0, 1] or `corpus`
  // is null.
  explicit InjectionDetector(double threshold = kDefaultInjectionThreshold,
                             std::shared_ptr<const PatternCorpus> corpus = PatternCorpus::Default());

  double Score(const std::string& text) const;
  // Score(text) >= threshold.
  bool Detect(const std::string& text) const;
  // Same test against a per-call threshold. Throws std::invalid_argument if
  // `threshold` is outside [0, 1].
  bool Detect(const std::string& text, double threshold) const;
  InjectionResult Analyse(const std::string& text) const;

  bool Exceeds(double score) const { return score >= threshold_; }
  double Threshold() const { return threshold_; }

  std::vector<RuleInfo> ListRules() const;

 private:
  double threshold_;
  std::shared_ptr<const PatternCorpus> corpus_;
};

}  // namespace llmguard

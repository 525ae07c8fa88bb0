#pragma once

#include "corpus/pattern_corpus.h"
#include "guards/rule_scoring.h"

#include <memory>
#include <string>
#include <vector>

namespace llmguard {

// Scores LLM output against the bias rules: stereotyping language, absolute
// generalisations about demographic groups, age and disability framing.
// The score is rounded to four decimal places.
class BiasScorer {
 public:
  // Throws std::invalid_argument if `corpus` is null.
  explicit BiasScorer(std::shared_ptr<const PatternCorpus> corpus = PatternCorpus::Default());

  BiasReport Score(const std::string& text) const;
  std::vector<RuleInfo> ListRules() const;

 private:
  std::shared_ptr<const PatternCorpus> corpus_;
};

}  // namespace llmguard

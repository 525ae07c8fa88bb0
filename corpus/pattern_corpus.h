#pragma once

#include "corpus/rule.h"

#include <memory>
#include <string>
#include <vector>

namespace llmguard {

// Immutable, versioned rule set. Every matcher is compiled in the constructor;
// a corpus that exists is fully usable and is safe to share across threads.
class PatternCorpus {
 public:
  // Throws std::invalid_argument naming the offending rule when a pattern does
  // not compile, a weight lies outside [0, 1], an id is empty or repeated, or a
  // PII rule's replacement label is not of the form [A-Z][A-Z0-9_]*.
  PatternCorpus(std::string version, const std::vector<RuleDefinition>& definitions);

  // Shared corpus built from the built-in rule definitions.
  static std::shared_ptr<const PatternCorpus> Default();

  // Rules of one category in declaration order.
  const std::vector<Rule>& RulesFor(RuleCategory category) const;
  const Rule* FindRule(const std::string& id) const;

  const std::string& Version() const { return version_; }
  std::size_t Size() const;

 private:
  std::string version_;
  std::vector<Rule> pii_rules_;
  std::vector<Rule> injection_rules_;
  std::vector<Rule> bias_rules_;
};

}  // namespace llmguard

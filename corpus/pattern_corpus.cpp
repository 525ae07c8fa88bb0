#include "corpus/pattern_corpus.h"

#include "corpus/builtin_rules.h"
#include "logging/logger.h"

#include <stdexcept>
#include <unordered_set>

namespace llmguard {
namespace {

// Placeholder labels must fit <<LABEL_N>> as PIIRestorer recognises it.
bool IsPlaceholderLabel(const std::string& label) {
  if (label.empty() || label[0] < 'A' || label[0] > 'Z') {
    return false;
  }
  for (char c : label) {
    if (!((c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_')) {
      return false;
    }
  }
  return true;
}

Rule CompileRule(const RuleDefinition& def) {
  if (def.id.empty()) {
    throw std::invalid_argument("rule with empty id");
  }
  if (!(def.weight >= 0.0 && def.weight <= 1.0)) {
    throw std::invalid_argument("rule '" + def.id + "': weight " +
                                std::to_string(def.weight) + " outside [0, 1]");
  }
  if (def.category == RuleCategory::kPii && def.replacement_label.empty()) {
    throw std::invalid_argument("rule '" + def.id + "': PII rule needs a replacement label");
  }
  if (def.category == RuleCategory::kPii && !IsPlaceholderLabel(def.replacement_label)) {
    throw std::invalid_argument("rule '" + def.id + "': replacement label '" +
                                def.replacement_label + "' must match [A-Z][A-Z0-9_]*");
  }
  try {
    return Rule{def.id,
                def.category,
                RuleMatcher(def.pattern, def.case_sensitive, def.capture_group),
                def.weight,
                def.replacement_label,
                def.description};
  } catch (const std::invalid_argument& ex) {
    throw std::invalid_argument("rule '" + def.id + "': " + ex.what());
  }
}

}  // namespace

PatternCorpus::PatternCorpus(std::string version,
                             const std::vector<RuleDefinition>& definitions)
    : version_(std::move(version)) {
  std::unordered_set<std::string> seen;
  for (const auto& def : definitions) {
    if (!seen.insert(def.id).second) {
      throw std::invalid_argument("duplicate rule id '" + def.id + "'");
    }
    Rule rule = CompileRule(def);
    switch (rule.category) {
      case RuleCategory::kPii:
        pii_rules_.push_back(std::move(rule));
        break;
      case RuleCategory::kInjection:
        injection_rules_.push_back(std::move(rule));
        break;
      case RuleCategory::kBias:
        bias_rules_.push_back(std::move(rule));
        break;
    }
  }
  log::Debug("corpus", "Compiled rule corpus",
             "version=" + version_ + " pii=" + std::to_string(pii_rules_.size()) +
                 " injection=" + std::to_string(injection_rules_.size()) +
                 " bias=" + std::to_string(bias_rules_.size()));
}

std::shared_ptr<const PatternCorpus> PatternCorpus::Default() {
  static const std::shared_ptr<const PatternCorpus> corpus =
      std::make_shared<PatternCorpus>(kBuiltinCorpusVersion, BuiltinRuleDefinitions());
  return corpus;
}

const std::vector<Rule>& PatternCorpus::RulesFor(RuleCategory category) const {
  switch (category) {
    case RuleCategory::kPii:
      return pii_rules_;
    case RuleCategory::kInjection:
      return injection_rules_;
    case RuleCategory::kBias:
      return bias_rules_;
  }
  return bias_rules_;
}

const Rule* PatternCorpus::FindRule(const std::string& id) const {
  for (const auto* rules : {&pii_rules_, &injection_rules_, &bias_rules_}) {
    for (const auto& rule : *rules) {
      if (rule.id == id) {
        return &rule;
      }
    }
  }
  return nullptr;
}

std::size_t PatternCorpus::Size() const {
  return pii_rules_.size() + injection_rules_.size() + bias_rules_.size();
}

}  // namespace llmguard

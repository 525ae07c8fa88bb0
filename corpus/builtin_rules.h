#pragma once

#include "corpus/rule.h"

#include <vector>

namespace llmguard {

extern const char kBuiltinCorpusVersion[];

// Built-in rule set. PII rules are listed in redaction priority order: more
// specific formats come before looser ones so that exact overlaps resolve to
// the specific category.
std::vector<RuleDefinition> BuiltinRuleDefinitions();

}  // namespace llmguard

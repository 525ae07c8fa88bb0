#include "corpus/builtin_rules.h"

namespace llmguard {

const char kBuiltinCorpusVersion[] = "builtin-1";

namespace {

RuleDefinition PiiRule(const std::string& label, const std::string& pattern,
                       const std::string& description,
                       std::size_t capture_group = 0) {
  RuleDefinition def;
  def.id = "pii_" + label;
  def.category = RuleCategory::kPii;
  def.pattern = pattern;
  def.weight = 1.0;
  def.replacement_label = label;
  def.description = description;
  def.case_sensitive = true;
  def.capture_group = capture_group;
  return def;
}

RuleDefinition ScoredRule(RuleCategory category, const std::string& id,
                          const std::string& pattern, double weight,
                          const std::string& description,
                          bool case_sensitive = false) {
  RuleDefinition def;
  def.id = id;
  def.category = category;
  def.pattern = pattern;
  def.weight = weight;
  def.description = description;
  def.case_sensitive = case_sensitive;
  return def;
}

void AppendPiiRules(std::vector<RuleDefinition>* out) {
  out->push_back(PiiRule("SSN", R"(\b\d{3}-\d{2}-\d{4}\b)", "US social security number"));
  out->push_back(PiiRule("CREDIT_CARD", R"(\b(?:\d[ -]*?){13,19}\b)",
                         "Payment card number, 13 to 19 digits"));
  out->push_back(PiiRule("EMAIL", R"(\b[A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\.[A-Za-z]{2,}\b)",
                         "Email address"));
  out->push_back(PiiRule("PHONE", R"((?:\+?1[-.\s]?)?\(?\d{3}\)?[-.\s]?\d{3}[-.\s]?\d{4}\b)",
                         "North American phone number"));
  out->push_back(PiiRule("IP_ADDRESS",
                         R"(\b(?:(?:25[0-5]|2[0-4]\d|[01]?\d\d?)\.){3}(?:25[0-5]|2[0-4]\d|[01]?\d\d?)\b)",
                         "IPv4 address"));
  out->push_back(PiiRule("DATE_OF_BIRTH", R"(\b\d{1,2}[/-]\d{1,2}[/-]\d{2,4}\b)",
                         "Numeric calendar date"));
  // Two or more capitalised words after sentence or clause punctuation.
  // The punctuation is context only; group 1 is what gets redacted.
  out->push_back(PiiRule("NAME", R"((?:[.!?:,]\s)([A-Z][a-z]+(?:\s[A-Z][a-z]+)+))",
                         "Personal name heuristic", 1));
}

void AppendInjectionRules(std::vector<RuleDefinition>* out) {
  const auto kInjection = RuleCategory::kInjection;
  out->push_back(ScoredRule(
      kInjection, "ignore_previous",
      R"(ignore\s+(?:all\s+)?(?:previous|prior|above|earlier)\s+(?:instructions?|directives?|rules?|prompts?))",
      0.95,
      "Attempts to override the system prompt by telling the model to disregard its "
      "original instructions."));
  out->push_back(ScoredRule(
      kInjection, "reveal_system_prompt",
      R"((?:show|reveal|display|print|output|repeat|tell)\s+(?:me\s+)?(?:the\s+)?(?:system\s+prompt|initial\s+instructions?|hidden\s+prompt))",
      0.90, "Tries to exfiltrate the system prompt or internal instructions."));
  out->push_back(ScoredRule(
      kInjection, "role_play_attack",
      R"((?:you\s+are\s+now|act\s+as|pretend\s+(?:to\s+be|you\s+are)|from\s+now\s+on\s+you\s+are|switch\s+to|enter\s+.*?mode))",
      0.70,
      "Instructs the model to adopt a new persona or mode, which may bypass safety "
      "constraints."));
  out->push_back(ScoredRule(kInjection, "developer_mode",
                            R"((?:developer|debug|admin|maintenance|god)\s*mode)", 0.85,
                            "Requests activation of a privileged mode that does not exist."));
  out->push_back(ScoredRule(kInjection, "encoding_evasion",
                            R"((?:base64|hex|rot13|encode|decode)\s+(?:the\s+following|this))",
                            0.60,
                            "May attempt to smuggle instructions through encoding schemes."));
  out->push_back(ScoredRule(kInjection, "do_anything_now", R"(\bdo\s+anything\s+now\b)", 0.95,
                            "References the 'Do Anything Now' jailbreak."));
  // Upper-case only: "Dan" as a first name must not fire.
  out->push_back(ScoredRule(kInjection, "dan_persona", R"(\bDAN\b)", 0.95,
                            "Names the DAN jailbreak persona.", /*case_sensitive=*/true));
  out->push_back(ScoredRule(
      kInjection, "system_role_injection",
      R"(<\|?(?:system|im_start|im_end)\|?>|\[INST\]|\[/INST\]|###\s*(?:system|instruction))",
      0.90, "Injects raw chat-markup tokens to impersonate a system message."));
  out->push_back(ScoredRule(
      kInjection, "token_smuggling",
      R"((?:ignore|bypass|override)\s+(?:the\s+)?(?:safety|content|filter|guardrail|moderation))",
      0.85, "Directly asks the model to bypass its safety mechanisms."));
}

void AppendBiasRules(std::vector<RuleDefinition>* out) {
  const auto kBias = RuleCategory::kBias;
  out->push_back(ScoredRule(
      kBias, "gender_stereotype",
      R"(\b(?:women|men|girls|boys)\s+(?:are|aren't|can't|should|shouldn't)\s+(?:naturally|inherently|biologically|always|never))",
      0.40, "Gender-stereotyping language detected"));
  out->push_back(ScoredRule(
      kBias, "absolute_generalisation",
      R"(\b(?:all|every|no)\s+(?:men|women|asians?|blacks?|whites?|latinos?|hispanics?|muslims?|christians?|jews?|hindus?)\s+(?:are|have|lack|need))",
      0.40, "Absolute generalisation about a demographic group"));
  out->push_back(ScoredRule(
      kBias, "explicit_stereotyping",
      R"(\b(?:typical|stereotypical|expected)\s+(?:of|for)\s+(?:a|an|the)\s+(?:man|woman|asian|black|white|latino|hispanic|muslim|christian|jew|hindu))",
      0.40, "Explicit stereotyping framing detected"));
  out->push_back(ScoredRule(kBias, "age_stereotype",
                            R"(\b(?:elderly|old\s+people|seniors?)\s+(?:are|can't|shouldn't|always|never)\b)",
                            0.30, "Age-stereotyping language detected"));
  out->push_back(ScoredRule(
      kBias, "disability_stereotype",
      R"(\b(?:disabled|handicapped)\s+(?:people|persons?|individuals?)\s+(?:can't|are\s+unable|should\s+not|never))",
      0.40, "Disability-stereotyping language detected"));
  out->push_back(ScoredRule(
      kBias, "generalisation_marker",
      R"(\b(?:all|every|no|none\s+of\s+the|always|never)\s+(?:men|women|people\s+from|members\s+of|those\s+who)\b)",
      0.35, "Absolute generalisation marker found"));
}

}  // namespace

std::vector<RuleDefinition> BuiltinRuleDefinitions() {
  std::vector<RuleDefinition> defs;
  AppendPiiRules(&defs);
  AppendInjectionRules(&defs);
  AppendBiasRules(&defs);
  return defs;
}

}  // namespace llmguard

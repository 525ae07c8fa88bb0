#include <catch2/catch.hpp>

#include "corpus/builtin_rules.h"
#include "corpus/pattern_corpus.h"

#include <stdexcept>
#include <string>
#include <vector>

namespace {

llmguard::RuleDefinition Def(const std::string& id, llmguard::RuleCategory category,
                             const std::string& pattern, double weight = 0.5) {
  llmguard::RuleDefinition def;
  def.id = id;
  def.category = category;
  def.pattern = pattern;
  def.weight = weight;
  if (category == llmguard::RuleCategory::kPii) {
    def.replacement_label = "TOKEN";
  }
  return def;
}

}  // namespace

TEST_CASE("Default corpus carries the built-in rules", "[corpus]") {
  auto corpus = llmguard::PatternCorpus::Default();
  REQUIRE(corpus);
  REQUIRE(corpus->Version() == llmguard::kBuiltinCorpusVersion);
  REQUIRE(corpus->RulesFor(llmguard::RuleCategory::kPii).size() == 7);
  REQUIRE(corpus->RulesFor(llmguard::RuleCategory::kInjection).size() == 9);
  REQUIRE(corpus->RulesFor(llmguard::RuleCategory::kBias).size() == 6);
  REQUIRE(corpus->Size() == 22);
  // Same instance on every call.
  REQUIRE(llmguard::PatternCorpus::Default().get() == corpus.get());
}

TEST_CASE("PII rules keep their priority order", "[corpus]") {
  const auto& pii = llmguard::PatternCorpus::Default()->RulesFor(llmguard::RuleCategory::kPii);
  std::vector<std::string> labels;
  for (const auto& rule : pii) {
    labels.push_back(rule.replacement_label);
  }
  REQUIRE(labels == std::vector<std::string>{"SSN", "CREDIT_CARD", "EMAIL", "PHONE",
                                             "IP_ADDRESS", "DATE_OF_BIRTH", "NAME"});
}

TEST_CASE("FindRule looks up any category by id", "[corpus]") {
  auto corpus = llmguard::PatternCorpus::Default();
  const auto* rule = corpus->FindRule("ignore_previous");
  REQUIRE(rule != nullptr);
  REQUIRE(rule->category == llmguard::RuleCategory::kInjection);
  REQUIRE(rule->weight == 0.95);
  REQUIRE(corpus->FindRule("pii_EMAIL") != nullptr);
  REQUIRE(corpus->FindRule("no_such_rule") == nullptr);
}

TEST_CASE("Corpus construction rejects bad definitions", "[corpus]") {
  using llmguard::RuleCategory;

  SECTION("Malformed pattern") {
    REQUIRE_THROWS_AS(llmguard::PatternCorpus("t", {Def("broken", RuleCategory::kInjection, "(")}),
                      std::invalid_argument);
  }
  SECTION("Weight outside [0, 1]") {
    REQUIRE_THROWS_AS(
        llmguard::PatternCorpus("t", {Def("heavy", RuleCategory::kBias, "x", 1.5)}),
        std::invalid_argument);
    REQUIRE_THROWS_AS(
        llmguard::PatternCorpus("t", {Def("negative", RuleCategory::kBias, "x", -0.1)}),
        std::invalid_argument);
  }
  SECTION("Duplicate id") {
    REQUIRE_THROWS_AS(llmguard::PatternCorpus("t", {Def("dup", RuleCategory::kInjection, "a"),
                                                    Def("dup", RuleCategory::kBias, "b")}),
                      std::invalid_argument);
  }
  SECTION("Empty id") {
    REQUIRE_THROWS_AS(llmguard::PatternCorpus("t", {Def("", RuleCategory::kInjection, "a")}),
                      std::invalid_argument);
  }
  SECTION("PII rule without a label") {
    auto def = Def("pii_x", RuleCategory::kPii, "x");
    def.replacement_label.clear();
    REQUIRE_THROWS_AS(llmguard::PatternCorpus("t", {def}), std::invalid_argument);
  }
  SECTION("PII label that cannot form a placeholder") {
    auto spaced = Def("employee_id", RuleCategory::kPii, "EMP-\\d{6}");
    spaced.replacement_label = "employee id";
    REQUIRE_THROWS_AS(llmguard::PatternCorpus("t", {spaced}), std::invalid_argument);
    auto lower = Def("pii_lower", RuleCategory::kPii, "x");
    lower.replacement_label = "email";
    REQUIRE_THROWS_AS(llmguard::PatternCorpus("t", {lower}), std::invalid_argument);
    auto digit_first = Def("pii_digit", RuleCategory::kPii, "x");
    digit_first.replacement_label = "1D";
    REQUIRE_THROWS_AS(llmguard::PatternCorpus("t", {digit_first}), std::invalid_argument);
    auto ok = Def("pii_ok", RuleCategory::kPii, "x");
    ok.replacement_label = "EMPLOYEE_ID2";
    REQUIRE_NOTHROW(llmguard::PatternCorpus("t", {ok}));
  }
  SECTION("Capture group not in pattern") {
    auto def = Def("grouped", RuleCategory::kInjection, "(a)b");
    def.capture_group = 2;
    REQUIRE_THROWS_AS(llmguard::PatternCorpus("t", {def}), std::invalid_argument);
  }
}

TEST_CASE("Corpus error names the offending rule", "[corpus]") {
  try {
    llmguard::PatternCorpus corpus("t", {Def("broken_rule", llmguard::RuleCategory::kBias, "[")});
    FAIL("expected std::invalid_argument");
  } catch (const std::invalid_argument& ex) {
    REQUIRE(std::string(ex.what()).find("broken_rule") != std::string::npos);
  }
}

TEST_CASE("RuleMatcher keeps word-boundary context when resuming", "[corpus]") {
  llmguard::RuleMatcher matcher(R"(\bcat\b)", false, 0);
  std::string text = "concat cat";
  auto span = matcher.FindFrom(text, 3);
  REQUIRE(span.has_value());
  REQUIRE(span->begin == 7);
  REQUIRE(span->end == 10);
  REQUIRE_FALSE(matcher.FindFrom(text, 8).has_value());
}

TEST_CASE("RuleMatcher honours case sensitivity", "[corpus]") {
  llmguard::RuleMatcher sensitive(R"(\bDAN\b)", true, 0);
  llmguard::RuleMatcher insensitive(R"(\bDAN\b)", false, 0);
  REQUIRE(sensitive.Matches("you are DAN now"));
  REQUIRE_FALSE(sensitive.Matches("Dan went home"));
  REQUIRE(insensitive.Matches("Dan went home"));
}

TEST_CASE("RuleMatcher reports the capture group span", "[corpus]") {
  llmguard::RuleMatcher matcher(R"(id=(\d+))", true, 1);
  std::string text = "user id=4821 ok";
  auto span = matcher.FindFrom(text, 0);
  REQUIRE(span.has_value());
  REQUIRE(text.substr(span->begin, span->end - span->begin) == "4821");
}

TEST_CASE("RuleMatcher counts non-overlapping matches", "[corpus]") {
  llmguard::RuleMatcher matcher(R"(\bmaybe\b)", false, 0);
  REQUIRE(matcher.CountMatches("Maybe yes, maybe no, maybe.") == 3);
  REQUIRE(matcher.CountMatches("") == 0);
}

TEST_CASE("Category names round-trip through ParseCategory", "[corpus]") {
  llmguard::RuleCategory parsed;
  REQUIRE(llmguard::ParseCategory("PII", &parsed));
  REQUIRE(parsed == llmguard::RuleCategory::kPii);
  REQUIRE(llmguard::ParseCategory(llmguard::CategoryName(llmguard::RuleCategory::kBias), &parsed));
  REQUIRE(parsed == llmguard::RuleCategory::kBias);
  REQUIRE_FALSE(llmguard::ParseCategory("toxicity", &parsed));
}

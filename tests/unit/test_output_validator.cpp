#include <catch2/catch.hpp>

#include "guards/json_schema_check.h"
#include "guards/output_validator.h"

#include <string>
#include <vector>

using Catch::Detail::Approx;

namespace {

bool HasKind(const llmguard::ValidationResult& result, const std::string& kind) {
  for (const auto& violation : result.violations) {
    if (violation.kind == kind) {
      return true;
    }
  }
  return false;
}

const char* kAnswerSchema =
    R"({"type":"object","required":["answer"],"properties":{"answer":{"type":"string"}}})";

}  // namespace

TEST_CASE("Plain factual output is valid", "[validator]") {
  llmguard::OutputValidator validator;
  auto result = validator.Validate("The capital of France is Paris.");
  REQUIRE(result.is_valid);
  REQUIRE(result.violations.empty());
  REQUIRE(result.hallucination_score == 0.0);
}

TEST_CASE("Output longer than the limit is flagged", "[validator]") {
  llmguard::ValidationRules rules;
  rules.max_output_length = 10;
  llmguard::OutputValidator validator(rules);
  auto result = validator.Validate("twenty characters!!!");
  REQUIRE_FALSE(result.is_valid);
  REQUIRE(result.violations.size() == 1);
  REQUIRE(result.violations[0].kind == "max_length");
  REQUIRE(result.violations[0].detail == "Output length (20) exceeds maximum (10)");
}

TEST_CASE("Length counts characters, not bytes", "[validator]") {
  llmguard::ValidationRules rules;
  rules.max_output_length = 5;
  llmguard::OutputValidator validator(rules);
  // Five code points, ten bytes.
  REQUIRE(validator.Validate("\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9").is_valid);
}

TEST_CASE("Keyword checks are case-insensitive", "[validator]") {
  llmguard::ValidationRules rules;
  rules.blocked_keywords = {"Secret"};
  rules.required_keywords = {"disclaimer"};
  llmguard::OutputValidator validator(rules);

  auto result = validator.Validate("This is SECRET material.");
  REQUIRE_FALSE(result.is_valid);
  REQUIRE(result.violations.size() == 2);
  REQUIRE(result.violations[0].kind == "blocked_keyword");
  REQUIRE(result.violations[0].detail == "Blocked keyword found: 'secret'");
  REQUIRE(result.violations[1].kind == "required_keyword");
  REQUIRE(result.violations[1].detail == "Required keyword missing: 'disclaimer'");

  REQUIRE(validator.Validate("Standard DISCLAIMER applies.").is_valid);
}

TEST_CASE("Schema check accepts conforming JSON", "[validator]") {
  llmguard::OutputValidator validator;
  REQUIRE(validator.Validate(R"({"answer":"Paris"})", std::string(kAnswerSchema)).is_valid);
}

TEST_CASE("Schema check reports type and missing keys", "[validator]") {
  llmguard::OutputValidator validator;

  auto wrong_type = validator.Validate(R"({"answer":42})", std::string(kAnswerSchema));
  REQUIRE_FALSE(wrong_type.is_valid);
  REQUIRE(wrong_type.violations.size() == 1);
  REQUIRE(wrong_type.violations[0].kind == "json_schema");
  REQUIRE(wrong_type.violations[0].detail == "$.answer: expected string, got integer");

  auto missing = validator.Validate(R"({"other":"x"})", std::string(kAnswerSchema));
  REQUIRE(missing.violations.size() == 1);
  REQUIRE(missing.violations[0].detail == "$: required key missing: 'answer'");
}

TEST_CASE("Non-JSON output fails a schema check", "[validator]") {
  llmguard::OutputValidator validator;
  auto result = validator.Validate("Paris", std::string(kAnswerSchema));
  REQUIRE(HasKind(result, "json_schema"));
  REQUIRE(result.violations[0].detail.rfind("Output is not valid JSON", 0) == 0);
}

TEST_CASE("Malformed schema is reported, not thrown", "[validator]") {
  llmguard::OutputValidator validator;
  llmguard::ValidationResult result;
  REQUIRE_NOTHROW(result = validator.Validate(R"({"answer":"Paris"})", std::string("{not json")));
  REQUIRE_FALSE(result.is_valid);
  REQUIRE(result.violations[0].kind == "json_schema");
  REQUIRE(result.violations[0].detail.rfind("Invalid schema JSON", 0) == 0);
}

TEST_CASE("Heavy hedging is flagged as possible hallucination", "[validator]") {
  llmguard::OutputValidator validator;
  std::string text = "I think maybe it is probably fine";
  REQUIRE(validator.HedgingDensity(text) == Approx(3.0 / 7.0));
  auto result = validator.Validate(text);
  REQUIRE_FALSE(result.is_valid);
  REQUIRE(HasKind(result, "hallucination"));
  REQUIRE(result.hallucination_score == Approx(0.4286));
}

TEST_CASE("Occasional hedging stays under the density threshold", "[validator]") {
  llmguard::OutputValidator validator;
  std::string text =
      "Paris has been the capital of France for centuries and it is probably the "
      "most visited city in Europe according to most tourism surveys.";
  auto result = validator.Validate(text);
  REQUIRE(result.is_valid);
  REQUIRE(result.hallucination_score > 0.0);
  REQUIRE(result.hallucination_score <= llmguard::kHedgingDensityThreshold);
}

TEST_CASE("Hallucination check can be switched off", "[validator]") {
  llmguard::ValidationRules rules;
  rules.check_hallucination = false;
  llmguard::OutputValidator validator(rules);
  REQUIRE(validator.Validate("Maybe. Perhaps. Probably.").is_valid);
}

TEST_CASE("Violations accumulate across checks", "[validator]") {
  llmguard::ValidationRules rules;
  rules.max_output_length = 5;
  rules.blocked_keywords = {"maybe"};
  llmguard::OutputValidator validator(rules);
  auto result = validator.Validate("maybe maybe", std::string(kAnswerSchema));
  REQUIRE(HasKind(result, "max_length"));
  REQUIRE(HasKind(result, "blocked_keyword"));
  REQUIRE(HasKind(result, "json_schema"));
  REQUIRE(HasKind(result, "hallucination"));
  REQUIRE(result.violations.front().kind == "max_length");
  REQUIRE(result.violations.back().kind == "hallucination");
}

TEST_CASE("Schema subset covers nested structures", "[validator][schema]") {
  auto schema = nlohmann::json::parse(R"({
    "type": "object",
    "additionalProperties": false,
    "properties": {
      "tags": {"type": "array", "minItems": 1, "items": {"type": "string", "maxLength": 3}},
      "score": {"type": "number", "minimum": 0, "maximum": 1},
      "level": {"enum": ["low", "high"]},
      "count": {"type": "integer"}
    }
  })");

  std::vector<std::string> problems;
  llmguard::CheckAgainstSchema(
      nlohmann::json::parse(R"({"tags":["a","bb"],"score":0.5,"level":"low","count":3.0})"),
      schema, &problems);
  REQUIRE(problems.empty());

  llmguard::CheckAgainstSchema(
      nlohmann::json::parse(R"({"tags":["toolong"],"score":2,"level":"mid","extra":1})"), schema,
      &problems);
  REQUIRE(problems.size() == 4);
  REQUIRE(problems[0] == "$: unexpected key 'extra'");
}

#include <catch2/catch.hpp>

#include "guards/pii_redactor.h"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

std::string Lookup(const llmguard::RedactionMapping& mapping, const std::string& placeholder) {
  const std::string* value = mapping.Find(placeholder);
  return value ? *value : std::string();
}

}  // namespace

TEST_CASE("Redactor replaces an SSN", "[redactor]") {
  llmguard::PIIRedactor redactor;
  auto out = redactor.Redact("My SSN is 123-45-6789.");
  REQUIRE(out.sanitised_text == "My SSN is <<SSN_1>>.");
  REQUIRE(out.mapping.Size() == 1);
  REQUIRE(Lookup(out.mapping, "<<SSN_1>>") == "123-45-6789");
}

TEST_CASE("Redactor numbers placeholders per label and reuses repeats", "[redactor]") {
  llmguard::PIIRedactor redactor;
  auto out = redactor.Redact("Mail a@x.com, b@y.com, a@x.com");
  REQUIRE(out.sanitised_text == "Mail <<EMAIL_1>>, <<EMAIL_2>>, <<EMAIL_1>>");
  REQUIRE(out.mapping.Size() == 2);
  REQUIRE(out.mapping.Entries()[0].first == "<<EMAIL_1>>");
  REQUIRE(out.mapping.Entries()[0].second == "a@x.com");
  REQUIRE(out.mapping.Entries()[1].first == "<<EMAIL_2>>");
  REQUIRE(out.mapping.Entries()[1].second == "b@y.com");
}

TEST_CASE("Redactor handles several categories in one text", "[redactor]") {
  llmguard::PIIRedactor redactor;
  std::string text =
      "Reach me at john@example.com or 555-123-4567, server 192.168.1.10, born 01/15/1990.";
  auto out = redactor.Redact(text);
  REQUIRE(out.sanitised_text ==
          "Reach me at <<EMAIL_1>> or <<PHONE_1>>, server <<IP_ADDRESS_1>>, born "
          "<<DATE_OF_BIRTH_1>>.");
  REQUIRE(Lookup(out.mapping, "<<PHONE_1>>") == "555-123-4567");
  REQUIRE(Lookup(out.mapping, "<<IP_ADDRESS_1>>") == "192.168.1.10");
  REQUIRE(Lookup(out.mapping, "<<DATE_OF_BIRTH_1>>") == "01/15/1990");
}

TEST_CASE("Redactor recognises payment cards and bracketed phones", "[redactor]") {
  llmguard::PIIRedactor redactor;

  SECTION("Card with spaces") {
    auto out = redactor.Redact("Card 4111 1111 1111 1111 on file");
    REQUIRE(out.sanitised_text == "Card <<CREDIT_CARD_1>> on file");
    REQUIRE(Lookup(out.mapping, "<<CREDIT_CARD_1>>") == "4111 1111 1111 1111");
  }
  SECTION("Phone with area code in brackets") {
    auto out = redactor.Redact("Call (555) 123-4567 today");
    REQUIRE(out.sanitised_text == "Call <<PHONE_1>> today");
    REQUIRE(Lookup(out.mapping, "<<PHONE_1>>") == "(555) 123-4567");
  }
}

TEST_CASE("Redactor redacts only the name after clause punctuation", "[redactor]") {
  llmguard::PIIRedactor redactor;
  auto out = redactor.Redact("Please forward this to: Jane Doe tomorrow.");
  REQUIRE(out.sanitised_text == "Please forward this to: <<NAME_1>> tomorrow.");
  REQUIRE(Lookup(out.mapping, "<<NAME_1>>") == "Jane Doe");
}

TEST_CASE("Redactor leaves clean text alone", "[redactor]") {
  llmguard::PIIRedactor redactor;
  auto out = redactor.Redact("What is the capital of France?");
  REQUIRE(out.sanitised_text == "What is the capital of France?");
  REQUIRE(out.mapping.Empty());

  auto empty = redactor.Redact("");
  REQUIRE(empty.sanitised_text.empty());
  REQUIRE(empty.mapping.Empty());
}

TEST_CASE("Redact then Restore returns the original text", "[redactor]") {
  llmguard::PIIRedactor redactor;
  std::string text = "SSN 123-45-6789, mail ann@corp.io, again ann@corp.io.";
  auto out = redactor.Redact(text);
  REQUIRE(out.sanitised_text.find("ann@corp.io") == std::string::npos);
  REQUIRE(llmguard::PIIRedactor::Restore(out.sanitised_text, out.mapping) == text);
}

TEST_CASE("Redactor prefers the earlier rule on an exact overlap", "[redactor]") {
  std::vector<llmguard::RuleDefinition> defs(2);
  defs[0].id = "pii_first";
  defs[0].category = llmguard::RuleCategory::kPii;
  defs[0].pattern = R"(\d{4})";
  defs[0].replacement_label = "FIRST";
  defs[1].id = "pii_second";
  defs[1].category = llmguard::RuleCategory::kPii;
  defs[1].pattern = R"(\d{4})";
  defs[1].replacement_label = "SECOND";
  auto corpus = std::make_shared<llmguard::PatternCorpus>("tie", defs);

  llmguard::PIIRedactor redactor(corpus);
  auto out = redactor.Redact("pin 1234");
  REQUIRE(out.sanitised_text == "pin <<FIRST_1>>");
}

TEST_CASE("Redactor scans a very long token without exhausting the stack", "[redactor]") {
  llmguard::PIIRedactor redactor;
  std::string token(200000, 'a');
  auto plain = redactor.Redact(token);
  REQUIRE(plain.sanitised_text == token);
  REQUIRE(plain.mapping.Empty());

  auto mixed = redactor.Redact(token + " reach me at jo@example.com " + token);
  REQUIRE(mixed.sanitised_text == token + " reach me at <<EMAIL_1>> " + token);
  REQUIRE(Lookup(mixed.mapping, "<<EMAIL_1>>") == "jo@example.com");
}

TEST_CASE("Redactor rejects a null corpus", "[redactor]") {
  REQUIRE_THROWS_AS(llmguard::PIIRedactor(nullptr), std::invalid_argument);
}

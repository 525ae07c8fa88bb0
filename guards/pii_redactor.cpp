#include "guards/pii_redactor.h"

#include "guards/pii_restorer.h"
#include "logging/logger.h"

#include <map>
#include <optional>
#include <stdexcept>
#include <unordered_map>
#include <utility>
#include <vector>

namespace llmguard {

PIIRedactor::PIIRedactor(std::shared_ptr<const PatternCorpus> corpus)
    : corpus_(std::move(corpus)) {
  if (!corpus_) {
    throw std::invalid_argument("PIIRedactor requires a pattern corpus");
  }
}

RedactionOutput PIIRedactor::Redact(const std::string& text) const {
  RedactionOutput output;
  const auto& rules = corpus_->RulesFor(RuleCategory::kPii);
  if (text.empty() || rules.empty()) {
    output.sanitised_text = text;
    return output;
  }

  // Next match of each rule at or after the scan position. A rule with no
  // further match is dropped for the rest of the scan.
  std::vector<std::optional<MatchSpan>> next(rules.size());
  std::vector<bool> exhausted(rules.size(), false);
  std::unordered_map<std::string, std::size_t> counters;
  std::map<std::pair<std::string, std::string>, std::string> assigned;

  std::string& out = output.sanitised_text;
  out.reserve(text.size());
  std::size_t pos = 0;
  while (pos < text.size()) {
    int best = -1;
    for (std::size_t i = 0; i < rules.size(); ++i) {
      if (exhausted[i]) {
        continue;
      }
      if (!next[i] || next[i]->begin < pos) {
        next[i] = rules[i].matcher.FindFrom(text, pos);
        if (!next[i]) {
          exhausted[i] = true;
          continue;
        }
      }
      if (best < 0 || next[i]->begin < next[static_cast<std::size_t>(best)]->begin) {
        best = static_cast<int>(i);
      }
    }
    if (best < 0) {
      break;
    }

    const Rule& rule = rules[static_cast<std::size_t>(best)];
    MatchSpan span = *next[static_cast<std::size_t>(best)];
    out.append(text, pos, span.begin - pos);

    std::string value = text.substr(span.begin, span.end - span.begin);
    auto key = std::make_pair(rule.replacement_label, value);
    auto it = assigned.find(key);
    if (it == assigned.end()) {
      std::string placeholder =
          PIIRestorer::MakePlaceholder(rule.replacement_label, ++counters[rule.replacement_label]);
      output.mapping.Insert(placeholder, value);
      it = assigned.emplace(std::move(key), std::move(placeholder)).first;
    }
    out += it->second;
    pos = span.end;
  }
  if (pos < text.size()) {
    out.append(text, pos, std::string::npos);
  }

  if (!output.mapping.Empty()) {
    log::Debug("redactor", "Redacted PII",
               "placeholders=" + std::to_string(output.mapping.Size()));
  }
  return output;
}

std::string PIIRedactor::Restore(const std::string& text, const RedactionMapping& mapping) {
  return PIIRestorer::Restore(text, mapping);
}

}  // namespace llmguard

#pragma once

#include "corpus/pattern_corpus.h"
#include "guards/redaction_mapping.h"

#include <memory>
#include <string>

namespace llmguard {

struct RedactionOutput {
  std::string sanitised_text;
  RedactionMapping mapping;
};

// Replaces PII matches with <<LABEL_N>> placeholders.
//
// The text is scanned once, left to right. At each position the PII rules are
// tried in corpus order and the leftmost match wins; on an exact tie the
// earlier rule wins. N counts distinct values per label starting at 1, and a
// value seen again in the same call reuses its placeholder. The redactor keeps
// no per-call state, so one instance can serve many threads.
class PIIRedactor {
 public:
  // Throws std::invalid_argument if `corpus` is null.
  explicit PIIRedactor(std::shared_ptr<const PatternCorpus> corpus = PatternCorpus::Default());

  RedactionOutput Redact(const std::string& text) const;

  // Same as PIIRestorer::Restore.
  static std::string Restore(const std::string& text, const RedactionMapping& mapping);

 private:
  std::shared_ptr<const PatternCorpus> corpus_;
};

}  // namespace llmguard

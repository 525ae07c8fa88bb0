#pragma once

#include "guards/redaction_mapping.h"

#include <cstddef>
#include <string>
#include <vector>

namespace llmguard {

// Inverse of PIIRedactor. Restoration is total: placeholders missing from the
// mapping stay in the text verbatim and are never reported as errors.
class PIIRestorer {
 public:
  // Single left-to-right pass; restored values are not rescanned.
  static std::string Restore(const std::string& text, const RedactionMapping& mapping);

  // Placeholder-shaped tokens in `text` that `mapping` cannot resolve, in
  // order of first appearance, without duplicates.
  static std::vector<std::string> FindUnresolvedPlaceholders(const std::string& text,
                                                             const RedactionMapping& mapping);

  // "<<EMAIL_3>>" for ("EMAIL", 3).
  static std::string MakePlaceholder(const std::string& label, std::size_t index);

  // Length of the placeholder token starting at `pos`, or 0 if none starts
  // there. Shape: "<<" LABEL "_" DIGITS ">>", LABEL in [A-Z][A-Z0-9_]*.
  static std::size_t PlaceholderLengthAt(const std::string& text, std::size_t pos);
};

}  // namespace llmguard

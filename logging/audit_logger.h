#pragma once

#include "pipeline/guardrails_pipeline.h"

#include <fstream>
#include <mutex>
#include <string>

namespace llmguard {

// Append-only JSON-lines record of guard decisions.
//
// Raw text is written only as a SHA-256 digest. In debug mode the redacted
// form of the text is written as well; original PII values and mapping
// contents are never written, only placeholder counts.
class AuditLogger {
 public:
  AuditLogger() = default;
  explicit AuditLogger(const std::string& path, bool debug_mode = false);

  bool Enabled() const { return stream_.is_open(); }

  // `text` is the caller input as received, before redaction.
  void LogInput(const std::string& subject, const std::string& text,
                const PreProcessResult& result);

  // `text` is the LLM output as received, before restoration.
  void LogOutput(const std::string& subject, const std::string& text,
                 const PostProcessResult& result);

  // SHA-256 hex digest (64 chars).
  static std::string HashContent(const std::string& content);

 private:
  void Write(const std::string& line);

  std::ofstream stream_;
  std::mutex mutex_;
  bool debug_mode_{false};
};

}  // namespace llmguard

#include "logging/audit_logger.h"

#include <nlohmann/json.hpp>
#include <openssl/sha.h>

#include <chrono>
#include <iomanip>
#include <sstream>

using json = nlohmann::json;

namespace llmguard {
namespace {

long long NowSeconds() {
  auto now = std::chrono::system_clock::now();
  return std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();
}

}  // namespace

AuditLogger::AuditLogger(const std::string& path, bool debug_mode)
    : debug_mode_(debug_mode) {
  if (!path.empty()) {
    stream_.open(path, std::ios::app);
  }
}

std::string AuditLogger::HashContent(const std::string& content) {
  unsigned char hash[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char*>(content.data()), content.size(), hash);
  std::ostringstream hex;
  hex << std::hex << std::setfill('0');
  for (int i = 0; i < SHA256_DIGEST_LENGTH; ++i) {
    hex << std::setw(2) << static_cast<int>(hash[i]);
  }
  return hex.str();
}

void AuditLogger::LogInput(const std::string& subject, const std::string& text,
                           const PreProcessResult& result) {
  if (!Enabled()) {
    return;
  }
  json j;
  j["timestamp"] = NowSeconds();
  j["subject"] = subject;
  j["stage"] = "input";
  j["status"] = result.blocked ? "blocked" : "allowed";
  j["injection_score"] = result.injection.score;
  j["matched_rules"] = result.injection.matched_rules;
  j["placeholders"] = result.pii_mapping.Size();
  j["input_sha256"] = HashContent(text);
  if (debug_mode_) {
    j["sanitised_text"] = result.sanitised_text;
  }
  Write(j.dump());
}

void AuditLogger::LogOutput(const std::string& subject, const std::string& text,
                            const PostProcessResult& result) {
  if (!Enabled()) {
    return;
  }
  json j;
  j["timestamp"] = NowSeconds();
  j["subject"] = subject;
  j["stage"] = "output";
  j["status"] = result.validation.is_valid ? "valid" : "invalid";
  json kinds = json::array();
  for (const auto& violation : result.validation.violations) {
    kinds.push_back(violation.kind);
  }
  j["violations"] = kinds;
  j["bias_score"] = result.bias.score;
  j["bias_rules"] = result.bias.matched_rules;
  j["unresolved_placeholders"] = result.unresolved_placeholders.size();
  j["output_sha256"] = HashContent(text);
  if (debug_mode_) {
    // Pre-restoration text: placeholders only, no PII values.
    j["output_text"] = text;
  }
  Write(j.dump());
}

void AuditLogger::Write(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  stream_ << line << "\n";
  stream_.flush();
}

}  // namespace llmguard

#pragma once

#include <string>

namespace llmguard {

// guardctl arguments after the command word.
struct CliOptions {
  std::string command;
  std::string config_path;
  std::string rules_override;
  std::string audit_override;
  std::string subject{"cli"};
  std::string text;
  bool has_text{false};
  std::string response;
  bool has_response{false};
  std::string mapping_json;
  std::string schema_path;
  std::string category;
  bool log_json{false};
  std::string log_level;
};

// argv[1] is the command; options follow. Fails on an unknown option, an
// option missing its value, or "-" given to both --text and --response
// (stdin can be read only once).
bool ParseCliArgs(int argc, const char* const* argv, CliOptions* out, std::string* error);

}  // namespace llmguard

#include "cli/cli_options.h"

#include <utility>

namespace llmguard {

bool ParseCliArgs(int argc, const char* const* argv, CliOptions* out, std::string* error) {
  auto fail = [&](const std::string& message) {
    if (error) {
      *error = message;
    }
    return false;
  };
  if (!out) {
    return fail("internal error: null options target");
  }
  if (argc < 2) {
    return fail("missing command");
  }
  CliOptions opts;
  opts.command = argv[1];
  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];
    bool has_value = i + 1 < argc;
    if (arg == "--log-json") {
      opts.log_json = true;
      continue;
    }
    std::string* target = nullptr;
    if (arg == "--config") {
      target = &opts.config_path;
    } else if (arg == "--rules") {
      target = &opts.rules_override;
    } else if (arg == "--audit-log") {
      target = &opts.audit_override;
    } else if (arg == "--subject") {
      target = &opts.subject;
    } else if (arg == "--text") {
      target = &opts.text;
      opts.has_text = true;
    } else if (arg == "--response") {
      target = &opts.response;
      opts.has_response = true;
    } else if (arg == "--mapping") {
      target = &opts.mapping_json;
    } else if (arg == "--schema") {
      target = &opts.schema_path;
    } else if (arg == "--category") {
      target = &opts.category;
    } else if (arg == "--log-level") {
      target = &opts.log_level;
    } else {
      return fail("Unknown option: " + arg);
    }
    if (!has_value) {
      return fail("Option " + arg + " needs a value");
    }
    *target = argv[++i];
  }
  if (opts.has_text && opts.has_response && opts.text == "-" && opts.response == "-") {
    return fail("--text and --response cannot both read stdin");
  }
  *out = std::move(opts);
  return true;
}

}  // namespace llmguard

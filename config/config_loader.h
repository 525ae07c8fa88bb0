#pragma once

#include "corpus/pattern_corpus.h"
#include "pipeline/pipeline_config.h"

#include <memory>
#include <string>
#include <vector>

namespace llmguard {

// Everything guardctl reads from the config file and the environment.
struct GuardConfig {
  PipelineConfig pipeline;
  // Optional YAML rule file replacing (or extending) the built-in corpus.
  std::string rules_file;
  std::string audit_log_path;
  bool audit_debug{false};
  bool log_json{false};
  std::string log_level{"info"};
};

// Reads a YAML config with optional "guardrails" and "logging" sections.
// Keys not present keep the values already in `*out`.
bool LoadGuardConfig(const std::string& path, GuardConfig* out, std::string* error);

// Applies LLMGUARD_* environment variables on top of `config`. Values that do
// not parse are logged and ignored.
void ApplyEnvOverrides(GuardConfig* config);

// Reads a YAML rule file:
//   version: "custom-1"
//   include_builtin: false
//   rules:
//     - id: ...
//       category: pii | injection | bias
//       pattern: ...
//       weight: 0.8
//       label: EMAIL            # PII only
//       description: ...
//       case_sensitive: false
//       capture_group: 0
// With include_builtin the built-in definitions come first.
bool LoadRuleFile(const std::string& path, std::string* version,
                  std::vector<RuleDefinition>* out, std::string* error);

// Built-in corpus when `rules_file` is empty, otherwise one compiled from the
// file. Compilation failures are returned through `error`.
std::shared_ptr<const PatternCorpus> LoadCorpus(const std::string& rules_file, std::string* error);

}  // namespace llmguard

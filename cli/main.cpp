#include "cli/cli_options.h"
#include "config/config_loader.h"
#include "guards/rule_scoring.h"
#include "logging/audit_logger.h"
#include "logging/logger.h"
#include "pipeline/guardrails_pipeline.h"
#include "pipeline/result_json.h"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

using ordered_json = nlohmann::ordered_json;

namespace {

constexpr const char* kVersion = "0.1.0";
constexpr const char* kDefaultConfigPath = "config/guardrails.yaml";

void PrintUsage() {
  std::cout
      << "Usage:\n"
      << "  guardctl input --text TEXT\n"
      << "      Redact PII and score the text for prompt injection.\n"
      << "  guardctl output --text TEXT [--mapping JSON] [--schema FILE]\n"
      << "      Validate and bias-score LLM output, then restore PII from the "
         "mapping.\n"
      << "  guardctl full --text TEXT [--response TEXT]\n"
      << "      Input guards, a canned LLM response, then output guards.\n"
      << "  guardctl rules [--category pii|injection|bias]\n"
      << "  guardctl config\n"
      << "  guardctl health\n"
      << "Global options:\n"
      << "  --config PATH      YAML config (default " << kDefaultConfigPath << ")\n"
      << "  --rules PATH       YAML rule file replacing the built-in corpus\n"
      << "  --audit-log PATH   append guard decisions as JSON lines\n"
      << "  --subject NAME     caller identity recorded in the audit log\n"
      << "  --log-json         structured logs on stderr\n"
      << "  --log-level LEVEL  debug|info|warn|error\n"
      << "Pass '-' as TEXT to read it from stdin (once per call).\n";
}

bool ReadFile(const std::string& path, std::string* out) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return false;
  }
  out->assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
  return true;
}

std::string ResolveText(const std::string& value) {
  if (value != "-") {
    return value;
  }
  return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
}

void Print(const ordered_json& j) { std::cout << j.dump(2) << std::endl; }

int CmdRules(const llmguard::PatternCorpus& corpus, const std::string& category_filter) {
  ordered_json out;
  out["version"] = corpus.Version();
  const llmguard::RuleCategory all[] = {llmguard::RuleCategory::kPii,
                                        llmguard::RuleCategory::kInjection,
                                        llmguard::RuleCategory::kBias};
  for (auto category : all) {
    if (!category_filter.empty()) {
      llmguard::RuleCategory wanted;
      if (!llmguard::ParseCategory(category_filter, &wanted)) {
        llmguard::log::Error("guardctl", "Unknown rule category", category_filter);
        return 1;
      }
      if (wanted != category) {
        continue;
      }
    }
    out[llmguard::CategoryName(category)] =
        llmguard::ToJson(llmguard::DescribeRules(corpus, category));
  }
  Print(out);
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  if (argc < 2) {
    PrintUsage();
    return 1;
  }
  std::string command = argv[1];
  if (command == "--help" || command == "-h" || command == "help") {
    PrintUsage();
    return 0;
  }

  llmguard::CliOptions opts;
  std::string error;
  if (!llmguard::ParseCliArgs(argc, argv, &opts, &error)) {
    std::cerr << error << "\n";
    PrintUsage();
    return 1;
  }

  if (command == "health") {
    Print(ordered_json{{"status", "ok"}, {"version", kVersion}});
    return 0;
  }

  llmguard::GuardConfig config;
  std::string effective_config = opts.config_path.empty() ? kDefaultConfigPath : opts.config_path;
  if (std::filesystem::exists(effective_config)) {
    if (!llmguard::LoadGuardConfig(effective_config, &config, &error)) {
      llmguard::log::Error("guardctl", error);
      return 1;
    }
  } else if (!opts.config_path.empty()) {
    llmguard::log::Error("guardctl", "Config file not found", opts.config_path);
    return 1;
  }
  llmguard::ApplyEnvOverrides(&config);
  if (!opts.rules_override.empty()) config.rules_file = opts.rules_override;
  if (!opts.audit_override.empty()) config.audit_log_path = opts.audit_override;
  if (opts.log_json) config.log_json = true;
  if (!opts.log_level.empty()) config.log_level = opts.log_level;

  llmguard::log::SetJsonMode(config.log_json);
  llmguard::log::Level level;
  if (llmguard::log::ParseLevel(config.log_level, &level)) {
    llmguard::log::SetMinLevel(level);
  } else {
    llmguard::log::Warn("guardctl", "Unknown log level, keeping info", config.log_level);
  }

  auto corpus = llmguard::LoadCorpus(config.rules_file, &error);
  if (!corpus) {
    llmguard::log::Error("guardctl", error);
    return 1;
  }

  if (command == "rules") {
    return CmdRules(*corpus, opts.category);
  }
  if (command == "config") {
    Print(llmguard::ToJson(config.pipeline));
    return 0;
  }

  if (command != "input" && command != "output" && command != "full") {
    PrintUsage();
    return 1;
  }
  if (!opts.has_text) {
    std::cerr << "--text is required" << std::endl;
    return 1;
  }

  try {
    llmguard::GuardrailsPipeline pipeline(config.pipeline, corpus);
    llmguard::AuditLogger audit(config.audit_log_path, config.audit_debug);
    if (!config.audit_log_path.empty() && !audit.Enabled()) {
      llmguard::log::Warn("guardctl", "Audit log could not be opened", config.audit_log_path);
    }
    std::string text = ResolveText(opts.text);

    if (command == "input") {
      auto pre = pipeline.PreProcess(text);
      audit.LogInput(opts.subject, text, pre);
      Print(llmguard::ToJson(pre));
      return 0;
    }

    if (command == "output") {
      llmguard::RedactionMapping mapping;
      if (!opts.mapping_json.empty() &&
          !llmguard::ParseMapping(opts.mapping_json, &mapping, &error)) {
        llmguard::log::Error("guardctl", error);
        return 1;
      }
      std::optional<std::string> schema = config.pipeline.output_schema;
      if (!opts.schema_path.empty()) {
        std::string schema_text;
        if (!ReadFile(opts.schema_path, &schema_text)) {
          llmguard::log::Error("guardctl", "Cannot read schema file", opts.schema_path);
          return 1;
        }
        schema = schema_text;
      }
      auto post = pipeline.PostProcess(text, mapping, schema);
      audit.LogOutput(opts.subject, text, post);
      Print(llmguard::ToJson(post));
      return 0;
    }

    // full
    std::string llm_response;
    auto result = pipeline.Run(text, [&](const std::string& sanitised) {
      llm_response = opts.has_response ? ResolveText(opts.response)
                                       : "[Simulated LLM response to]: " + sanitised;
      return llm_response;
    });
    audit.LogInput(opts.subject, text, result.pre);
    if (result.post) {
      audit.LogOutput(opts.subject, llm_response, *result.post);
    }
    Print(llmguard::ToJson(result));
    return 0;
  } catch (const std::invalid_argument& ex) {
    llmguard::log::Error("guardctl", ex.what());
    return 1;
  }
}

#include "config/config_loader.h"

#include "corpus/builtin_rules.h"
#include "guards/text_util.h"
#include "logging/logger.h"

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <stdexcept>

namespace llmguard {
namespace {

std::string Trim(const std::string& input) {
  auto start = input.find_first_not_of(" \t");
  auto end = input.find_last_not_of(" \t\r\n");
  if (start == std::string::npos) {
    return "";
  }
  return input.substr(start, end - start + 1);
}

bool ParseBool(const std::string& value, bool* out) {
  auto lowered = ToLower(Trim(value));
  if (lowered == "true" || lowered == "1" || lowered == "yes" || lowered == "on") {
    *out = true;
    return true;
  }
  if (lowered == "false" || lowered == "0" || lowered == "no" || lowered == "off") {
    *out = false;
    return true;
  }
  return false;
}

std::vector<std::string> SplitCSV(const std::string& raw) {
  std::vector<std::string> values;
  std::stringstream ss(raw);
  std::string item;
  while (std::getline(ss, item, ',')) {
    item = Trim(item);
    if (!item.empty()) {
      values.push_back(item);
    }
  }
  return values;
}

std::vector<std::string> StringList(const YAML::Node& node) {
  std::vector<std::string> values;
  if (node && node.IsSequence()) {
    for (const auto& item : node) {
      values.push_back(item.as<std::string>());
    }
  }
  return values;
}

// Plain YAML scalars become numbers or booleans where they read as one;
// quoted scalars stay strings.
nlohmann::json YamlToJson(const YAML::Node& node) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
      return nullptr;
    case YAML::NodeType::Sequence: {
      nlohmann::json array = nlohmann::json::array();
      for (const auto& item : node) {
        array.push_back(YamlToJson(item));
      }
      return array;
    }
    case YAML::NodeType::Map: {
      nlohmann::json object = nlohmann::json::object();
      for (const auto& kv : node) {
        object[kv.first.as<std::string>()] = YamlToJson(kv.second);
      }
      return object;
    }
    case YAML::NodeType::Scalar:
      break;
  }
  const std::string& scalar = node.Scalar();
  if (node.Tag() != "!") {
    long long integer = 0;
    double number = 0.0;
    bool flag = false;
    if (YAML::convert<long long>::decode(node, integer)) {
      return integer;
    }
    if (YAML::convert<double>::decode(node, number)) {
      return number;
    }
    if (YAML::convert<bool>::decode(node, flag)) {
      return flag;
    }
  }
  return scalar;
}

bool ParseRuleNode(const YAML::Node& node, std::size_t index, RuleDefinition* def,
                   std::string* error) {
  auto fail = [&](const std::string& message) {
    if (error) {
      *error = "rule #" + std::to_string(index) + ": " + message;
    }
    return false;
  };
  if (!node.IsMap()) {
    return fail("expected a mapping");
  }
  if (!node["id"] || !node["category"] || !node["pattern"]) {
    return fail("id, category and pattern are required");
  }
  def->id = node["id"].as<std::string>();
  if (!ParseCategory(node["category"].as<std::string>(), &def->category)) {
    return fail("unknown category '" + node["category"].as<std::string>() + "'");
  }
  def->pattern = node["pattern"].as<std::string>();
  if (node["weight"]) def->weight = node["weight"].as<double>();
  if (node["label"]) def->replacement_label = node["label"].as<std::string>();
  if (node["description"]) def->description = node["description"].as<std::string>();
  if (node["case_sensitive"]) def->case_sensitive = node["case_sensitive"].as<bool>();
  if (node["capture_group"]) def->capture_group = node["capture_group"].as<std::size_t>();
  return true;
}

}  // namespace

bool LoadGuardConfig(const std::string& path, GuardConfig* out, std::string* error) {
  if (!out) {
    if (error) {
      *error = "internal error: null config target";
    }
    return false;
  }
  if (!std::filesystem::exists(path)) {
    if (error) {
      *error = "config file not found: " + path;
    }
    return false;
  }
  GuardConfig loaded = *out;
  try {
    YAML::Node config = YAML::LoadFile(path);

    if (config["guardrails"]) {
      const YAML::Node g = config["guardrails"];
      PipelineConfig& p = loaded.pipeline;
      if (g["injection_threshold"]) p.injection_threshold = g["injection_threshold"].as<double>();
      if (g["pii_enabled"]) p.pii_enabled = g["pii_enabled"].as<bool>();
      if (g["injection_enabled"]) p.injection_enabled = g["injection_enabled"].as<bool>();
      if (g["bias_enabled"]) p.bias_enabled = g["bias_enabled"].as<bool>();
      if (g["output_validation_enabled"]) p.output_validation_enabled = g["output_validation_enabled"].as<bool>();
      if (g["max_output_length"]) p.max_output_length = g["max_output_length"].as<std::int64_t>();
      if (g["required_keywords"]) p.required_keywords = StringList(g["required_keywords"]);
      if (g["blocked_keywords"]) p.blocked_keywords = StringList(g["blocked_keywords"]);
      if (g["output_schema"]) {
        const YAML::Node schema = g["output_schema"];
        if (schema.IsScalar()) {
          p.output_schema = schema.as<std::string>();
        } else if (schema.IsMap()) {
          p.output_schema = YamlToJson(schema).dump();
        }
      }
      if (g["rules_file"]) loaded.rules_file = g["rules_file"].as<std::string>();
    }

    if (config["logging"]) {
      const YAML::Node l = config["logging"];
      if (l["format"]) loaded.log_json = ToLower(l["format"].as<std::string>()) == "json";
      if (l["level"]) loaded.log_level = l["level"].as<std::string>();
      if (l["audit_log"]) loaded.audit_log_path = l["audit_log"].as<std::string>();
      if (l["audit_debug"]) loaded.audit_debug = l["audit_debug"].as<bool>();
    }
  } catch (const YAML::Exception& e) {
    if (error) {
      *error = "error parsing config file " + path + ": " + e.what();
    }
    return false;
  }
  *out = std::move(loaded);
  return true;
}

void ApplyEnvOverrides(GuardConfig* config) {
  if (!config) {
    return;
  }
  PipelineConfig& p = config->pipeline;
  auto apply_bool = [](const char* name, bool* target) {
    if (const char* env = std::getenv(name)) {
      if (!ParseBool(env, target)) {
        log::Warn("config", std::string("Ignoring unparsable boolean ") + name, env);
      }
    }
  };
  if (const char* env = std::getenv("LLMGUARD_INJECTION_THRESHOLD")) {
    try {
      p.injection_threshold = std::stod(env);
    } catch (const std::exception&) {
      log::Warn("config", "Ignoring unparsable LLMGUARD_INJECTION_THRESHOLD", env);
    }
  }
  apply_bool("LLMGUARD_PII_ENABLED", &p.pii_enabled);
  apply_bool("LLMGUARD_INJECTION_ENABLED", &p.injection_enabled);
  apply_bool("LLMGUARD_BIAS_ENABLED", &p.bias_enabled);
  apply_bool("LLMGUARD_OUTPUT_VALIDATION_ENABLED", &p.output_validation_enabled);
  if (const char* env = std::getenv("LLMGUARD_MAX_OUTPUT_LENGTH")) {
    try {
      p.max_output_length = std::stoll(env);
    } catch (const std::exception&) {
      log::Warn("config", "Ignoring unparsable LLMGUARD_MAX_OUTPUT_LENGTH", env);
    }
  }
  if (const char* env = std::getenv("LLMGUARD_REQUIRED_KEYWORDS")) {
    p.required_keywords = SplitCSV(env);
  }
  if (const char* env = std::getenv("LLMGUARD_BLOCKED_KEYWORDS")) {
    p.blocked_keywords = SplitCSV(env);
  }
  if (const char* env = std::getenv("LLMGUARD_RULES_FILE")) {
    config->rules_file = env;
  }
  if (const char* env = std::getenv("LLMGUARD_AUDIT_LOG")) {
    config->audit_log_path = env;
  }
  if (const char* env = std::getenv("LLMGUARD_LOG_FORMAT")) {
    config->log_json = ToLower(env) == "json";
  }
  if (const char* env = std::getenv("LLMGUARD_LOG_LEVEL")) {
    config->log_level = env;
  }
}

bool LoadRuleFile(const std::string& path, std::string* version,
                  std::vector<RuleDefinition>* out, std::string* error) {
  if (!out) {
    if (error) {
      *error = "internal error: null rule target";
    }
    return false;
  }
  try {
    YAML::Node root = YAML::LoadFile(path);
    std::vector<RuleDefinition> defs;
    if (root["include_builtin"] && root["include_builtin"].as<bool>()) {
      defs = BuiltinRuleDefinitions();
    }
    if (!root["rules"] || !root["rules"].IsSequence()) {
      if (error) {
        *error = "rule file " + path + " has no 'rules' sequence";
      }
      return false;
    }
    std::size_t index = 0;
    for (const auto& node : root["rules"]) {
      RuleDefinition def;
      if (!ParseRuleNode(node, index++, &def, error)) {
        return false;
      }
      defs.push_back(std::move(def));
    }
    if (version) {
      *version = root["version"] ? root["version"].as<std::string>()
                                 : std::filesystem::path(path).filename().string();
    }
    *out = std::move(defs);
  } catch (const YAML::Exception& e) {
    if (error) {
      *error = "error parsing rule file " + path + ": " + e.what();
    }
    return false;
  }
  return true;
}

std::shared_ptr<const PatternCorpus> LoadCorpus(const std::string& rules_file, std::string* error) {
  if (rules_file.empty()) {
    return PatternCorpus::Default();
  }
  std::string version;
  std::vector<RuleDefinition> defs;
  if (!LoadRuleFile(rules_file, &version, &defs, error)) {
    return nullptr;
  }
  try {
    return std::make_shared<PatternCorpus>(version, defs);
  } catch (const std::invalid_argument& ex) {
    if (error) {
      *error = std::string("invalid rule corpus: ") + ex.what();
    }
    return nullptr;
  }
}

}  // namespace llmguard

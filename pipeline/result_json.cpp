#include "pipeline/result_json.h"

#include "guards/pii_restorer.h"

namespace llmguard {

using ordered_json = nlohmann::ordered_json;

ordered_json ToJson(const RedactionMapping& mapping) {
  ordered_json j = ordered_json::object();
  for (const auto& entry : mapping.Entries()) {
    j[entry.first] = entry.second;
  }
  return j;
}

ordered_json ToJson(const RuleScore& score) {
  ordered_json j;
  j["score"] = score.score;
  j["matched_rules"] = score.matched_rules;
  j["flags"] = score.flags;
  return j;
}

ordered_json ToJson(const ValidationResult& validation) {
  ordered_json j;
  j["is_valid"] = validation.is_valid;
  j["violations"] = ordered_json::array();
  for (const auto& violation : validation.violations) {
    j["violations"].push_back({{"kind", violation.kind}, {"detail", violation.detail}});
  }
  j["hallucination_score"] = validation.hallucination_score;
  return j;
}

ordered_json ToJson(const PreProcessResult& result) {
  ordered_json j;
  j["sanitised_text"] = result.sanitised_text;
  j["pii_mapping"] = ToJson(result.pii_mapping);
  j["injection"] = ToJson(result.injection);
  j["blocked"] = result.blocked;
  return j;
}

ordered_json ToJson(const PostProcessResult& result) {
  ordered_json j;
  j["final_text"] = result.final_text;
  j["validation"] = ToJson(result.validation);
  j["bias"] = ToJson(result.bias);
  j["unresolved_placeholders"] = result.unresolved_placeholders;
  return j;
}

ordered_json ToJson(const FullRunResult& result) {
  ordered_json j;
  j["input_guard"] = ToJson(result.pre);
  j["output_guard"] = result.post ? ToJson(*result.post) : ordered_json(nullptr);
  j["blocked"] = result.blocked;
  return j;
}

ordered_json ToJson(const std::vector<RuleInfo>& rules) {
  ordered_json j = ordered_json::array();
  for (const auto& rule : rules) {
    j.push_back({{"id", rule.id}, {"weight", rule.weight}, {"description", rule.description}});
  }
  return j;
}

ordered_json ToJson(const PipelineConfig& config) {
  ordered_json j;
  j["injection_threshold"] = config.injection_threshold;
  j["pii_enabled"] = config.pii_enabled;
  j["injection_enabled"] = config.injection_enabled;
  j["bias_enabled"] = config.bias_enabled;
  j["output_validation_enabled"] = config.output_validation_enabled;
  j["max_output_length"] = config.max_output_length;
  j["required_keywords"] = config.required_keywords;
  j["blocked_keywords"] = config.blocked_keywords;
  j["output_schema"] = config.output_schema ? ordered_json(*config.output_schema)
                                            : ordered_json(nullptr);
  return j;
}

bool MappingFromJson(const ordered_json& j, RedactionMapping* out, std::string* error) {
  if (!out) {
    if (error) {
      *error = "internal error: null mapping target";
    }
    return false;
  }
  if (!j.is_object()) {
    if (error) {
      *error = "pii mapping must be a JSON object";
    }
    return false;
  }
  RedactionMapping mapping;
  for (auto it = j.begin(); it != j.end(); ++it) {
    const std::string& key = it.key();
    if (key.empty() || PIIRestorer::PlaceholderLengthAt(key, 0) != key.size()) {
      if (error) {
        *error = "pii mapping key '" + key + "' is not a placeholder";
      }
      return false;
    }
    if (!it.value().is_string()) {
      if (error) {
        *error = "pii mapping value for " + key + " must be a string";
      }
      return false;
    }
    mapping.Insert(key, it.value().get<std::string>());
  }
  *out = std::move(mapping);
  return true;
}

bool ParseMapping(const std::string& text, RedactionMapping* out, std::string* error) {
  ordered_json parsed;
  try {
    parsed = ordered_json::parse(text);
  } catch (const nlohmann::json::exception& ex) {
    if (error) {
      *error = std::string("invalid pii mapping JSON: ") + ex.what();
    }
    return false;
  }
  return MappingFromJson(parsed, out, error);
}

}  // namespace llmguard

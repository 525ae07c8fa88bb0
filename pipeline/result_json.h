#pragma once

#include "guards/rule_scoring.h"
#include "pipeline/guardrails_pipeline.h"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace llmguard {

// Insertion-ordered so mappings and rule lists serialise in the order the
// guards produced them.
nlohmann::ordered_json ToJson(const RedactionMapping& mapping);
nlohmann::ordered_json ToJson(const RuleScore& score);
nlohmann::ordered_json ToJson(const ValidationResult& validation);
nlohmann::ordered_json ToJson(const PreProcessResult& result);
nlohmann::ordered_json ToJson(const PostProcessResult& result);
nlohmann::ordered_json ToJson(const FullRunResult& result);
nlohmann::ordered_json ToJson(const std::vector<RuleInfo>& rules);
nlohmann::ordered_json ToJson(const PipelineConfig& config);

// Reads a {"<<LABEL_N>>": "value", ...} object. Every key must be
// placeholder-shaped and every value a string.
bool MappingFromJson(const nlohmann::ordered_json& j, RedactionMapping* out, std::string* error);
bool ParseMapping(const std::string& text, RedactionMapping* out, std::string* error);

}  // namespace llmguard

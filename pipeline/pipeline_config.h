#pragma once

#include "guards/injection_detector.h"
#include "guards/output_validator.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace llmguard {

struct PipelineConfig {
  double injection_threshold{kDefaultInjectionThreshold};
  bool pii_enabled{true};
  bool injection_enabled{true};
  bool bias_enabled{true};
  bool output_validation_enabled{true};
  std::int64_t max_output_length{static_cast<std::int64_t>(kDefaultMaxOutputLength)};
  std::vector<std::string> required_keywords;
  std::vector<std::string> blocked_keywords;
  // JSON Schema every LLM output must satisfy. Unset means no schema check.
  std::optional<std::string> output_schema;
};

// Rejects a threshold outside [0, 1] (NaN included) and a non-positive
// max_output_length.
bool ValidatePipelineConfig(const PipelineConfig& config, std::string* error);

// "threshold=0.50 pii=on injection=on ..." for log lines.
std::string DescribePipelineConfig(const PipelineConfig& config);

}  // namespace llmguard

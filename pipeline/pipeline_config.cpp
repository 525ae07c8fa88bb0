#include "pipeline/pipeline_config.h"

#include <iomanip>
#include <sstream>

namespace llmguard {

bool ValidatePipelineConfig(const PipelineConfig& config, std::string* error) {
  if (!(config.injection_threshold >= 0.0 && config.injection_threshold <= 1.0)) {
    if (error) {
      *error = "injection_threshold must be within [0, 1], got " +
               std::to_string(config.injection_threshold);
    }
    return false;
  }
  if (config.max_output_length <= 0) {
    if (error) {
      *error = "max_output_length must be positive, got " +
               std::to_string(config.max_output_length);
    }
    return false;
  }
  return true;
}

std::string DescribePipelineConfig(const PipelineConfig& config) {
  auto flag = [](bool enabled) { return enabled ? "on" : "off"; };
  std::ostringstream out;
  out << "threshold=" << std::fixed << std::setprecision(2) << config.injection_threshold
      << " pii=" << flag(config.pii_enabled) << " injection=" << flag(config.injection_enabled)
      << " bias=" << flag(config.bias_enabled)
      << " validation=" << flag(config.output_validation_enabled)
      << " max_output_length=" << config.max_output_length
      << " schema=" << (config.output_schema ? "yes" : "no");
  return out.str();
}

}  // namespace llmguard

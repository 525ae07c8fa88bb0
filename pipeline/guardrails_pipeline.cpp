#include "pipeline/guardrails_pipeline.h"

#include "guards/pii_restorer.h"
#include "logging/logger.h"

#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace llmguard {
namespace {

PipelineConfig Validated(PipelineConfig config) {
  std::string error;
  if (!ValidatePipelineConfig(config, &error)) {
    throw std::invalid_argument("invalid pipeline config: " + error);
  }
  return config;
}

ValidationRules RulesFromConfig(const PipelineConfig& config) {
  ValidationRules rules;
  rules.max_output_length = static_cast<std::size_t>(config.max_output_length);
  rules.required_keywords = config.required_keywords;
  rules.blocked_keywords = config.blocked_keywords;
  return rules;
}

std::string JoinIds(const std::vector<std::string>& ids) {
  std::string joined;
  for (const auto& id : ids) {
    if (!joined.empty()) {
      joined += ",";
    }
    joined += id;
  }
  return joined;
}

std::string FormatScore(double score) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(4) << score;
  return out.str();
}

}  // namespace

GuardrailsPipeline::GuardrailsPipeline(PipelineConfig config,
                                       std::shared_ptr<const PatternCorpus> corpus)
    : config_(Validated(std::move(config))),
      corpus_(std::move(corpus)),
      redactor_(corpus_),
      injection_(config_.injection_threshold, corpus_),
      bias_(corpus_),
      validator_(RulesFromConfig(config_)) {
  log::Info("pipeline", "Guardrails pipeline ready",
            DescribePipelineConfig(config_) + " corpus=" + corpus_->Version());
}

PreProcessResult GuardrailsPipeline::PreProcess(const std::string& text) const {
  PreProcessResult result;
  if (config_.pii_enabled) {
    RedactionOutput redacted = redactor_.Redact(text);
    result.sanitised_text = std::move(redacted.sanitised_text);
    result.pii_mapping = std::move(redacted.mapping);
  } else {
    result.sanitised_text = text;
  }

  if (config_.injection_enabled) {
    result.injection = injection_.Analyse(result.sanitised_text);
    result.blocked = injection_.Exceeds(result.injection.score);
  }

  if (result.blocked) {
    log::Warn("pipeline", "Input blocked by injection guard",
              "score=" + FormatScore(result.injection.score) +
                  " rules=" + JoinIds(result.injection.matched_rules));
  } else {
    log::Debug("pipeline", "Input passed",
               "score=" + FormatScore(result.injection.score) +
                   " placeholders=" + std::to_string(result.pii_mapping.Size()));
  }
  return result;
}

PostProcessResult GuardrailsPipeline::PostProcess(const std::string& text,
                                                  const RedactionMapping& mapping) const {
  return PostProcess(text, mapping, config_.output_schema);
}

PostProcessResult GuardrailsPipeline::PostProcess(const std::string& text,
                                                  const RedactionMapping& mapping,
                                                  const std::optional<std::string>& schema) const {
  PostProcessResult result;
  if (config_.output_validation_enabled) {
    result.validation = validator_.Validate(text, schema);
    if (!result.validation.is_valid) {
      log::Info("pipeline", "Output validation failed",
                "violations=" + std::to_string(result.validation.violations.size()));
    }
  }

  if (config_.bias_enabled) {
    result.bias = bias_.Score(text);
    if (!result.bias.matched_rules.empty()) {
      log::Info("pipeline", "Bias signals in output",
                "score=" + FormatScore(result.bias.score) +
                    " rules=" + JoinIds(result.bias.matched_rules));
    }
  }

  if (config_.pii_enabled) {
    result.final_text = PIIRestorer::Restore(text, mapping);
    result.unresolved_placeholders = PIIRestorer::FindUnresolvedPlaceholders(text, mapping);
    if (!result.unresolved_placeholders.empty()) {
      // Left as-is in final_text; counts only, never values.
      log::Warn("pipeline", "Output contains placeholders missing from the mapping",
                "count=" + std::to_string(result.unresolved_placeholders.size()));
    }
  } else {
    result.final_text = text;
  }
  return result;
}

FullRunResult GuardrailsPipeline::Run(const std::string& text, const LlmCall& llm_call) const {
  FullRunResult result;
  result.pre = PreProcess(text);
  result.blocked = result.pre.blocked;
  if (result.blocked) {
    return result;
  }
  if (!llm_call) {
    throw std::invalid_argument("GuardrailsPipeline::Run requires an LLM callable");
  }
  std::string response = llm_call(result.pre.sanitised_text);
  result.post = PostProcess(response, result.pre.pii_mapping);
  return result;
}

}  // namespace llmguard

#pragma once

#include "corpus/pattern_corpus.h"
#include "guards/bias_scorer.h"
#include "guards/injection_detector.h"
#include "guards/output_validator.h"
#include "guards/pii_redactor.h"
#include "guards/redaction_mapping.h"
#include "pipeline/pipeline_config.h"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace llmguard {

struct PreProcessResult {
  std::string sanitised_text;
  RedactionMapping pii_mapping;
  InjectionResult injection;
  // Advisory: the caller decides whether to skip the LLM call.
  bool blocked{false};
};

struct PostProcessResult {
  std::string final_text;
  ValidationResult validation;
  BiasReport bias;
  // Placeholder-shaped tokens in the LLM text that the mapping could not
  // resolve. They are left in final_text unchanged.
  std::vector<std::string> unresolved_placeholders;
};

struct FullRunResult {
  PreProcessResult pre;
  // Unset when the input was blocked and the LLM callable was not invoked.
  std::optional<PostProcessResult> post;
  bool blocked{false};
};

using LlmCall = std::function<std::string(const std::string& sanitised_text)>;

// Chains the guards around an external LLM call:
//   PreProcess:  PII redaction -> injection detection (sets blocked)
//   PostProcess: output validation -> bias scoring -> PII restoration
// Each stage runs only when enabled in the config. The pipeline holds no
// per-call state; concurrent calls need no locking.
class GuardrailsPipeline {
 public:
  // Throws std::invalid_argument for an invalid config or a null corpus.
  explicit GuardrailsPipeline(PipelineConfig config = PipelineConfig(),
                              std::shared_ptr<const PatternCorpus> corpus = PatternCorpus::Default());

  PreProcessResult PreProcess(const std::string& text) const;

  // Validates against config().output_schema when one is configured.
  PostProcessResult PostProcess(const std::string& text,
                                const RedactionMapping& mapping = RedactionMapping()) const;
  // Validates against `schema` instead of the configured one.
  PostProcessResult PostProcess(const std::string& text, const RedactionMapping& mapping,
                                const std::optional<std::string>& schema) const;

  // PreProcess, then, unless blocked, llm_call(sanitised_text) and
  // PostProcess of its result with the pre-process mapping.
  FullRunResult Run(const std::string& text, const LlmCall& llm_call) const;

  const PipelineConfig& Config() const { return config_; }
  const PatternCorpus& Corpus() const { return *corpus_; }
  const InjectionDetector& Injection() const { return injection_; }
  const BiasScorer& Bias() const { return bias_; }

 private:
  PipelineConfig config_;
  std::shared_ptr<const PatternCorpus> corpus_;
  PIIRedactor redactor_;
  InjectionDetector injection_;
  BiasScorer bias_;
  OutputValidator validator_;
};

}  // namespace llmguard

#include "rag_core/extractors/extractor_pipeline.hpp"

#include <iostream>

#include "rag_core/errors.hpp"
#include "rag_core/routing/format_router.hpp"

namespace rag_core {

ExtractorPipeline::ExtractorPipeline(std::vector<ExtractorStage> stages, MergePolicy merge_policy)
    : stages_(std::move(stages)), merge_policy_(merge_policy) {}

bool ExtractorPipeline::applies_to(const ExtractorStage& stage,
                                   const std::string& relative_path) const {
  if (!stage.file_include_patterns.empty() &&
      !matches_any_pattern(relative_path, stage.file_include_patterns)) {
    return false;
  }
  return !matches_any_pattern(relative_path, stage.file_exclude_patterns);
}

void ExtractorPipeline::merge(nlohmann::json& target, const nlohmann::json& produced,
                              MergePolicy policy) {
  if (!produced.is_object()) {
    throw ExtractionError("extractor output must be a JSON object");
  }

  if (policy == MergePolicy::REJECT_CONFLICTS) {
    for (const auto& [key, value] : produced.items()) {
      if (target.contains(key) && target.at(key) != value) {
        throw ExtractionError("metadata key '" + key + "' conflicts with an earlier extractor");
      }
    }
  }

  for (const auto& [key, value] : produced.items()) {
    if (policy == MergePolicy::FIRST_WRITE_WINS && target.contains(key)) {
      continue;
    }
    target[key] = value;
  }
}

std::vector<ExtractionFailure> ExtractorPipeline::apply(const std::string& relative_path,
                                                        const std::string& text,
                                                        nlohmann::json& metadata) const {
  std::vector<ExtractionFailure> failures;
  for (const auto& stage : stages_) {
    if (!applies_to(stage, relative_path)) {
      continue;
    }
    const std::string type = stage.extractor->type();
    try {
      nlohmann::json produced = stage.extractor->extract(text, metadata);
      merge(metadata, produced, merge_policy_);
      metadata["extractor_" + type] = true;
    } catch (const std::exception& e) {
      std::cerr << "[ExtractorPipeline] " << type << " failed on chunk of " << relative_path
                << ": " << e.what() << std::endl;
      failures.push_back({type, e.what()});
    }
  }
  return failures;
}

}  // namespace rag_core

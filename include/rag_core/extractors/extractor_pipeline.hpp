#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "rag_core/config/rag_config.hpp"
#include "rag_core/extractors/extractor.hpp"

namespace rag_core {

// One configured extractor plus the files it applies to.
struct ExtractorStage {
  ExtractorPtr extractor;
  std::vector<std::string> file_include_patterns;  // empty = every file
  std::vector<std::string> file_exclude_patterns;
};

struct ExtractionFailure {
  std::string extractor_type;
  std::string error;
};

/**
 * Runs extractors over a chunk in declared order. Each extractor sees the
 * metadata produced so far. Keys collide according to the merge policy:
 * LAST_WRITE_WINS overwrites, FIRST_WRITE_WINS keeps the earlier value and
 * REJECT_CONFLICTS drops the extractor's whole output when any existing key
 * would change. A failing extractor is recorded and the next one still runs.
 */
class ExtractorPipeline {
 public:
  ExtractorPipeline(std::vector<ExtractorStage> stages, MergePolicy merge_policy);

  // Enriches metadata in place and returns the failures for this chunk.
  std::vector<ExtractionFailure> apply(const std::string& relative_path, const std::string& text,
                                       nlohmann::json& metadata) const;

  MergePolicy merge_policy() const {
    return merge_policy_;
  }
  size_t size() const {
    return stages_.size();
  }

  // Throws ExtractionError when REJECT_CONFLICTS finds a conflicting key.
  static void merge(nlohmann::json& target, const nlohmann::json& produced, MergePolicy policy);

 private:
  bool applies_to(const ExtractorStage& stage, const std::string& relative_path) const;

  std::vector<ExtractorStage> stages_;
  MergePolicy merge_policy_;
};

}  // namespace rag_core

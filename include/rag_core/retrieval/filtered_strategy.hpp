#pragma once

#include <nlohmann/json.hpp>

#include "rag_core/retrieval/retrieval_strategy.hpp"

namespace rag_core {

// Semantic search restricted to chunks matching the configured filter and the
// request's own filter. No match is an empty result.
class FilteredStrategy : public RetrievalStrategy {
 public:
  static constexpr const char* TYPE = "FilteredStrategy";

  explicit FilteredStrategy(const nlohmann::json& config = nlohmann::json::object());

  std::string type() const override {
    return TYPE;
  }
  std::vector<ScoredChunk> retrieve(const RetrievalRequest& request,
                                    const RetrievalContext& context) const override;

  const MetadataFilter& configured_filter() const {
    return filter_;
  }

 private:
  MetadataFilter filter_;
};

}  // namespace rag_core

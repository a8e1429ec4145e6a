#pragma once

#include <nlohmann/json.hpp>

#include "rag_core/retrieval/retrieval_strategy.hpp"

namespace rag_core {

// Nearest neighbours of the embedded query by the store's metric.
class SemanticStrategy : public RetrievalStrategy {
 public:
  static constexpr const char* TYPE = "SemanticStrategy";

  explicit SemanticStrategy(const nlohmann::json& config = nlohmann::json::object());

  std::string type() const override {
    return TYPE;
  }
  std::vector<ScoredChunk> retrieve(const RetrievalRequest& request,
                                    const RetrievalContext& context) const override;
};

}  // namespace rag_core

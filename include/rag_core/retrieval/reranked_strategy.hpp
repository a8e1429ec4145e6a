#pragma once

#include <nlohmann/json.hpp>
#include <optional>

#include "rag_core/retrieval/relevance_scorer.hpp"
#include "rag_core/retrieval/retrieval_strategy.hpp"

namespace rag_core {

/**
 * Retrieves oversample_factor * top_k semantic candidates, rescoring each
 * (query, passage) pair with a relevance scorer, and returns the best top_k.
 *
 * Reranker scores are min-max normalized over the candidates (all equal ->
 * 0.5). Results carry "original_score", "reranker_score" and
 * "rerank_position" metadata. Expensive: only used when named.
 */
class RerankedStrategy : public RetrievalStrategy {
 public:
  static constexpr const char* TYPE = "RerankedStrategy";
  static constexpr int MIN_OVERSAMPLE = 3;
  static constexpr int MAX_OVERSAMPLE = 5;

  explicit RerankedStrategy(const nlohmann::json& config = nlohmann::json::object());
  RerankedStrategy(RelevanceScorerPtr scorer, int oversample_factor,
                   std::optional<double> relevance_threshold = std::nullopt);

  std::string type() const override {
    return TYPE;
  }
  bool is_expensive() const override {
    return true;
  }
  std::vector<ScoredChunk> retrieve(const RetrievalRequest& request,
                                    const RetrievalContext& context) const override;

  // Reorders candidates by the scorer. Exposed for callers that already hold candidates.
  std::vector<ScoredChunk> rerank(const std::string& query, std::vector<ScoredChunk> candidates,
                                  size_t top_k) const;

  int oversample_factor() const {
    return oversample_factor_;
  }

 private:
  RelevanceScorerPtr scorer_;
  int oversample_factor_ = 4;
  std::optional<double> relevance_threshold_;
};

}  // namespace rag_core

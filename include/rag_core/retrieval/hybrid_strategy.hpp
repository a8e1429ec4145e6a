#pragma once

#include <nlohmann/json.hpp>
#include <vector>

#include "rag_core/retrieval/retrieval_strategy.hpp"

namespace rag_core {

struct HybridWeights {
  double dense_weight = 0.7;
  double sparse_weight = 0.3;
};

/**
 * Fuses a dense and a sparse candidate list.
 *
 * Each list's scores are min-max normalized to [0, 1] (a list whose scores are
 * all equal maps to 1.0 when positive, else 0.0). A candidate missing from one
 * list scores 0 there. combined = dense_weight * dense + sparse_weight * sparse.
 * Order: combined desc, then normalized dense desc, then chunk id. Results
 * carry "dense_score" and "sparse_score" metadata.
 */
std::vector<ScoredChunk> fuse_hybrid_scores(const std::vector<ScoredChunk>& dense,
                                            const std::vector<ScoredChunk>& sparse,
                                            const HybridWeights& weights, size_t top_k);

// Dense similarity plus lexical term overlap.
class HybridStrategy : public RetrievalStrategy {
 public:
  static constexpr const char* TYPE = "HybridStrategy";

  explicit HybridStrategy(const nlohmann::json& config = nlohmann::json::object());

  std::string type() const override {
    return TYPE;
  }
  std::vector<ScoredChunk> retrieve(const RetrievalRequest& request,
                                    const RetrievalContext& context) const override;

  const HybridWeights& weights() const {
    return weights_;
  }

 private:
  HybridWeights weights_;
  size_t candidate_multiplier_ = 3;
};

}  // namespace rag_core

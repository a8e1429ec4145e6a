#include "rag_core/retrieval/hybrid_strategy.hpp"

#include <algorithm>
#include <map>
#include <optional>

#include "rag_core/errors.hpp"

namespace rag_core {

namespace {

std::map<std::string, double> normalize(const std::vector<ScoredChunk>& results) {
  std::map<std::string, double> normalized;
  if (results.empty()) {
    return normalized;
  }
  auto [min_it, max_it] = std::minmax_element(
      results.begin(), results.end(),
      [](const ScoredChunk& a, const ScoredChunk& b) { return a.score < b.score; });
  const double min_score = min_it->score;
  const double max_score = max_it->score;
  const double range = max_score - min_score;

  for (const auto& result : results) {
    if (range <= 0.0) {
      normalized[result.chunk.id] = max_score > 0.0 ? 1.0 : 0.0;
    } else {
      normalized[result.chunk.id] = (result.score - min_score) / range;
    }
  }
  return normalized;
}

}  // namespace

std::vector<ScoredChunk> fuse_hybrid_scores(const std::vector<ScoredChunk>& dense,
                                            const std::vector<ScoredChunk>& sparse,
                                            const HybridWeights& weights, size_t top_k) {
  const auto dense_scores = normalize(dense);
  const auto sparse_scores = normalize(sparse);

  std::map<std::string, Chunk> candidates;
  for (const auto& result : dense) {
    candidates.emplace(result.chunk.id, result.chunk);
  }
  for (const auto& result : sparse) {
    candidates.emplace(result.chunk.id, result.chunk);
  }

  struct Fused {
    ScoredChunk scored;
    double dense = 0.0;
    double combined = 0.0;
  };
  std::vector<Fused> fused;
  fused.reserve(candidates.size());
  for (auto& [id, chunk] : candidates) {
    auto dense_it = dense_scores.find(id);
    auto sparse_it = sparse_scores.find(id);
    const double dense_score = dense_it != dense_scores.end() ? dense_it->second : 0.0;
    const double sparse_score = sparse_it != sparse_scores.end() ? sparse_it->second : 0.0;
    const double combined =
        weights.dense_weight * dense_score + weights.sparse_weight * sparse_score;

    Chunk enriched = chunk;
    enriched.metadata["dense_score"] = dense_score;
    enriched.metadata["sparse_score"] = sparse_score;
    fused.push_back({ScoredChunk{std::move(enriched), static_cast<float>(combined)}, dense_score,
                     combined});
  }

  std::sort(fused.begin(), fused.end(), [](const Fused& a, const Fused& b) {
    if (a.combined != b.combined) {
      return a.combined > b.combined;
    }
    if (a.dense != b.dense) {
      return a.dense > b.dense;
    }
    return a.scored.chunk.id < b.scored.chunk.id;
  });

  std::vector<ScoredChunk> results;
  for (size_t i = 0; i < fused.size() && i < top_k; ++i) {
    results.push_back(std::move(fused[i].scored));
  }
  return results;
}

HybridStrategy::HybridStrategy(const nlohmann::json& config) {
  try {
    weights_.dense_weight = config.value("dense_weight", weights_.dense_weight);
    weights_.sparse_weight = config.value("sparse_weight", weights_.sparse_weight);
    const int multiplier = config.value("candidate_multiplier", static_cast<int>(candidate_multiplier_));
    if (multiplier < 1) {
      throw ConfigurationError("HybridStrategy candidate_multiplier must be >= 1");
    }
    candidate_multiplier_ = static_cast<size_t>(multiplier);
  } catch (const nlohmann::json::exception& e) {
    throw ConfigurationError(std::string("Invalid HybridStrategy config: ") + e.what());
  }
  if (weights_.dense_weight < 0.0 || weights_.sparse_weight < 0.0) {
    throw ConfigurationError("HybridStrategy weights must not be negative");
  }
  if (weights_.dense_weight == 0.0 && weights_.sparse_weight == 0.0) {
    throw ConfigurationError("HybridStrategy needs a positive dense_weight or sparse_weight");
  }
}

std::vector<ScoredChunk> HybridStrategy::retrieve(const RetrievalRequest& request,
                                                  const RetrievalContext& context) const {
  if (request.top_k == 0) {
    return {};
  }
  const size_t candidates = request.top_k * candidate_multiplier_;
  const std::vector<float> query_vector = context.embedder.embed_one(request.query_text);
  auto dense = context.store.query(query_vector, candidates, request.filter);
  auto sparse = context.store.keyword_search(request.query_text, candidates, request.filter);
  return fuse_hybrid_scores(dense, sparse, weights_, request.top_k);
}

}  // namespace rag_core

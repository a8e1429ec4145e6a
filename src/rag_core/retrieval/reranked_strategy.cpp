#include "rag_core/retrieval/reranked_strategy.hpp"

#include <algorithm>
#include <numeric>

#include "rag_core/errors.hpp"

namespace rag_core {

namespace {

void check_oversample(int oversample_factor) {
  if (oversample_factor < RerankedStrategy::MIN_OVERSAMPLE ||
      oversample_factor > RerankedStrategy::MAX_OVERSAMPLE) {
    throw ConfigurationError("RerankedStrategy oversample_factor must be between " +
                             std::to_string(RerankedStrategy::MIN_OVERSAMPLE) + " and " +
                             std::to_string(RerankedStrategy::MAX_OVERSAMPLE) + ", got " +
                             std::to_string(oversample_factor));
  }
}

}  // namespace

RerankedStrategy::RerankedStrategy(const nlohmann::json& config) {
  try {
    oversample_factor_ = config.value("oversample_factor", oversample_factor_);
    const std::string scorer = config.value("scorer", std::string("lexical"));
    if (scorer == "lexical") {
      scorer_ = std::make_shared<LexicalRelevanceScorer>();
    } else if (scorer == "ollama") {
      scorer_ = std::make_shared<OllamaRelevanceScorer>(config);
    } else {
      throw ConfigurationError("Unknown reranker scorer: " + scorer);
    }
    if (config.contains("relevance_threshold")) {
      relevance_threshold_ = config.at("relevance_threshold").get<double>();
    }
  } catch (const nlohmann::json::exception& e) {
    throw ConfigurationError(std::string("Invalid RerankedStrategy config: ") + e.what());
  }
  check_oversample(oversample_factor_);
}

RerankedStrategy::RerankedStrategy(RelevanceScorerPtr scorer, int oversample_factor,
                                   std::optional<double> relevance_threshold)
    : scorer_(std::move(scorer)),
      oversample_factor_(oversample_factor),
      relevance_threshold_(relevance_threshold) {
  if (!scorer_) {
    throw ConfigurationError("RerankedStrategy requires a relevance scorer");
  }
  check_oversample(oversample_factor_);
}

std::vector<ScoredChunk> RerankedStrategy::retrieve(const RetrievalRequest& request,
                                                    const RetrievalContext& context) const {
  if (request.top_k == 0) {
    return {};
  }
  const size_t candidate_count = request.top_k * static_cast<size_t>(oversample_factor_);
  const std::vector<float> query_vector = context.embedder.embed_one(request.query_text);
  auto candidates = context.store.query(query_vector, candidate_count, request.filter);
  return rerank(request.query_text, std::move(candidates), request.top_k);
}

std::vector<ScoredChunk> RerankedStrategy::rerank(const std::string& query,
                                                  std::vector<ScoredChunk> candidates,
                                                  size_t top_k) const {
  if (candidates.empty()) {
    return {};
  }

  std::vector<std::string> passages;
  passages.reserve(candidates.size());
  for (const auto& candidate : candidates) {
    passages.push_back(candidate.chunk.content);
  }
  const std::vector<double> raw = scorer_->score(query, passages);
  if (raw.size() != candidates.size()) {
    throw RagError("Relevance scorer " + scorer_->name() + " returned " +
                   std::to_string(raw.size()) + " scores for " +
                   std::to_string(candidates.size()) + " passages");
  }

  const auto [min_it, max_it] = std::minmax_element(raw.begin(), raw.end());
  const double range = *max_it - *min_it;

  std::vector<size_t> order(candidates.size());
  std::iota(order.begin(), order.end(), 0);
  std::vector<double> normalized(raw.size());
  for (size_t i = 0; i < raw.size(); ++i) {
    normalized[i] = range > 0.0 ? (raw[i] - *min_it) / range : 0.5;
  }
  // Equal reranker scores keep the first-stage order.
  std::stable_sort(order.begin(), order.end(),
                   [&](size_t a, size_t b) { return normalized[a] > normalized[b]; });

  std::vector<ScoredChunk> results;
  for (size_t position = 0; position < order.size() && results.size() < top_k; ++position) {
    const size_t i = order[position];
    if (relevance_threshold_ && normalized[i] < *relevance_threshold_) {
      continue;
    }
    ScoredChunk result = std::move(candidates[i]);
    result.chunk.metadata["original_score"] = result.score;
    result.chunk.metadata["reranker_score"] = raw[i];
    result.chunk.metadata["rerank_position"] = results.size() + 1;
    result.score = static_cast<float>(normalized[i]);
    results.push_back(std::move(result));
  }
  return results;
}

}  // namespace rag_core

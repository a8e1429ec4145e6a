#include "rag_core/retrieval/semantic_strategy.hpp"

namespace rag_core {

SemanticStrategy::SemanticStrategy(const nlohmann::json&) {}

std::vector<ScoredChunk> SemanticStrategy::retrieve(const RetrievalRequest& request,
                                                    const RetrievalContext& context) const {
  if (request.top_k == 0) {
    return {};
  }
  const std::vector<float> query_vector = context.embedder.embed_one(request.query_text);
  return context.store.query(query_vector, request.top_k, request.filter);
}

}  // namespace rag_core

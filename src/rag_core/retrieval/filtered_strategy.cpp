#include "rag_core/retrieval/filtered_strategy.hpp"

#include <stdexcept>

#include "rag_core/errors.hpp"

namespace rag_core {

FilteredStrategy::FilteredStrategy(const nlohmann::json& config) {
  try {
    filter_ = MetadataFilter::from_json(config.value("filters", nlohmann::json()));
  } catch (const std::invalid_argument& e) {
    throw ConfigurationError(std::string("Invalid FilteredStrategy filters: ") + e.what());
  }
}

std::vector<ScoredChunk> FilteredStrategy::retrieve(const RetrievalRequest& request,
                                                    const RetrievalContext& context) const {
  const MetadataFilter filter = filter_.combined_with(request.filter);
  if (request.top_k == 0) {
    return {};
  }
  const std::vector<float> query_vector = context.embedder.embed_one(request.query_text);
  return context.store.query(query_vector, request.top_k, filter);
}

}  // namespace rag_core

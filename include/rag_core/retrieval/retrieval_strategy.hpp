#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "rag_core/embedders/resilient_embedder.hpp"
#include "rag_core/stores/metadata_filter.hpp"
#include "rag_core/stores/vector_store.hpp"

namespace rag_core {

struct RetrievalRequest {
  std::string query_text;
  size_t top_k = 5;
  MetadataFilter filter;
};

// What a strategy may use for one call; owned by the database binding.
struct RetrievalContext {
  ResilientEmbedder& embedder;
  const VectorStore& store;
};

// Stateless ranking algorithm over one vector store. Results are ordered
// best first and hold at most request.top_k entries.
class RetrievalStrategy {
 public:
  virtual ~RetrievalStrategy() = default;

  virtual std::string type() const = 0;

  virtual std::vector<ScoredChunk> retrieve(const RetrievalRequest& request,
                                            const RetrievalContext& context) const = 0;

  // Costly strategies are never picked unless named.
  virtual bool is_expensive() const {
    return false;
  }
};

using RetrievalStrategyPtr = std::shared_ptr<RetrievalStrategy>;

}  // namespace rag_core

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "rag_core/stores/metadata_filter.hpp"
#include "rag_core/types/chunk.hpp"

namespace rag_core {

class StrategyResolver;

struct QueryRequest {
  std::string database;
  std::string retrieval_strategy;  // empty selects the database default
  std::string query_text;
  size_t top_k = 5;
  MetadataFilter filter;
  std::optional<double> score_threshold;
};

struct QueryResponse {
  std::string database;
  std::string retrieval_strategy;
  std::vector<ScoredChunk> results;
};

// Read path: picks the retrieval strategy of a database and runs it. No
// match is an empty result; unreachable backends raise BackendUnavailableError.
class QueryService {
 public:
  static constexpr size_t MAX_TOP_K = 1000;

  explicit QueryService(std::shared_ptr<StrategyResolver> resolver);

  QueryResponse query(const QueryRequest& request);

 private:
  std::shared_ptr<StrategyResolver> resolver_;
};

}  // namespace rag_core

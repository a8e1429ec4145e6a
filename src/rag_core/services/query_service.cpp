#include "rag_core/services/query_service.hpp"

#include <algorithm>
#include <stdexcept>

#include "rag_core/resolver/strategy_resolver.hpp"
#include "rag_core/text/text_utils.hpp"

namespace rag_core {

QueryService::QueryService(std::shared_ptr<StrategyResolver> resolver)
    : resolver_(std::move(resolver)) {}

QueryResponse QueryService::query(const QueryRequest& request) {
  if (text::trim(request.query_text).empty()) {
    throw std::invalid_argument("Query text must not be empty");
  }
  if (request.top_k == 0 || request.top_k > MAX_TOP_K) {
    throw std::invalid_argument("top_k must be between 1 and " + std::to_string(MAX_TOP_K));
  }

  DatabaseBindingPtr binding = resolver_->resolve_database(request.database);
  const RetrievalBinding& retrieval = binding->select_retrieval(request.retrieval_strategy);

  RetrievalRequest retrieval_request;
  retrieval_request.query_text = request.query_text;
  retrieval_request.top_k = request.top_k;
  retrieval_request.filter = request.filter;
  RetrievalContext context{*retrieval.embedder, *binding->store};

  QueryResponse response;
  response.database = binding->name;
  response.retrieval_strategy = retrieval.name;
  response.results = retrieval.strategy->retrieve(retrieval_request, context);

  if (request.score_threshold) {
    const double threshold = *request.score_threshold;
    response.results.erase(std::remove_if(response.results.begin(), response.results.end(),
                                          [threshold](const ScoredChunk& result) {
                                            return result.score < threshold;
                                          }),
                           response.results.end());
  }
  return response;
}

}  // namespace rag_core

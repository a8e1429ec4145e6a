#include "rag_core/services/database_service.hpp"

#include <iostream>

#include "rag_core/errors.hpp"
#include "rag_core/resolver/strategy_resolver.hpp"

namespace rag_core {

DatabaseService::DatabaseService(std::shared_ptr<StrategyResolver> resolver)
    : resolver_(std::move(resolver)) {}

void DatabaseService::require_known(const std::string& name) const {
  if (resolver_->config().find_database(name) == nullptr) {
    throw NotFoundError("Database not found: " + name);
  }
}

std::vector<std::string> DatabaseService::list_databases() const {
  std::vector<std::string> names;
  for (const auto& database : resolver_->config().databases) {
    names.push_back(database.name);
  }
  return names;
}

DatabaseStats DatabaseService::get_stats(const std::string& name) {
  require_known(name);
  DatabaseBindingPtr binding = resolver_->resolve_database(name);
  const VectorStore& store = *binding->store;

  DatabaseStats stats;
  stats.name = binding->name;
  stats.store_type = store.type();
  stats.dimension = store.dimension();
  stats.distance_metric = to_string(store.metric());
  stats.chunk_count = store.count();
  stats.document_count = store.document_chunk_counts().size();
  for (const auto& entry : binding->embedders) {
    stats.embedding_strategies.push_back(entry.first);
  }
  stats.default_embedding_strategy = binding->default_embedder;
  for (const auto& retrieval : binding->retrievals) {
    stats.retrieval_strategies.push_back(retrieval.name);
  }
  stats.default_retrieval_strategy = binding->default_retrieval;
  return stats;
}

std::vector<StoredDocument> DatabaseService::list_documents(const std::string& name) {
  require_known(name);
  DatabaseBindingPtr binding = resolver_->resolve_database(name);
  std::vector<StoredDocument> documents;
  for (const auto& entry : binding->store->document_chunk_counts()) {
    documents.push_back(StoredDocument{entry.first, entry.second});
  }
  return documents;
}

DatabaseHealth DatabaseService::check_health(const std::string& name) {
  require_known(name);
  DatabaseBindingPtr binding = resolver_->resolve_database(name);

  DatabaseHealth health;
  health.name = binding->name;
  health.healthy = true;

  ComponentHealth store;
  store.name = binding->name;
  store.kind = "store";
  store.type = binding->store->type();
  try {
    store.detail = std::to_string(binding->store->count()) + " chunks";
    store.healthy = true;
  } catch (const StoreError& e) {
    std::cerr << "[DatabaseService] Store of " << name << " unreadable: " << e.what()
              << std::endl;
    store.detail = e.what();
  }
  health.healthy = health.healthy && store.healthy;
  health.components.push_back(std::move(store));

  for (const auto& entry : binding->embedders) {
    ComponentHealth embedder;
    embedder.name = entry.first;
    embedder.kind = "embedder";
    embedder.type = entry.second->type();
    const CircuitBreaker::State state = entry.second->breaker().state();
    const bool reachable = entry.second->backend_available();
    embedder.healthy = reachable && state != CircuitBreaker::State::OPEN;
    embedder.detail = std::string(reachable ? "reachable" : "unreachable") + ", circuit " +
                      to_string(state);
    health.healthy = health.healthy && embedder.healthy;
    health.components.push_back(std::move(embedder));
  }
  return health;
}

}  // namespace rag_core

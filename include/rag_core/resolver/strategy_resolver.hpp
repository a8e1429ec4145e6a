#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "rag_core/config/rag_config.hpp"
#include "rag_core/embedders/resilient_embedder.hpp"
#include "rag_core/extractors/extractor_pipeline.hpp"
#include "rag_core/parsers/parser_chain.hpp"
#include "rag_core/resolver/component_registry.hpp"
#include "rag_core/retrieval/retrieval_strategy.hpp"
#include "rag_core/routing/format_router.hpp"
#include "rag_core/stores/vector_store.hpp"

namespace rag_core {

class DatabaseManager;

// A retrieval strategy ready to run against its database.
struct RetrievalBinding {
  std::string name;
  RetrievalStrategyPtr strategy;
  ResilientEmbedderPtr embedder;
};

// One configured database with its store, embedders and retrieval strategies.
class DatabaseBinding {
 public:
  std::string name;
  VectorStorePtr store;
  std::map<std::string, ResilientEmbedderPtr> embedders;
  std::string default_embedder;
  std::vector<RetrievalBinding> retrievals;
  std::string default_retrieval;

  ResilientEmbedderPtr embedder() const;

  // Empty name selects the default. Throws ConfigurationError for unknown names.
  const RetrievalBinding& select_retrieval(const std::string& name = "") const;
};

using DatabaseBindingPtr = std::shared_ptr<DatabaseBinding>;

// Everything ingestion needs for one (processing strategy, database) pair.
class ResolvedPipeline {
 public:
  std::string key;
  ProcessingStrategyConfig strategy;
  std::shared_ptr<FormatRouter> router;
  std::vector<ParserPtr> parsers;  // index = ComponentConfig::position
  std::shared_ptr<ExtractorPipeline> extractors;
  DatabaseBindingPtr database;

  // Instantiated parsers for the route's candidates, in route order.
  ParserChain parser_chain(const RouteDecision& decision) const;
};

using ResolvedPipelinePtr = std::shared_ptr<const ResolvedPipeline>;

/**
 * Turns configuration names into live components. Every reference is checked
 * when a pipeline or database is first resolved, so misconfiguration fails
 * before any file is touched. Pipelines are cached per (strategy, database)
 * pair and databases by name.
 */
class StrategyResolver {
 public:
  StrategyResolver(RagConfig config, ComponentRegistry registry,
                   DatabaseManager* db_manager = nullptr);

  ResolvedPipelinePtr resolve(const std::string& strategy_name, const std::string& database_name);

  DatabaseBindingPtr resolve_database(const std::string& database_name);

  // Resolves every declared dataset and database up front.
  void validate_all();

  void clear();

  size_t cached_pipelines() const;

  const RagConfig& config() const {
    return config_;
  }

 private:
  using PipelineKey = std::pair<std::string, std::string>;

  DatabaseBindingPtr resolve_database_locked(const std::string& database_name);
  DatabaseBindingPtr build_database(const DatabaseConfig& db_config);
  std::shared_ptr<ResolvedPipeline> build_pipeline(const ProcessingStrategyConfig& strategy,
                                                   DatabaseBindingPtr database);

  RagConfig config_;
  ComponentRegistry registry_;
  DatabaseManager* db_manager_;

  mutable std::mutex mutex_;
  std::map<PipelineKey, ResolvedPipelinePtr> pipelines_;
  std::map<std::string, DatabaseBindingPtr> databases_;
};

}  // namespace rag_core

#include "rag_core/resolver/strategy_resolver.hpp"

#include <algorithm>
#include <iostream>

#include "rag_core/errors.hpp"
#include "rag_core/parsers/chunker.hpp"
#include "rag_core/retrieval/semantic_strategy.hpp"

namespace rag_core {

namespace {

bool has_chunking_keys(const nlohmann::json& config) {
  return config.is_object() &&
         (config.contains("chunk_size") || config.contains("chunk_overlap") ||
          config.contains("chunk_strategy") || config.contains("semantic_threshold"));
}

// Explicit "dimension" or "embedding_dimension" on a retrieval strategy, 0 when absent.
size_t declared_dimension(const nlohmann::json& config) {
  for (const char* key : {"embedding_dimension", "dimension"}) {
    if (config.is_object() && config.contains(key)) {
      if (!config.at(key).is_number_integer() || config.at(key).get<int>() <= 0) {
        throw ConfigurationError(std::string("'") + key + "' must be a positive integer");
      }
      return config.at(key).get<size_t>();
    }
  }
  return 0;
}

}  // namespace

ResilientEmbedderPtr DatabaseBinding::embedder() const {
  auto it = embedders.find(default_embedder);
  if (it == embedders.end()) {
    throw ConfigurationError("Database '" + name + "' has no embedding strategy");
  }
  return it->second;
}

const RetrievalBinding& DatabaseBinding::select_retrieval(const std::string& strategy_name) const {
  const std::string& wanted = strategy_name.empty() ? default_retrieval : strategy_name;
  for (const auto& retrieval : retrievals) {
    if (retrieval.name == wanted) {
      return retrieval;
    }
  }
  throw ConfigurationError("Unknown retrieval strategy '" + wanted + "' for database '" + name +
                           "'");
}

ParserChain ResolvedPipeline::parser_chain(const RouteDecision& decision) const {
  std::vector<ParserPtr> chain;
  chain.reserve(decision.parsers.size());
  for (const auto& candidate : decision.parsers) {
    if (candidate.position >= parsers.size()) {
      throw ConfigurationError("Route for strategy '" + strategy.name +
                               "' names a parser outside the strategy: " + candidate.type);
    }
    chain.push_back(parsers[candidate.position]);
  }
  return ParserChain(std::move(chain));
}

StrategyResolver::StrategyResolver(RagConfig config, ComponentRegistry registry,
                                   DatabaseManager* db_manager)
    : config_(std::move(config)), registry_(std::move(registry)), db_manager_(db_manager) {}

ResolvedPipelinePtr StrategyResolver::resolve(const std::string& strategy_name,
                                              const std::string& database_name) {
  std::lock_guard<std::mutex> lock(mutex_);
  PipelineKey key{strategy_name, database_name};
  auto cached = pipelines_.find(key);
  if (cached != pipelines_.end()) {
    return cached->second;
  }

  const ProcessingStrategyConfig* strategy = config_.find_strategy(strategy_name);
  if (strategy == nullptr) {
    throw ConfigurationError("Unknown data processing strategy: " + strategy_name);
  }
  DatabaseBindingPtr database = resolve_database_locked(database_name);

  auto pipeline = build_pipeline(*strategy, database);
  pipeline->key = strategy_name + "/" + database_name;
  pipelines_.emplace(std::move(key), pipeline);
  std::cout << "[StrategyResolver] Resolved pipeline " << pipeline->key << " ("
            << pipeline->parsers.size()
            << " parsers, " << pipeline->extractors->size() << " extractors)" << std::endl;
  return pipeline;
}

DatabaseBindingPtr StrategyResolver::resolve_database(const std::string& database_name) {
  std::lock_guard<std::mutex> lock(mutex_);
  return resolve_database_locked(database_name);
}

DatabaseBindingPtr StrategyResolver::resolve_database_locked(const std::string& database_name) {
  auto cached = databases_.find(database_name);
  if (cached != databases_.end()) {
    return cached->second;
  }
  const DatabaseConfig* db_config = config_.find_database(database_name);
  if (db_config == nullptr) {
    throw ConfigurationError("Unknown database: " + database_name);
  }
  auto binding = build_database(*db_config);
  databases_[database_name] = binding;
  return binding;
}

void StrategyResolver::validate_all() {
  for (const auto& db : config_.databases) {
    resolve_database(db.name);
  }
  for (const auto& dataset : config_.datasets) {
    resolve(dataset.data_processing_strategy, dataset.database);
  }
}

void StrategyResolver::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  pipelines_.clear();
  databases_.clear();
}

size_t StrategyResolver::cached_pipelines() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pipelines_.size();
}

DatabaseBindingPtr StrategyResolver::build_database(const DatabaseConfig& db_config) {
  auto binding = std::make_shared<DatabaseBinding>();
  binding->name = db_config.name;

  StoreContext context{db_manager_, db_config.name};
  binding->store = registry_.stores.create(db_config.type, context, db_config.config);
  const size_t dimension = binding->store->dimension();

  if (db_config.embedding_strategies.empty()) {
    throw ConfigurationError("Database '" + db_config.name + "' declares no embedding strategy");
  }
  for (const auto& e_config : db_config.embedding_strategies) {
    EmbedderPtr backend = registry_.embedders.create(e_config.type, e_config.config);
    if (backend->dimension() != dimension) {
      throw ConfigurationError("Embedding strategy '" + e_config.name + "' produces " +
                               std::to_string(backend->dimension()) +
                               "-dimension vectors but database '" + db_config.name +
                               "' stores " + std::to_string(dimension));
    }
    binding->embedders[e_config.name] = std::make_shared<ResilientEmbedder>(
        std::move(backend), EmbeddingPolicy::from_json(e_config.config));
  }

  if (!db_config.default_embedding_strategy.empty()) {
    if (db_config.find_embedding_strategy(db_config.default_embedding_strategy) == nullptr) {
      throw ConfigurationError("Database '" + db_config.name +
                               "' names unknown default embedding strategy '" +
                               db_config.default_embedding_strategy + "'");
    }
    binding->default_embedder = db_config.default_embedding_strategy;
  } else {
    auto flagged = std::find_if(db_config.embedding_strategies.begin(),
                                db_config.embedding_strategies.end(),
                                [](const NamedComponentConfig& e) { return e.is_default; });
    binding->default_embedder = flagged != db_config.embedding_strategies.end()
                                    ? flagged->name
                                    : db_config.embedding_strategies.front().name;
  }

  for (const auto& r_config : db_config.retrieval_strategies) {
    RetrievalBinding retrieval;
    retrieval.name = r_config.name;
    retrieval.strategy = registry_.retrieval_strategies.create(r_config.type, r_config.config);

    const std::string embedder_name =
        r_config.config.value("embedding_strategy", binding->default_embedder);
    auto embedder = binding->embedders.find(embedder_name);
    if (embedder == binding->embedders.end()) {
      throw ConfigurationError("Retrieval strategy '" + r_config.name +
                               "' references unknown embedding strategy '" + embedder_name + "'");
    }
    retrieval.embedder = embedder->second;

    const size_t declared = declared_dimension(r_config.config);
    if (declared != 0 && declared != dimension) {
      throw ConfigurationError("Retrieval strategy '" + r_config.name + "' expects " +
                               std::to_string(declared) + "-dimension embeddings but database '" +
                               db_config.name + "' stores " + std::to_string(dimension));
    }
    binding->retrievals.push_back(std::move(retrieval));
  }

  if (!db_config.default_retrieval_strategy.empty()) {
    if (db_config.find_retrieval_strategy(db_config.default_retrieval_strategy) == nullptr) {
      throw ConfigurationError("Database '" + db_config.name +
                               "' names unknown default retrieval strategy '" +
                               db_config.default_retrieval_strategy + "'");
    }
    binding->default_retrieval = db_config.default_retrieval_strategy;
  } else {
    for (size_t i = 0; i < db_config.retrieval_strategies.size(); ++i) {
      if (db_config.retrieval_strategies[i].is_default) {
        binding->default_retrieval = db_config.retrieval_strategies[i].name;
        break;
      }
    }
    // Implicit choice skips expensive strategies.
    if (binding->default_retrieval.empty()) {
      for (const auto& retrieval : binding->retrievals) {
        if (!retrieval.strategy->is_expensive()) {
          binding->default_retrieval = retrieval.name;
          break;
        }
      }
    }
    if (binding->default_retrieval.empty()) {
      RetrievalBinding fallback;
      fallback.name = "default";
      fallback.strategy = std::make_shared<SemanticStrategy>();
      fallback.embedder = binding->embedders.at(binding->default_embedder);
      binding->retrievals.push_back(std::move(fallback));
      binding->default_retrieval = "default";
    }
  }

  std::cout << "[StrategyResolver] Database " << db_config.name << ": " << binding->store->type()
            << " (" << dimension << "d), embedder " << binding->default_embedder
            << ", retrieval " << binding->default_retrieval << std::endl;
  return binding;
}

std::shared_ptr<ResolvedPipeline> StrategyResolver::build_pipeline(
    const ProcessingStrategyConfig& strategy, DatabaseBindingPtr database) {
  auto pipeline = std::make_shared<ResolvedPipeline>();
  pipeline->strategy = strategy;
  pipeline->database = std::move(database);

  if (strategy.parsers.empty()) {
    throw ConfigurationError("Strategy '" + strategy.name + "' declares no parsers");
  }
  for (const auto& p_config : strategy.parsers) {
    if (has_chunking_keys(p_config.config)) {
      try {
        ChunkingConfig::from_json(p_config.config).validate();
      } catch (const nlohmann::json::exception& e) {
        throw ConfigurationError("Parser '" + p_config.type + "' in strategy '" + strategy.name +
                                 "' has malformed chunking settings: " + e.what());
      }
    }
    pipeline->parsers.push_back(registry_.parsers.create(p_config.type, p_config.config));
  }

  for (const auto& rule : strategy.directory_rules) {
    for (const auto& type : rule.parsers) {
      auto declared = std::find_if(strategy.parsers.begin(), strategy.parsers.end(),
                                   [&](const ComponentConfig& p) { return p.type == type; });
      if (declared == strategy.parsers.end()) {
        throw ConfigurationError("Directory rule '" + rule.pattern + "' in strategy '" +
                                 strategy.name + "' names parser '" + type +
                                 "' which the strategy does not declare");
      }
    }
  }

  std::vector<ExtractorStage> stages;
  for (const auto& e_config : strategy.extractors) {
    ExtractorStage stage;
    stage.extractor = registry_.extractors.create(e_config.type, e_config.config);
    stage.file_include_patterns = e_config.file_include_patterns;
    stage.file_exclude_patterns = e_config.file_exclude_patterns;
    stages.push_back(std::move(stage));
  }
  pipeline->extractors = std::make_shared<ExtractorPipeline>(std::move(stages),
                                                             strategy.merge_policy);
  pipeline->router = std::make_shared<FormatRouter>(strategy, registry_.parser_formats);
  return pipeline;
}

}  // namespace rag_core

#include "rag_core/resolver/component_registry.hpp"

#include <memory>

#include "rag_core/embedders/hashing_embedder.hpp"
#include "rag_core/embedders/ollama_embedder.hpp"
#include "rag_core/extractors/builtin_extractors.hpp"
#include "rag_core/parsers/csv_parser.hpp"
#include "rag_core/parsers/markdown_parser.hpp"
#include "rag_core/parsers/text_parser.hpp"
#include "rag_core/retrieval/filtered_strategy.hpp"
#include "rag_core/retrieval/hybrid_strategy.hpp"
#include "rag_core/retrieval/reranked_strategy.hpp"
#include "rag_core/retrieval/semantic_strategy.hpp"
#include "rag_core/stores/faiss_vector_store.hpp"
#include "rag_core/stores/memory_vector_store.hpp"

namespace rag_core {

ComponentRegistry::ComponentRegistry()
    : parsers("parser"),
      extractors("extractor"),
      embedders("embedder"),
      stores("vector store"),
      retrieval_strategies("retrieval strategy") {}

void ComponentRegistry::register_parser(const std::string& type, ParserRegistry::Factory factory,
                                        std::vector<std::string> formats) {
  parsers.add(type, std::move(factory));
  parser_formats[type] = std::move(formats);
}

ComponentRegistry ComponentRegistry::with_builtins() {
  ComponentRegistry registry;

  registry.register_parser(
      TextParser::TYPE,
      [](const nlohmann::json& config) { return std::make_shared<TextParser>(config); },
      TextParser::supported_formats());
  registry.register_parser(
      MarkdownParser::TYPE,
      [](const nlohmann::json& config) { return std::make_shared<MarkdownParser>(config); },
      MarkdownParser::supported_formats());
  registry.register_parser(
      CSVParser::TYPE,
      [](const nlohmann::json& config) { return std::make_shared<CSVParser>(config); },
      CSVParser::supported_formats());

  registry.extractors.add(StatisticsExtractor::TYPE, [](const nlohmann::json& config) {
    return std::make_shared<StatisticsExtractor>(config);
  });
  registry.extractors.add(HeadingExtractor::TYPE, [](const nlohmann::json& config) {
    return std::make_shared<HeadingExtractor>(config);
  });
  registry.extractors.add(KeywordExtractor::TYPE, [](const nlohmann::json& config) {
    return std::make_shared<KeywordExtractor>(config);
  });
  registry.extractors.add(EntityExtractor::TYPE, [](const nlohmann::json& config) {
    return std::make_shared<EntityExtractor>(config);
  });

  registry.embedders.add(HashingEmbedder::TYPE, [](const nlohmann::json& config) {
    return std::make_shared<HashingEmbedder>(config);
  });
  registry.embedders.add(OllamaEmbedder::TYPE, [](const nlohmann::json& config) {
    return std::make_shared<OllamaEmbedder>(config);
  });

  registry.stores.add(FaissVectorStore::TYPE,
                      [](const StoreContext& context, const nlohmann::json& config) -> VectorStorePtr {
                        if (context.db_manager == nullptr) {
                          throw ConfigurationError("Database '" + context.database_name +
                                                   "' uses FaissStore but no sqlite file is open");
                        }
                        return FaissVectorStore::from_config(*context.db_manager,
                                                             context.database_name, config);
                      });
  registry.stores.add(MemoryVectorStore::TYPE,
                      [](const StoreContext&, const nlohmann::json& config) -> VectorStorePtr {
                        return MemoryVectorStore::from_config(config);
                      });

  registry.retrieval_strategies.add(SemanticStrategy::TYPE, [](const nlohmann::json& config) {
    return std::make_shared<SemanticStrategy>(config);
  });
  registry.retrieval_strategies.add(HybridStrategy::TYPE, [](const nlohmann::json& config) {
    return std::make_shared<HybridStrategy>(config);
  });
  registry.retrieval_strategies.add(FilteredStrategy::TYPE, [](const nlohmann::json& config) {
    return std::make_shared<FilteredStrategy>(config);
  });
  registry.retrieval_strategies.add(RerankedStrategy::TYPE, [](const nlohmann::json& config) {
    return std::make_shared<RerankedStrategy>(config);
  });

  return registry;
}

}  // namespace rag_core

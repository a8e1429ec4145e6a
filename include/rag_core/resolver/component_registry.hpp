#pragma once

#include <functional>
#include <map>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "rag_core/embedders/embedder.hpp"
#include "rag_core/errors.hpp"
#include "rag_core/extractors/extractor.hpp"
#include "rag_core/parsers/parser.hpp"
#include "rag_core/retrieval/retrieval_strategy.hpp"
#include "rag_core/routing/format_router.hpp"
#include "rag_core/stores/vector_store.hpp"

namespace rag_core {

class DatabaseManager;

/**
 * Name -> factory table for one component kind. create() turns an unknown
 * name, or a config the factory rejects, into a ConfigurationError naming the
 * offending component.
 */
template <typename T, typename... Args>
class TypeRegistry {
 public:
  using Factory = std::function<T(Args...)>;

  explicit TypeRegistry(std::string kind) : kind_(std::move(kind)) {}

  void add(const std::string& name, Factory factory) {
    factories_[name] = std::move(factory);
  }

  bool contains(const std::string& name) const {
    return factories_.count(name) > 0;
  }

  T create(const std::string& name, Args... args) const {
    auto it = factories_.find(name);
    if (it == factories_.end()) {
      std::string known;
      for (const auto& [key, _] : factories_) {
        known += (known.empty() ? "" : ", ") + key;
      }
      throw ConfigurationError("Unknown " + kind_ + " type '" + name + "' (known: " + known +
                               ")");
    }
    try {
      return it->second(args...);
    } catch (const nlohmann::json::exception& e) {
      throw ConfigurationError("Invalid config for " + kind_ + " '" + name + "': " + e.what());
    } catch (const std::invalid_argument& e) {
      throw ConfigurationError("Invalid config for " + kind_ + " '" + name + "': " + e.what());
    }
  }

  std::vector<std::string> names() const {
    std::vector<std::string> result;
    for (const auto& [key, _] : factories_) {
      result.push_back(key);
    }
    return result;
  }

 private:
  std::string kind_;
  std::map<std::string, Factory> factories_;
};

// What a store factory gets besides its JSON config.
struct StoreContext {
  DatabaseManager* db_manager = nullptr;  // null when no sqlite file is configured
  std::string database_name;
};

/**
 * Every component type a configuration may name. with_builtins() registers
 * the parsers, extractors, embedders, stores and retrieval strategies shipped
 * with rag_core; callers add their own before handing it to the resolver.
 */
class ComponentRegistry {
 public:
  using ParserRegistry = TypeRegistry<ParserPtr, const nlohmann::json&>;
  using ExtractorRegistry = TypeRegistry<ExtractorPtr, const nlohmann::json&>;
  using EmbedderRegistry = TypeRegistry<EmbedderPtr, const nlohmann::json&>;
  using StoreRegistry = TypeRegistry<VectorStorePtr, const StoreContext&, const nlohmann::json&>;
  using RetrievalRegistry = TypeRegistry<RetrievalStrategyPtr, const nlohmann::json&>;

  ComponentRegistry();

  static ComponentRegistry with_builtins();

  // Registers a parser together with the format tags it reads.
  void register_parser(const std::string& type, ParserRegistry::Factory factory,
                       std::vector<std::string> formats);

  ParserRegistry parsers;
  ExtractorRegistry extractors;
  EmbedderRegistry embedders;
  StoreRegistry stores;
  RetrievalRegistry retrieval_strategies;

  FormatRouter::FormatTable parser_formats;
};

}  // namespace rag_core

#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace rag_core {

// A parser or extractor entry inside a processing strategy.
struct ComponentConfig {
  std::string type;
  std::vector<std::string> file_include_patterns;
  std::vector<std::string> file_exclude_patterns;
  int priority = 0;
  nlohmann::json config = nlohmann::json::object();
  size_t position = 0;  // index within its strategy's parsers or extractors list
};

// Files whose dataset-relative path matches `pattern` may only be parsed by `parsers`.
struct DirectoryRule {
  std::string pattern;
  std::vector<std::string> parsers;
};

enum class MergePolicy { LAST_WRITE_WINS, FIRST_WRITE_WINS, REJECT_CONFLICTS };

std::string to_string(MergePolicy policy);
MergePolicy merge_policy_from_string(const std::string& str);

struct ProcessingStrategyConfig {
  std::string name;
  std::vector<DirectoryRule> directory_rules;
  std::vector<ComponentConfig> parsers;
  std::vector<ComponentConfig> extractors;
  MergePolicy merge_policy = MergePolicy::LAST_WRITE_WINS;
  bool deduplicate_chunks = false;
};

// Embedding and retrieval strategies are referenced by name within a database.
struct NamedComponentConfig {
  std::string name;
  std::string type;
  nlohmann::json config = nlohmann::json::object();
  bool is_default = false;
};

struct DatabaseConfig {
  std::string name;
  std::string type;
  nlohmann::json config = nlohmann::json::object();
  std::vector<NamedComponentConfig> embedding_strategies;
  std::string default_embedding_strategy;
  std::vector<NamedComponentConfig> retrieval_strategies;
  std::string default_retrieval_strategy;

  const NamedComponentConfig* find_embedding_strategy(const std::string& name) const;
  const NamedComponentConfig* find_retrieval_strategy(const std::string& name) const;
};

struct DatasetConfig {
  std::string name;
  std::string data_processing_strategy;
  std::string database;
};

class RagConfig {
 public:
  std::vector<DatabaseConfig> databases;
  std::vector<ProcessingStrategyConfig> data_processing_strategies;
  std::vector<DatasetConfig> datasets;

  static RagConfig from_file(const std::string& filename);
  static RagConfig from_json(const nlohmann::json& json_config);

  const DatabaseConfig* find_database(const std::string& name) const;
  const ProcessingStrategyConfig* find_strategy(const std::string& name) const;

 private:
  void validate() const;
};

}  // namespace rag_core

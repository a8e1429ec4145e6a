#include "rag_core/config/rag_config.hpp"

#include <fstream>
#include <set>

#include "rag_core/errors.hpp"

namespace rag_core {

namespace {

std::vector<std::string> string_list(const nlohmann::json& json_obj, const char* key) {
  std::vector<std::string> out;
  if (!json_obj.contains(key)) {
    return out;
  }
  const auto& value = json_obj.at(key);
  if (!value.is_array()) {
    throw ConfigurationError(std::string("'") + key + "' must be an array of strings");
  }
  for (const auto& item : value) {
    out.push_back(item.get<std::string>());
  }
  return out;
}

nlohmann::json object_or_empty(const nlohmann::json& json_obj, const char* key) {
  if (!json_obj.contains(key) || json_obj.at(key).is_null()) {
    return nlohmann::json::object();
  }
  if (!json_obj.at(key).is_object()) {
    throw ConfigurationError(std::string("'") + key + "' must be an object");
  }
  return json_obj.at(key);
}

ComponentConfig parse_component(const nlohmann::json& j) {
  ComponentConfig component;
  component.type = j.value("type", std::string());
  component.file_include_patterns = string_list(j, "file_include_patterns");
  component.file_exclude_patterns = string_list(j, "file_exclude_patterns");
  component.priority = j.value("priority", 0);
  component.config = object_or_empty(j, "config");
  return component;
}

NamedComponentConfig parse_named_component(const nlohmann::json& j) {
  NamedComponentConfig component;
  component.name = j.value("name", std::string());
  component.type = j.value("type", std::string());
  component.config = object_or_empty(j, "config");
  component.is_default = j.value("default", false);
  return component;
}

const nlohmann::json& array_or_empty(const nlohmann::json& json_obj, const char* key) {
  static const nlohmann::json empty = nlohmann::json::array();
  if (!json_obj.contains(key) || json_obj.at(key).is_null()) {
    return empty;
  }
  if (!json_obj.at(key).is_array()) {
    throw ConfigurationError(std::string("'") + key + "' must be an array");
  }
  return json_obj.at(key);
}

}  // namespace

std::string to_string(MergePolicy policy) {
  switch (policy) {
    case MergePolicy::LAST_WRITE_WINS: return "last_write_wins";
    case MergePolicy::FIRST_WRITE_WINS: return "first_write_wins";
    case MergePolicy::REJECT_CONFLICTS: return "reject_conflicts";
  }
  return "unknown";
}

MergePolicy merge_policy_from_string(const std::string& str) {
  if (str == "last_write_wins") return MergePolicy::LAST_WRITE_WINS;
  if (str == "first_write_wins") return MergePolicy::FIRST_WRITE_WINS;
  if (str == "reject_conflicts") return MergePolicy::REJECT_CONFLICTS;
  throw ConfigurationError("Unknown metadata_merge_policy: " + str);
}

const NamedComponentConfig* DatabaseConfig::find_embedding_strategy(const std::string& name) const {
  for (const auto& strategy : embedding_strategies) {
    if (strategy.name == name) {
      return &strategy;
    }
  }
  return nullptr;
}

const NamedComponentConfig* DatabaseConfig::find_retrieval_strategy(const std::string& name) const {
  for (const auto& strategy : retrieval_strategies) {
    if (strategy.name == name) {
      return &strategy;
    }
  }
  return nullptr;
}

RagConfig RagConfig::from_file(const std::string& filename) {
  std::ifstream file_stream(filename);
  if (!file_stream.is_open()) {
    throw ConfigurationError("Failed to open RAG config file: " + filename);
  }

  nlohmann::json json_config;
  try {
    file_stream >> json_config;
  } catch (const nlohmann::json::exception& e) {
    throw ConfigurationError(std::string("Failed to parse JSON in RAG config file '") + filename +
                             "': " + e.what());
  }
  return from_json(json_config);
}

RagConfig RagConfig::from_json(const nlohmann::json& json_config) {
  if (!json_config.is_object()) {
    throw ConfigurationError("RAG config root must be a JSON object");
  }

  RagConfig config;
  try {
    for (const auto& db_json : array_or_empty(json_config, "databases")) {
      DatabaseConfig db;
      db.name = db_json.value("name", std::string());
      db.type = db_json.value("type", std::string());
      db.config = object_or_empty(db_json, "config");
      for (const auto& e : array_or_empty(db_json, "embedding_strategies")) {
        db.embedding_strategies.push_back(parse_named_component(e));
      }
      db.default_embedding_strategy = db_json.value("default_embedding_strategy", std::string());
      for (const auto& r : array_or_empty(db_json, "retrieval_strategies")) {
        db.retrieval_strategies.push_back(parse_named_component(r));
      }
      db.default_retrieval_strategy = db_json.value("default_retrieval_strategy", std::string());
      config.databases.push_back(std::move(db));
    }

    for (const auto& s_json : array_or_empty(json_config, "data_processing_strategies")) {
      ProcessingStrategyConfig strategy;
      strategy.name = s_json.value("name", std::string());
      for (const auto& rule_json : array_or_empty(s_json, "directory_rules")) {
        DirectoryRule rule;
        rule.pattern = rule_json.value("pattern", std::string());
        rule.parsers = string_list(rule_json, "parsers");
        strategy.directory_rules.push_back(std::move(rule));
      }
      for (const auto& p : array_or_empty(s_json, "parsers")) {
        strategy.parsers.push_back(parse_component(p));
        strategy.parsers.back().position = strategy.parsers.size() - 1;
      }
      for (const auto& e : array_or_empty(s_json, "extractors")) {
        strategy.extractors.push_back(parse_component(e));
        strategy.extractors.back().position = strategy.extractors.size() - 1;
      }
      strategy.merge_policy = merge_policy_from_string(
          s_json.value("metadata_merge_policy", std::string("last_write_wins")));
      strategy.deduplicate_chunks = s_json.value("deduplicate_chunks", false);
      config.data_processing_strategies.push_back(std::move(strategy));
    }

    for (const auto& d_json : array_or_empty(json_config, "datasets")) {
      DatasetConfig dataset;
      dataset.name = d_json.value("name", std::string());
      dataset.data_processing_strategy = d_json.value("data_processing_strategy", std::string());
      dataset.database = d_json.value("database", std::string());
      config.datasets.push_back(std::move(dataset));
    }
  } catch (const nlohmann::json::exception& e) {
    throw ConfigurationError(std::string("Malformed RAG config: ") + e.what());
  }

  config.validate();
  return config;
}

const DatabaseConfig* RagConfig::find_database(const std::string& name) const {
  for (const auto& db : databases) {
    if (db.name == name) {
      return &db;
    }
  }
  return nullptr;
}

const ProcessingStrategyConfig* RagConfig::find_strategy(const std::string& name) const {
  for (const auto& strategy : data_processing_strategies) {
    if (strategy.name == name) {
      return &strategy;
    }
  }
  return nullptr;
}

void RagConfig::validate() const {
  std::set<std::string> db_names;
  for (const auto& db : databases) {
    if (db.name.empty()) {
      throw ConfigurationError("Every database needs a name");
    }
    if (!db_names.insert(db.name).second) {
      throw ConfigurationError("Duplicate database name: " + db.name);
    }
    if (db.type.empty()) {
      throw ConfigurationError("Database '" + db.name + "' has no store type");
    }
    std::set<std::string> strategy_names;
    for (const auto& e : db.embedding_strategies) {
      if (e.name.empty() || e.type.empty()) {
        throw ConfigurationError("Database '" + db.name +
                                 "' has an embedding strategy without name or type");
      }
    }
    for (const auto& r : db.retrieval_strategies) {
      if (r.name.empty() || r.type.empty()) {
        throw ConfigurationError("Database '" + db.name +
                                 "' has a retrieval strategy without name or type");
      }
      if (!strategy_names.insert(r.name).second) {
        throw ConfigurationError("Duplicate retrieval strategy '" + r.name + "' in database '" +
                                 db.name + "'");
      }
    }
  }

  std::set<std::string> strategy_names;
  for (const auto& strategy : data_processing_strategies) {
    if (strategy.name.empty()) {
      throw ConfigurationError("Every data processing strategy needs a name");
    }
    if (!strategy_names.insert(strategy.name).second) {
      throw ConfigurationError("Duplicate data processing strategy: " + strategy.name);
    }
    for (const auto& parser : strategy.parsers) {
      if (parser.type.empty()) {
        throw ConfigurationError("Strategy '" + strategy.name + "' has a parser without a type");
      }
    }
    for (const auto& extractor : strategy.extractors) {
      if (extractor.type.empty()) {
        throw ConfigurationError("Strategy '" + strategy.name +
                                 "' has an extractor without a type");
      }
    }
    for (const auto& rule : strategy.directory_rules) {
      if (rule.pattern.empty()) {
        throw ConfigurationError("Strategy '" + strategy.name +
                                 "' has a directory rule without a pattern");
      }
    }
  }

  for (const auto& dataset : datasets) {
    if (dataset.name.empty() || dataset.data_processing_strategy.empty() ||
        dataset.database.empty()) {
      throw ConfigurationError(
          "Datasets need a name, a data_processing_strategy and a database");
    }
  }
}

}  // namespace rag_core

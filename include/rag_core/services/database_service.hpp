#pragma once

#include <memory>
#include <string>
#include <vector>

namespace rag_core {

class StrategyResolver;

struct StoredDocument {
  std::string content_hash;
  size_t chunk_count = 0;
};

struct DatabaseStats {
  std::string name;
  std::string store_type;
  size_t dimension = 0;
  std::string distance_metric;
  size_t chunk_count = 0;
  size_t document_count = 0;
  std::vector<std::string> embedding_strategies;
  std::string default_embedding_strategy;
  std::vector<std::string> retrieval_strategies;
  std::string default_retrieval_strategy;
};

struct ComponentHealth {
  std::string name;
  std::string kind;  // "store" or "embedder"
  std::string type;
  bool healthy = false;
  std::string detail;
};

struct DatabaseHealth {
  std::string name;
  bool healthy = false;
  std::vector<ComponentHealth> components;
};

// Read-only views of a configured database: what its store holds and whether
// its backends answer. Unknown names throw NotFoundError.
class DatabaseService {
 public:
  explicit DatabaseService(std::shared_ptr<StrategyResolver> resolver);

  std::vector<std::string> list_databases() const;
  DatabaseStats get_stats(const std::string& name);
  // Ordered by content hash.
  std::vector<StoredDocument> list_documents(const std::string& name);
  DatabaseHealth check_health(const std::string& name);

 private:
  void require_known(const std::string& name) const;

  std::shared_ptr<StrategyResolver> resolver_;
};

}  // namespace rag_core

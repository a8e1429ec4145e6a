#pragma once

#include <map>
#include <nlohmann/json.hpp>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "rag_core/stores/vector_store.hpp"

namespace rag_core {

// Process-local store with exact scans. Nothing survives a restart.
class MemoryVectorStore : public VectorStore {
 public:
  static constexpr const char* TYPE = "MemoryStore";

  MemoryVectorStore(size_t dimension, DistanceMetric metric);

  // config: {"dimension": n, "distance_metric": "cosine" | "l2"}
  static std::shared_ptr<MemoryVectorStore> from_config(const nlohmann::json& config);

  std::string type() const override {
    return TYPE;
  }
  size_t dimension() const override {
    return dimension_;
  }
  DistanceMetric metric() const override {
    return metric_;
  }

  std::vector<std::string> upsert(const std::vector<Chunk>& chunks) override;
  std::vector<ScoredChunk> query(const std::vector<float>& query_vector, size_t top_k,
                                 const MetadataFilter& filter = {}) const override;
  std::vector<ScoredChunk> keyword_search(const std::string& query_text, size_t top_k,
                                          const MetadataFilter& filter = {}) const override;
  std::vector<Chunk> get_document_chunks(const std::string& document_hash) const override;
  bool contains_document(const std::string& document_hash) const override;
  size_t delete_document(const std::string& document_hash) override;
  size_t delete_chunks(const std::vector<std::string>& ids) override;
  size_t count() const override;
  std::map<std::string, size_t> document_chunk_counts() const override;

 private:
  struct Entry {
    Chunk chunk;
    std::unordered_set<std::string> terms;
  };

  float score(const std::vector<float>& query_vector, const std::vector<float>& vector) const;

  size_t dimension_;
  DistanceMetric metric_;

  mutable std::shared_mutex mutex_;
  std::map<std::string, Entry> entries_;  // by chunk id
  std::unordered_map<std::string, std::vector<std::string>> document_chunks_;
};

}  // namespace rag_core

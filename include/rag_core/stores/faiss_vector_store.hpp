#pragma once

#include <faiss/IndexIDMap.h>

#include <cstdint>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "rag_core/db/database_manager.hpp"
#include "rag_core/stores/vector_store.hpp"

namespace rag_core {

/**
 * Persistent store: chunk rows live in the sqlite table vector_chunks (text
 * zstd-compressed, vectors as float32 blobs), scoped by database name. An
 * in-memory HNSW index over the rows is built at open and rebuilt after
 * deletions. Filtered queries score only the matching rows through a
 * temporary exact index.
 */
class FaissVectorStore : public VectorStore {
 public:
  static constexpr const char* TYPE = "FaissStore";

  FaissVectorStore(DatabaseManager& db_manager, std::string database_name, size_t dimension,
                   DistanceMetric metric);
  ~FaissVectorStore() override;

  static std::shared_ptr<FaissVectorStore> from_config(DatabaseManager& db_manager,
                                                       const std::string& database_name,
                                                       const nlohmann::json& config);

  FaissVectorStore(const FaissVectorStore&) = delete;
  FaissVectorStore& operator=(const FaissVectorStore&) = delete;

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

  // Reloads every row of this database from sqlite into a fresh index.
  void rebuild_index();

 private:
  // In-memory view of one row, enough to filter and rank lexically.
  struct RowInfo {
    std::string chunk_id;
    std::string document_hash;
    int chunk_index = 0;
    nlohmann::json metadata;
    std::unordered_set<std::string> terms;
  };

  std::unique_ptr<faiss::IndexIDMap> create_base_index() const;
  std::unique_ptr<faiss::IndexIDMap> create_flat_index() const;
  std::vector<float> prepare_vector(const std::vector<float>& vector) const;
  float to_score(float raw_distance) const;

  void rebuild_index_locked();

  // Scores come back in label order; -1 labels are dropped.
  std::vector<std::pair<int64_t, float>> search(faiss::IndexIDMap& index,
                                                const std::vector<float>& query_vector,
                                                size_t top_k) const;
  std::vector<Chunk> load_chunks(const std::vector<int64_t>& faiss_ids, bool with_vectors) const;

  DatabaseManager& db_manager_;
  std::string database_name_;
  size_t dimension_;
  DistanceMetric metric_;

  mutable std::shared_mutex mutex_;
  std::unique_ptr<faiss::IndexIDMap> index_;
  std::unordered_map<int64_t, RowInfo> rows_;
  std::unordered_map<std::string, std::vector<int64_t>> document_rows_;

  static constexpr int HNSW_M_PARAM = 32;
  static constexpr int HNSW_EF_CONSTRUCTION_PARAM = 100;
  static constexpr int HNSW_EF_SEARCH_PARAM = 128;
};

}  // namespace rag_core

#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "rag_core/stores/metadata_filter.hpp"
#include "rag_core/types/chunk.hpp"

namespace rag_core {

enum class DistanceMetric { COSINE, L2 };

std::string to_string(DistanceMetric metric);
DistanceMetric distance_metric_from_string(const std::string& str);

/**
 * Vector storage for one configured database.
 *
 * Chunks are owned by their document: they are written together and removed
 * together. upsert() is a compare-and-set on the document hash; a document
 * already present is left untouched and none of its ids are returned.
 * Readers never observe a document whose chunks are only partly written.
 *
 * Scores are "higher is better": cosine similarity, or 1 / (1 + distance)
 * for L2.
 */
class VectorStore {
 public:
  virtual ~VectorStore() = default;

  virtual std::string type() const = 0;
  virtual size_t dimension() const = 0;
  virtual DistanceMetric metric() const = 0;

  // Returns the ids actually inserted. A vector of the wrong length throws
  // ConfigurationError before anything is written.
  virtual std::vector<std::string> upsert(const std::vector<Chunk>& chunks) = 0;

  virtual std::vector<ScoredChunk> query(const std::vector<float>& query_vector, size_t top_k,
                                         const MetadataFilter& filter = {}) const = 0;

  // Lexical ranking: fraction of distinct query terms found in the chunk.
  virtual std::vector<ScoredChunk> keyword_search(const std::string& query_text, size_t top_k,
                                                  const MetadataFilter& filter = {}) const = 0;

  // Sorted by chunk index.
  virtual std::vector<Chunk> get_document_chunks(const std::string& document_hash) const = 0;

  virtual bool contains_document(const std::string& document_hash) const = 0;

  // Returns the number of chunks removed.
  virtual size_t delete_document(const std::string& document_hash) = 0;
  virtual size_t delete_chunks(const std::vector<std::string>& ids) = 0;

  virtual size_t count() const = 0;

  // Stored documents with their chunk counts, keyed by document hash.
  virtual std::map<std::string, size_t> document_chunk_counts() const = 0;

 protected:
  // Shared by backends: ConfigurationError on a vector of the wrong length.
  void check_dimension(const std::vector<float>& vector, const std::string& what) const;
};

using VectorStorePtr = std::shared_ptr<VectorStore>;

// Orders by score descending, then chunk id, and keeps the first top_k.
void sort_and_truncate(std::vector<ScoredChunk>& results, size_t top_k);

}  // namespace rag_core

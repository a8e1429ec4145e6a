#include "rag_core/stores/memory_vector_store.hpp"

#include <algorithm>
#include <mutex>

#include "rag_core/errors.hpp"
#include "rag_core/stores/vector_math.hpp"
#include "rag_core/text/text_utils.hpp"

namespace rag_core {

MemoryVectorStore::MemoryVectorStore(size_t dimension, DistanceMetric metric)
    : dimension_(dimension), metric_(metric) {
  if (dimension_ == 0) {
    throw ConfigurationError("MemoryStore dimension must be greater than 0");
  }
}

std::shared_ptr<MemoryVectorStore> MemoryVectorStore::from_config(const nlohmann::json& config) {
  if (!config.contains("dimension") || !config.at("dimension").is_number_integer()) {
    throw ConfigurationError("MemoryStore config requires an integer 'dimension'");
  }
  const int dimension = config.at("dimension").get<int>();
  if (dimension <= 0) {
    throw ConfigurationError("MemoryStore dimension must be greater than 0");
  }
  return std::make_shared<MemoryVectorStore>(
      static_cast<size_t>(dimension),
      distance_metric_from_string(config.value("distance_metric", std::string("cosine"))));
}

float MemoryVectorStore::score(const std::vector<float>& query_vector,
                               const std::vector<float>& vector) const {
  if (metric_ == DistanceMetric::COSINE) {
    return vector_math::cosine_similarity(query_vector, vector);
  }
  return 1.0f / (1.0f + vector_math::l2_distance(query_vector, vector));
}

std::vector<std::string> MemoryVectorStore::upsert(const std::vector<Chunk>& chunks) {
  for (const auto& chunk : chunks) {
    check_dimension(chunk.vector_embedding, "chunk " + chunk.id);
  }

  std::unique_lock<std::shared_mutex> lock(mutex_);
  std::vector<std::string> inserted;
  std::unordered_set<std::string> skipped_documents;
  std::unordered_set<std::string> new_documents;
  for (const auto& chunk : chunks) {
    if (skipped_documents.count(chunk.document_hash) > 0) {
      continue;
    }
    if (new_documents.count(chunk.document_hash) == 0) {
      if (document_chunks_.count(chunk.document_hash) > 0) {
        skipped_documents.insert(chunk.document_hash);
        continue;
      }
      new_documents.insert(chunk.document_hash);
    }
    if (entries_.count(chunk.id) > 0) {
      continue;
    }
    entries_[chunk.id] = Entry{chunk, text::term_set(chunk.content)};
    document_chunks_[chunk.document_hash].push_back(chunk.id);
    inserted.push_back(chunk.id);
  }
  return inserted;
}

std::vector<ScoredChunk> MemoryVectorStore::query(const std::vector<float>& query_vector,
                                                  size_t top_k,
                                                  const MetadataFilter& filter) const {
  check_dimension(query_vector, "query vector");
  std::shared_lock<std::shared_mutex> lock(mutex_);
  std::vector<ScoredChunk> results;
  for (const auto& [id, entry] : entries_) {
    if (!filter.matches(entry.chunk.metadata)) {
      continue;
    }
    results.push_back({entry.chunk, score(query_vector, entry.chunk.vector_embedding)});
  }
  sort_and_truncate(results, top_k);
  return results;
}

std::vector<ScoredChunk> MemoryVectorStore::keyword_search(const std::string& query_text,
                                                           size_t top_k,
                                                           const MetadataFilter& filter) const {
  const auto query_terms = text::term_set(query_text);
  if (query_terms.empty()) {
    return {};
  }
  std::shared_lock<std::shared_mutex> lock(mutex_);
  std::vector<ScoredChunk> results;
  for (const auto& [id, entry] : entries_) {
    const double overlap = text::term_overlap(query_terms, entry.terms);
    if (overlap <= 0.0 || !filter.matches(entry.chunk.metadata)) {
      continue;
    }
    results.push_back({entry.chunk, static_cast<float>(overlap)});
  }
  sort_and_truncate(results, top_k);
  return results;
}

std::vector<Chunk> MemoryVectorStore::get_document_chunks(const std::string& document_hash) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  std::vector<Chunk> chunks;
  auto it = document_chunks_.find(document_hash);
  if (it == document_chunks_.end()) {
    return chunks;
  }
  for (const auto& id : it->second) {
    chunks.push_back(entries_.at(id).chunk);
  }
  std::sort(chunks.begin(), chunks.end(),
            [](const Chunk& a, const Chunk& b) { return a.chunk_index < b.chunk_index; });
  return chunks;
}

bool MemoryVectorStore::contains_document(const std::string& document_hash) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return document_chunks_.count(document_hash) > 0;
}

size_t MemoryVectorStore::delete_document(const std::string& document_hash) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  auto it = document_chunks_.find(document_hash);
  if (it == document_chunks_.end()) {
    return 0;
  }
  size_t removed = 0;
  for (const auto& id : it->second) {
    removed += entries_.erase(id);
  }
  document_chunks_.erase(it);
  return removed;
}

size_t MemoryVectorStore::delete_chunks(const std::vector<std::string>& ids) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  size_t removed = 0;
  for (const auto& id : ids) {
    auto it = entries_.find(id);
    if (it == entries_.end()) {
      continue;
    }
    auto doc_it = document_chunks_.find(it->second.chunk.document_hash);
    if (doc_it != document_chunks_.end()) {
      auto& doc_ids = doc_it->second;
      doc_ids.erase(std::remove(doc_ids.begin(), doc_ids.end(), id), doc_ids.end());
      if (doc_ids.empty()) {
        document_chunks_.erase(doc_it);
      }
    }
    entries_.erase(it);
    ++removed;
  }
  return removed;
}

size_t MemoryVectorStore::count() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return entries_.size();
}

std::map<std::string, size_t> MemoryVectorStore::document_chunk_counts() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  std::map<std::string, size_t> counts;
  for (const auto& [hash, ids] : document_chunks_) {
    counts.emplace(hash, ids.size());
  }
  return counts;
}

}  // namespace rag_core

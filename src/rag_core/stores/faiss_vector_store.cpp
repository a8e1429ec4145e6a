#include "rag_core/stores/faiss_vector_store.hpp"

#include <faiss/IndexFlat.h>
#include <faiss/IndexHNSW.h>
#include <faiss/impl/FaissException.h>

#include <algorithm>
#include <cmath>
#include <iostream>
#include <mutex>
#include <sstream>

#include "rag_core/db/pooled_connection.hpp"
#include "rag_core/db/sqlite_support.hpp"
#include "rag_core/db/transaction.hpp"
#include "rag_core/errors.hpp"
#include "rag_core/stores/blob_codec.hpp"
#include "rag_core/stores/vector_math.hpp"
#include "rag_core/text/text_utils.hpp"

namespace rag_core {

namespace {

std::string id_list(const std::vector<int64_t>& ids) {
  std::stringstream ss;
  for (size_t i = 0; i < ids.size(); ++i) {
    ss << ids[i];
    if (i < ids.size() - 1) {
      ss << ",";
    }
  }
  return ss.str();
}

// Keeps IN (...) lists well under sqlite's expression limits.
constexpr size_t ID_BATCH_SIZE = 500;

}  // namespace

FaissVectorStore::FaissVectorStore(DatabaseManager& db_manager, std::string database_name,
                                   size_t dimension, DistanceMetric metric)
    : db_manager_(db_manager),
      database_name_(std::move(database_name)),
      dimension_(dimension),
      metric_(metric) {
  if (dimension_ == 0) {
    throw ConfigurationError("FaissStore dimension must be greater than 0");
  }
  rebuild_index();
}

FaissVectorStore::~FaissVectorStore() = default;

std::shared_ptr<FaissVectorStore> FaissVectorStore::from_config(DatabaseManager& db_manager,
                                                                const std::string& database_name,
                                                                const nlohmann::json& config) {
  if (!config.contains("dimension") || !config.at("dimension").is_number_integer()) {
    throw ConfigurationError("FaissStore config for '" + database_name +
                             "' requires an integer 'dimension'");
  }
  const int dimension = config.at("dimension").get<int>();
  if (dimension <= 0) {
    throw ConfigurationError("FaissStore dimension must be greater than 0");
  }
  return std::make_shared<FaissVectorStore>(
      db_manager, database_name, static_cast<size_t>(dimension),
      distance_metric_from_string(config.value("distance_metric", std::string("cosine"))));
}

std::unique_ptr<faiss::IndexIDMap> FaissVectorStore::create_base_index() const {
  const faiss::MetricType metric =
      metric_ == DistanceMetric::COSINE ? faiss::METRIC_INNER_PRODUCT : faiss::METRIC_L2;
  auto* base_index = new faiss::IndexHNSWFlat(static_cast<int>(dimension_), HNSW_M_PARAM, metric);
  base_index->hnsw.efConstruction = HNSW_EF_CONSTRUCTION_PARAM;
  base_index->hnsw.efSearch = HNSW_EF_SEARCH_PARAM;
  auto index = std::make_unique<faiss::IndexIDMap>(base_index);
  index->own_fields = true;
  return index;
}

std::unique_ptr<faiss::IndexIDMap> FaissVectorStore::create_flat_index() const {
  faiss::Index* base_index = nullptr;
  if (metric_ == DistanceMetric::COSINE) {
    base_index = new faiss::IndexFlatIP(static_cast<faiss::idx_t>(dimension_));
  } else {
    base_index = new faiss::IndexFlatL2(static_cast<faiss::idx_t>(dimension_));
  }
  auto index = std::make_unique<faiss::IndexIDMap>(base_index);
  index->own_fields = true;
  return index;
}

// Cosine similarity is inner product over unit vectors.
std::vector<float> FaissVectorStore::prepare_vector(const std::vector<float>& vector) const {
  return metric_ == DistanceMetric::COSINE ? vector_math::normalized(vector) : vector;
}

float FaissVectorStore::to_score(float raw_distance) const {
  if (metric_ == DistanceMetric::COSINE) {
    return raw_distance;
  }
  // IndexFlatL2 / HNSW L2 report squared distances.
  return 1.0f / (1.0f + std::sqrt(std::max(raw_distance, 0.0f)));
}

void FaissVectorStore::rebuild_index() {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  rebuild_index_locked();
}

void FaissVectorStore::rebuild_index_locked() {
  auto index = create_base_index();
  std::unordered_map<int64_t, RowInfo> rows;
  std::unordered_map<std::string, std::vector<int64_t>> document_rows;
  std::vector<faiss::idx_t> faiss_ids;
  std::vector<float> all_vectors_flat;

  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT faiss_id, chunk_id, document_hash, chunk_index, content, metadata, "
             "vector_blob FROM vector_chunks WHERE database_name = ?"
          << database_name_ >>
        [&](int64_t faiss_id, std::string chunk_id, std::string document_hash, int chunk_index,
            std::vector<char> content, std::string metadata, std::vector<char> vector_blob) {
          if (vector_blob.size() != dimension_ * sizeof(float)) {
            std::cerr << "Warning: Skipping chunk " << chunk_id << " of database "
                      << database_name_ << " during index rebuild: stored vector has "
                      << vector_blob.size() / sizeof(float) << " dimensions, expected "
                      << dimension_ << std::endl;
            return;
          }
          std::vector<float> vector = prepare_vector(BlobCodec::decode_vector(vector_blob));
          all_vectors_flat.insert(all_vectors_flat.end(), vector.begin(), vector.end());
          faiss_ids.push_back(faiss_id);

          RowInfo row;
          row.chunk_id = std::move(chunk_id);
          row.document_hash = document_hash;
          row.chunk_index = chunk_index;
          row.metadata = nlohmann::json::parse(metadata);
          row.terms = text::term_set(BlobCodec::decompress_text(content));
          rows.emplace(faiss_id, std::move(row));
          document_rows[document_hash].push_back(faiss_id);
        };
  } catch (const sqlite::sqlite_exception& e) {
    throw StoreError(format_db_error("rebuild_faiss_index", e));
  } catch (const ConnectionPoolError& e) {
    throw StoreError("rebuild_faiss_index failed: " + std::string(e.what()));
  } catch (const nlohmann::json::exception& e) {
    throw StoreError("rebuild_faiss_index failed: corrupt chunk metadata: " + std::string(e.what()));
  }

  try {
    if (!faiss_ids.empty()) {
      index->add_with_ids(static_cast<faiss::idx_t>(faiss_ids.size()), all_vectors_flat.data(),
                          faiss_ids.data());
    }
  } catch (const faiss::FaissException& e) {
    throw StoreError("rebuild_faiss_index failed: " + std::string(e.what()));
  }

  index_ = std::move(index);
  rows_ = std::move(rows);
  document_rows_ = std::move(document_rows);
}

std::vector<std::string> FaissVectorStore::upsert(const std::vector<Chunk>& chunks) {
  for (const auto& chunk : chunks) {
    check_dimension(chunk.vector_embedding, "chunk " + chunk.id);
  }
  if (chunks.empty()) {
    return {};
  }

  std::unique_lock<std::shared_mutex> lock(mutex_);
  std::vector<std::string> inserted;
  std::vector<faiss::idx_t> new_ids;
  std::vector<float> new_vectors;
  std::vector<std::pair<int64_t, RowInfo>> new_rows;

  try {
    PooledConnection conn(db_manager_);
    Transaction tx(*conn, TxMode::Immediate);

    std::unordered_map<std::string, bool> document_present;
    for (const auto& chunk : chunks) {
      auto known = document_present.find(chunk.document_hash);
      if (known == document_present.end()) {
        int existing = 0;
        *conn << "SELECT COUNT(*) FROM vector_chunks WHERE database_name = ? AND document_hash = ?"
              << database_name_ << chunk.document_hash >>
            existing;
        known = document_present.emplace(chunk.document_hash, existing > 0).first;
      }
      if (known->second) {
        continue;
      }

      *conn << "INSERT INTO vector_chunks (database_name, chunk_id, document_hash, chunk_index, "
               "chunk_hash, content, metadata, vector_blob) VALUES (?,?,?,?,?,?,?,?)"
            << database_name_ << chunk.id << chunk.document_hash << chunk.chunk_index
            << chunk.chunk_hash << BlobCodec::compress_text(chunk.content) << chunk.metadata.dump()
            << BlobCodec::encode_vector(chunk.vector_embedding);
      const int64_t faiss_id = conn->last_insert_rowid();

      std::vector<float> vector = prepare_vector(chunk.vector_embedding);
      new_vectors.insert(new_vectors.end(), vector.begin(), vector.end());
      new_ids.push_back(faiss_id);
      new_rows.emplace_back(faiss_id, RowInfo{chunk.id, chunk.document_hash, chunk.chunk_index,
                                              chunk.metadata, text::term_set(chunk.content)});
      inserted.push_back(chunk.id);
    }
    tx.commit();
  } catch (const sqlite::sqlite_exception& e) {
    throw StoreError(format_db_error("upsert_chunks", e));
  } catch (const ConnectionPoolError& e) {
    throw StoreError("upsert_chunks failed: " + std::string(e.what()));
  }

  try {
    if (!new_ids.empty()) {
      index_->add_with_ids(static_cast<faiss::idx_t>(new_ids.size()), new_vectors.data(),
                           new_ids.data());
    }
  } catch (const faiss::FaissException& e) {
    // Rows are committed; a rebuild brings the index back in line with them.
    std::cerr << "Warning: faiss add failed for database " << database_name_
              << ", rebuilding index: " << e.what() << std::endl;
    rebuild_index_locked();
    return inserted;
  }
  for (auto& [faiss_id, row] : new_rows) {
    document_rows_[row.document_hash].push_back(faiss_id);
    rows_.emplace(faiss_id, std::move(row));
  }
  return inserted;
}

std::vector<std::pair<int64_t, float>> FaissVectorStore::search(
    faiss::IndexIDMap& index, const std::vector<float>& query_vector, size_t top_k) const {
  const auto k = static_cast<faiss::idx_t>(std::min<size_t>(top_k, index.ntotal));
  if (k <= 0) {
    return {};
  }
  std::vector<float> prepared = prepare_vector(query_vector);
  std::vector<float> distances(k);
  std::vector<faiss::idx_t> labels(k);
  try {
    index.search(1, prepared.data(), k, distances.data(), labels.data());
  } catch (const faiss::FaissException& e) {
    throw StoreError("faiss search failed: " + std::string(e.what()));
  }

  std::vector<std::pair<int64_t, float>> hits;
  hits.reserve(k);
  for (faiss::idx_t i = 0; i < k; ++i) {
    if (labels[i] != -1) {
      hits.emplace_back(labels[i], to_score(distances[i]));
    }
  }
  return hits;
}

std::vector<Chunk> FaissVectorStore::load_chunks(const std::vector<int64_t>& faiss_ids,
                                                 bool with_vectors) const {
  std::vector<Chunk> chunks;
  if (faiss_ids.empty()) {
    return chunks;
  }
  try {
    PooledConnection conn(db_manager_);
    for (size_t start = 0; start < faiss_ids.size(); start += ID_BATCH_SIZE) {
      const size_t end = std::min(start + ID_BATCH_SIZE, faiss_ids.size());
      std::vector<int64_t> batch(faiss_ids.begin() + start, faiss_ids.begin() + end);
      *conn << "SELECT chunk_id, document_hash, chunk_index, chunk_hash, content, metadata, "
               "vector_blob FROM vector_chunks WHERE faiss_id IN (" +
                   id_list(batch) + ")" >>
          [&](std::string chunk_id, std::string document_hash, int chunk_index,
              std::string chunk_hash, std::vector<char> content, std::string metadata,
              std::vector<char> vector_blob) {
            Chunk chunk;
            chunk.id = std::move(chunk_id);
            chunk.document_hash = std::move(document_hash);
            chunk.chunk_index = chunk_index;
            chunk.chunk_hash = std::move(chunk_hash);
            chunk.content = BlobCodec::decompress_text(content);
            chunk.metadata = nlohmann::json::parse(metadata);
            if (with_vectors) {
              chunk.vector_embedding = BlobCodec::decode_vector(vector_blob, dimension_);
            }
            chunks.push_back(std::move(chunk));
          };
    }
  } catch (const sqlite::sqlite_exception& e) {
    throw StoreError(format_db_error("load_chunks", e));
  } catch (const ConnectionPoolError& e) {
    throw StoreError("load_chunks failed: " + std::string(e.what()));
  } catch (const nlohmann::json::exception& e) {
    throw StoreError("load_chunks failed: corrupt chunk metadata: " + std::string(e.what()));
  }
  return chunks;
}

std::vector<ScoredChunk> FaissVectorStore::query(const std::vector<float>& query_vector,
                                                 size_t top_k,
                                                 const MetadataFilter& filter) const {
  check_dimension(query_vector, "query vector");
  if (top_k == 0) {
    return {};
  }
  std::shared_lock<std::shared_mutex> lock(mutex_);

  std::vector<std::pair<int64_t, float>> hits;
  if (filter.empty()) {
    hits = search(*index_, query_vector, top_k);
  } else {
    std::vector<int64_t> matching;
    for (const auto& [faiss_id, row] : rows_) {
      if (filter.matches(row.metadata)) {
        matching.push_back(faiss_id);
      }
    }
    if (matching.empty()) {
      return {};
    }

    auto candidates = load_chunks(matching, /*with_vectors*/ true);
    auto flat_index = create_flat_index();
    std::vector<faiss::idx_t> ids;
    std::vector<float> flat;
    std::unordered_map<std::string, int64_t> id_by_chunk;
    for (const auto& [faiss_id, row] : rows_) {
      id_by_chunk[row.chunk_id] = faiss_id;
    }
    for (const auto& chunk : candidates) {
      std::vector<float> vector = prepare_vector(chunk.vector_embedding);
      flat.insert(flat.end(), vector.begin(), vector.end());
      ids.push_back(id_by_chunk.at(chunk.id));
    }
    try {
      flat_index->add_with_ids(static_cast<faiss::idx_t>(ids.size()), flat.data(), ids.data());
    } catch (const faiss::FaissException& e) {
      throw StoreError("faiss filtered search failed: " + std::string(e.what()));
    }
    hits = search(*flat_index, query_vector, top_k);
  }

  std::vector<int64_t> hit_ids;
  std::unordered_map<std::string, float> score_by_chunk;
  for (const auto& [faiss_id, score] : hits) {
    hit_ids.push_back(faiss_id);
    score_by_chunk[rows_.at(faiss_id).chunk_id] = score;
  }

  std::vector<ScoredChunk> results;
  for (auto& chunk : load_chunks(hit_ids, /*with_vectors*/ false)) {
    const float score = score_by_chunk.at(chunk.id);
    results.push_back({std::move(chunk), score});
  }
  sort_and_truncate(results, top_k);
  return results;
}

std::vector<ScoredChunk> FaissVectorStore::keyword_search(const std::string& query_text,
                                                          size_t top_k,
                                                          const MetadataFilter& filter) const {
  const auto query_terms = text::term_set(query_text);
  if (query_terms.empty() || top_k == 0) {
    return {};
  }
  std::shared_lock<std::shared_mutex> lock(mutex_);

  std::vector<std::pair<int64_t, float>> hits;
  for (const auto& [faiss_id, row] : rows_) {
    const double overlap = text::term_overlap(query_terms, row.terms);
    if (overlap > 0.0 && filter.matches(row.metadata)) {
      hits.emplace_back(faiss_id, static_cast<float>(overlap));
    }
  }
  std::sort(hits.begin(), hits.end(), [this](const auto& a, const auto& b) {
    if (a.second != b.second) {
      return a.second > b.second;
    }
    return rows_.at(a.first).chunk_id < rows_.at(b.first).chunk_id;
  });
  if (hits.size() > top_k) {
    hits.resize(top_k);
  }

  std::vector<int64_t> hit_ids;
  std::unordered_map<std::string, float> score_by_chunk;
  for (const auto& [faiss_id, score] : hits) {
    hit_ids.push_back(faiss_id);
    score_by_chunk[rows_.at(faiss_id).chunk_id] = score;
  }
  std::vector<ScoredChunk> results;
  for (auto& chunk : load_chunks(hit_ids, /*with_vectors*/ false)) {
    const float score = score_by_chunk.at(chunk.id);
    results.push_back({std::move(chunk), score});
  }
  sort_and_truncate(results, top_k);
  return results;
}

std::vector<Chunk> FaissVectorStore::get_document_chunks(const std::string& document_hash) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto it = document_rows_.find(document_hash);
  if (it == document_rows_.end()) {
    return {};
  }
  auto chunks = load_chunks(it->second, /*with_vectors*/ true);
  std::sort(chunks.begin(), chunks.end(),
            [](const Chunk& a, const Chunk& b) { return a.chunk_index < b.chunk_index; });
  return chunks;
}

bool FaissVectorStore::contains_document(const std::string& document_hash) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return document_rows_.count(document_hash) > 0;
}

size_t FaissVectorStore::delete_document(const std::string& document_hash) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  int removed = 0;
  try {
    PooledConnection conn(db_manager_);
    *conn << "DELETE FROM vector_chunks WHERE database_name = ? AND document_hash = ?"
          << database_name_ << document_hash;
    removed = conn->rows_modified();
  } catch (const sqlite::sqlite_exception& e) {
    throw StoreError(format_db_error("delete_document", e));
  } catch (const ConnectionPoolError& e) {
    throw StoreError("delete_document failed: " + std::string(e.what()));
  }
  // The connection is back in the pool before the rebuild takes one.
  if (removed > 0) {
    rebuild_index_locked();
  }
  return static_cast<size_t>(removed);
}

size_t FaissVectorStore::delete_chunks(const std::vector<std::string>& ids) {
  if (ids.empty()) {
    return 0;
  }
  std::unique_lock<std::shared_mutex> lock(mutex_);
  size_t removed = 0;
  try {
    PooledConnection conn(db_manager_);
    Transaction tx(*conn, TxMode::Immediate);
    for (const auto& id : ids) {
      *conn << "DELETE FROM vector_chunks WHERE database_name = ? AND chunk_id = ?"
            << database_name_ << id;
      removed += static_cast<size_t>(conn->rows_modified());
    }
    tx.commit();
  } catch (const sqlite::sqlite_exception& e) {
    throw StoreError(format_db_error("delete_chunks", e));
  } catch (const ConnectionPoolError& e) {
    throw StoreError("delete_chunks failed: " + std::string(e.what()));
  }
  if (removed > 0) {
    rebuild_index_locked();
  }
  return removed;
}

size_t FaissVectorStore::count() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return rows_.size();
}

std::map<std::string, size_t> FaissVectorStore::document_chunk_counts() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  std::map<std::string, size_t> counts;
  for (const auto& [hash, faiss_ids] : document_rows_) {
    counts.emplace(hash, faiss_ids.size());
  }
  return counts;
}

}  // namespace rag_core

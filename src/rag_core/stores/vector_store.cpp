#include "rag_core/stores/vector_store.hpp"

#include <algorithm>

#include "rag_core/errors.hpp"

namespace rag_core {

std::string to_string(DistanceMetric metric) {
  return metric == DistanceMetric::COSINE ? "cosine" : "l2";
}

DistanceMetric distance_metric_from_string(const std::string& str) {
  if (str == "cosine") return DistanceMetric::COSINE;
  if (str == "l2" || str == "euclidean") return DistanceMetric::L2;
  throw ConfigurationError("Unknown distance_metric: " + str);
}

void VectorStore::check_dimension(const std::vector<float>& vector, const std::string& what) const {
  if (vector.size() != dimension()) {
    throw ConfigurationError("Dimension mismatch for " + what + ": database expects " +
                             std::to_string(dimension()) + ", got " +
                             std::to_string(vector.size()));
  }
}

void sort_and_truncate(std::vector<ScoredChunk>& results, size_t top_k) {
  std::sort(results.begin(), results.end(), [](const ScoredChunk& a, const ScoredChunk& b) {
    if (a.score != b.score) {
      return a.score > b.score;
    }
    return a.chunk.id < b.chunk.id;
  });
  if (results.size() > top_k) {
    results.resize(top_k);
  }
}

}  // namespace rag_core

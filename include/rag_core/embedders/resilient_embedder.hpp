#pragma once

#include <chrono>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "rag_core/embedders/circuit_breaker.hpp"
#include "rag_core/embedders/embedder.hpp"

namespace rag_core {

struct EmbeddingPolicy {
  size_t batch_size = 16;
  int max_retries = 3;
  std::chrono::milliseconds initial_backoff{200};
  std::chrono::milliseconds max_backoff{5000};
  int failure_threshold = 5;
  std::chrono::milliseconds reset_timeout{30000};

  // Reads batch_size, max_retries, initial_backoff_ms, max_backoff_ms,
  // failure_threshold and reset_timeout_ms. Throws ConfigurationError.
  static EmbeddingPolicy from_json(const nlohmann::json& config);
};

// Per-text result of embed_all: a vector, or the reason that text failed.
struct EmbeddingBatchResult {
  std::vector<std::optional<std::vector<float>>> vectors;
  std::vector<std::string> errors;

  size_t failed_count() const;
};

/**
 * Wraps an Embedder with batching, retries and a circuit breaker.
 *
 * Transient errors are retried with exponential backoff. Once retries are
 * exhausted, or while the breaker is open, BackendUnavailableError is thrown.
 * A permanent error on a batch is retried text by text so only the offending
 * texts fail. Vectors with non-finite components or all zeros fail their text;
 * a vector of the wrong length is a ConfigurationError.
 */
class ResilientEmbedder {
 public:
  ResilientEmbedder(EmbedderPtr backend, EmbeddingPolicy policy);

  EmbeddingBatchResult embed_all(const std::vector<std::string>& texts);

  // Single text, e.g. a query. Every failure is thrown.
  std::vector<float> embed_one(const std::string& text);

  size_t dimension() const {
    return backend_->dimension();
  }
  std::string type() const {
    return backend_->type();
  }
  const EmbeddingPolicy& policy() const {
    return policy_;
  }
  const CircuitBreaker& breaker() const {
    return breaker_;
  }
  bool backend_available() const {
    return backend_->is_available();
  }

 private:
  std::vector<std::vector<float>> call_with_retry(const std::vector<std::string>& batch);
  // Empty string when the vector is usable.
  std::string check_vector(const std::vector<float>& vector) const;

  EmbedderPtr backend_;
  EmbeddingPolicy policy_;
  CircuitBreaker breaker_;
};

using ResilientEmbedderPtr = std::shared_ptr<ResilientEmbedder>;

}  // namespace rag_core

#include "rag_core/embedders/resilient_embedder.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <thread>

#include "rag_core/errors.hpp"

namespace rag_core {

namespace {

int read_int(const nlohmann::json& config, const char* key, int fallback, int minimum) {
  int value = fallback;
  try {
    value = config.value(key, fallback);
  } catch (const nlohmann::json::exception& e) {
    throw ConfigurationError(std::string(key) + " must be an integer: " + e.what());
  }
  if (value < minimum) {
    throw ConfigurationError(std::string(key) + " must be >= " + std::to_string(minimum));
  }
  return value;
}

}  // namespace

EmbeddingPolicy EmbeddingPolicy::from_json(const nlohmann::json& config) {
  EmbeddingPolicy policy;
  policy.batch_size = static_cast<size_t>(
      read_int(config, "batch_size", static_cast<int>(policy.batch_size), 1));
  policy.max_retries = read_int(config, "max_retries", policy.max_retries, 0);
  policy.initial_backoff = std::chrono::milliseconds(read_int(
      config, "initial_backoff_ms", static_cast<int>(policy.initial_backoff.count()), 0));
  policy.max_backoff = std::chrono::milliseconds(
      read_int(config, "max_backoff_ms", static_cast<int>(policy.max_backoff.count()), 0));
  policy.failure_threshold = read_int(config, "failure_threshold", policy.failure_threshold, 1);
  policy.reset_timeout = std::chrono::milliseconds(
      read_int(config, "reset_timeout_ms", static_cast<int>(policy.reset_timeout.count()), 0));
  if (policy.max_backoff < policy.initial_backoff) {
    throw ConfigurationError("max_backoff_ms must be >= initial_backoff_ms");
  }
  return policy;
}

size_t EmbeddingBatchResult::failed_count() const {
  return static_cast<size_t>(
      std::count_if(vectors.begin(), vectors.end(), [](const auto& v) { return !v.has_value(); }));
}

ResilientEmbedder::ResilientEmbedder(EmbedderPtr backend, EmbeddingPolicy policy)
    : backend_(std::move(backend)),
      policy_(policy),
      breaker_(policy.failure_threshold, policy.reset_timeout) {}

std::string ResilientEmbedder::check_vector(const std::vector<float>& vector) const {
  if (vector.size() != backend_->dimension()) {
    throw ConfigurationError(backend_->type() + " returned a " + std::to_string(vector.size()) +
                             "-dimension vector, expected " +
                             std::to_string(backend_->dimension()));
  }
  bool all_zero = true;
  for (float v : vector) {
    if (!std::isfinite(v)) {
      return "embedding contains non-finite values";
    }
    if (v != 0.0f) {
      all_zero = false;
    }
  }
  return all_zero ? "embedding is all zeros" : "";
}

std::vector<std::vector<float>> ResilientEmbedder::call_with_retry(
    const std::vector<std::string>& batch) {
  std::chrono::milliseconds backoff = policy_.initial_backoff;
  for (int attempt = 0;; ++attempt) {
    if (!breaker_.allow_request()) {
      throw BackendUnavailableError("Embedding backend " + backend_->type() +
                                    " unavailable: circuit breaker is open");
    }
    try {
      auto vectors = backend_->embed(batch);
      breaker_.record_success();
      if (vectors.size() != batch.size()) {
        throw EmbeddingError("backend returned " + std::to_string(vectors.size()) +
                                 " vectors for " + std::to_string(batch.size()) + " texts",
                             false);
      }
      return vectors;
    } catch (const EmbeddingError& e) {
      if (!e.is_transient()) {
        // The backend answered; only the input was bad.
        breaker_.record_success();
        throw;
      }
      breaker_.record_failure();
      if (attempt >= policy_.max_retries) {
        throw BackendUnavailableError("Embedding backend " + backend_->type() +
                                      " unavailable after " + std::to_string(attempt + 1) +
                                      " attempt(s): " + e.what());
      }
      std::cerr << "[ResilientEmbedder] transient error (attempt " << attempt + 1 << "/"
                << policy_.max_retries + 1 << "), retrying in " << backoff.count()
                << "ms: " << e.what() << std::endl;
      std::this_thread::sleep_for(backoff);
      backoff = std::min(backoff * 2, policy_.max_backoff);
    }
  }
}

EmbeddingBatchResult ResilientEmbedder::embed_all(const std::vector<std::string>& texts) {
  EmbeddingBatchResult result;
  result.vectors.resize(texts.size());
  result.errors.resize(texts.size());

  auto store = [&](size_t index, std::vector<float> vector) {
    std::string problem = check_vector(vector);
    if (problem.empty()) {
      result.vectors[index] = std::move(vector);
    } else {
      std::cerr << "[ResilientEmbedder] rejecting vector for text " << index << ": " << problem
                << std::endl;
      result.errors[index] = problem;
    }
  };

  for (size_t start = 0; start < texts.size(); start += policy_.batch_size) {
    const size_t end = std::min(start + policy_.batch_size, texts.size());
    std::vector<std::string> batch(texts.begin() + start, texts.begin() + end);

    try {
      auto vectors = call_with_retry(batch);
      for (size_t i = 0; i < vectors.size(); ++i) {
        store(start + i, std::move(vectors[i]));
      }
      continue;
    } catch (const EmbeddingError& e) {
      if (batch.size() == 1) {
        result.errors[start] = e.what();
        continue;
      }
      std::cerr << "[ResilientEmbedder] batch failed permanently, retrying texts one by one: "
                << e.what() << std::endl;
    }

    for (size_t i = start; i < end; ++i) {
      try {
        auto vectors = call_with_retry({texts[i]});
        store(i, std::move(vectors.front()));
      } catch (const EmbeddingError& e) {
        result.errors[i] = e.what();
      }
    }
  }
  return result;
}

std::vector<float> ResilientEmbedder::embed_one(const std::string& text) {
  auto vectors = call_with_retry({text});
  std::string problem = check_vector(vectors.front());
  if (!problem.empty()) {
    throw EmbeddingError(problem, false);
  }
  return std::move(vectors.front());
}

}  // namespace rag_core

#include "rag_core/embedders/hashing_embedder.hpp"

#include <cmath>
#include <cstdint>

#include "rag_core/errors.hpp"
#include "rag_core/text/text_utils.hpp"

namespace rag_core {

namespace {

// FNV-1a, stable across platforms and runs.
uint64_t fnv1a(std::string_view data) {
  uint64_t hash = 14695981039346656037ULL;
  for (unsigned char c : data) {
    hash ^= c;
    hash *= 1099511628211ULL;
  }
  return hash;
}

}  // namespace

HashingEmbedder::HashingEmbedder(const nlohmann::json& config) {
  const int dimension = config.value("dimension", static_cast<int>(DEFAULT_DIMENSION));
  if (dimension <= 0) {
    throw ConfigurationError("HashingEmbedder dimension must be greater than 0");
  }
  dimension_ = static_cast<size_t>(dimension);
  use_bigrams_ = config.value("use_bigrams", use_bigrams_);
}

std::vector<float> HashingEmbedder::embed_text(const std::string& text) const {
  std::vector<float> vector(dimension_, 0.0f);
  auto add_feature = [&](std::string_view feature, float weight) {
    const uint64_t hash = fnv1a(feature);
    const size_t bucket = hash % dimension_;
    const float sign = (hash >> 63) != 0 ? -1.0f : 1.0f;
    vector[bucket] += sign * weight;
  };

  const auto tokens = text::tokenize(text);
  for (size_t i = 0; i < tokens.size(); ++i) {
    add_feature(tokens[i], 1.0f);
    if (use_bigrams_ && i + 1 < tokens.size()) {
      add_feature(tokens[i] + ' ' + tokens[i + 1], 0.5f);
    }
  }

  double norm = 0.0;
  for (float v : vector) {
    norm += static_cast<double>(v) * v;
  }
  if (norm > 0.0) {
    const float inv = static_cast<float>(1.0 / std::sqrt(norm));
    for (float& v : vector) {
      v *= inv;
    }
  }
  return vector;
}

std::vector<std::vector<float>> HashingEmbedder::embed(const std::vector<std::string>& texts) {
  std::vector<std::vector<float>> vectors;
  vectors.reserve(texts.size());
  for (const auto& text : texts) {
    vectors.push_back(embed_text(text));
  }
  return vectors;
}

}  // namespace rag_core

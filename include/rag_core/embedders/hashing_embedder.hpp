#pragma once

#include <nlohmann/json.hpp>

#include "rag_core/embedders/embedder.hpp"

namespace rag_core {

// Deterministic local embedder: signed feature hashing of word unigrams and
// bigrams into `dimension` buckets, L2-normalized. Needs no model server.
class HashingEmbedder : public Embedder {
 public:
  static constexpr const char* TYPE = "HashingEmbedder";
  static constexpr size_t DEFAULT_DIMENSION = 384;

  explicit HashingEmbedder(const nlohmann::json& config = nlohmann::json::object());

  std::string type() const override {
    return TYPE;
  }
  size_t dimension() const override {
    return dimension_;
  }
  std::vector<std::vector<float>> embed(const std::vector<std::string>& texts) override;

  std::vector<float> embed_text(const std::string& text) const;

 private:
  size_t dimension_ = DEFAULT_DIMENSION;
  bool use_bigrams_ = true;
};

}  // namespace rag_core

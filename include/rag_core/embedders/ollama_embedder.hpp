#pragma once

#include <mutex>
#include <nlohmann/json.hpp>
#include <string>

#include "rag_core/embedders/embedder.hpp"

namespace rag_core {

// Embeddings from an Ollama server through ollama-hpp. The server is not
// contacted at construction; unreachable servers surface as transient
// EmbeddingErrors on the first call.
class OllamaEmbedder : public Embedder {
 public:
  static constexpr const char* TYPE = "OllamaEmbedder";

  explicit OllamaEmbedder(const nlohmann::json& config);

  std::string type() const override {
    return TYPE;
  }
  size_t dimension() const override {
    return dimension_;
  }
  std::vector<std::vector<float>> embed(const std::vector<std::string>& texts) override;

  // Asks the server whether it is running.
  bool is_available() const override;

  // Pulls the vector out of an /api/embed response. Throws a permanent
  // EmbeddingError on malformed responses.
  static std::vector<float> parse_embedding_response(const nlohmann::json& response);

 private:
  std::vector<float> embed_one(const std::string& text);

  std::string base_url_;
  std::string model_;
  size_t dimension_ = 0;
};

// ollama-hpp keeps its server URL in process-wide state; every call that sets
// the URL and talks to the server holds this lock.
std::mutex& ollama_call_mutex();

}  // namespace rag_core

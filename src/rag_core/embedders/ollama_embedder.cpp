#include "rag_core/embedders/ollama_embedder.hpp"

#include "ollama.hpp"
#include "rag_core/errors.hpp"

namespace rag_core {

std::mutex& ollama_call_mutex() {
  static std::mutex mutex;
  return mutex;
}

OllamaEmbedder::OllamaEmbedder(const nlohmann::json& config)
    : base_url_(config.value("base_url", std::string("http://localhost:11434"))),
      model_(config.value("model", std::string("nomic-embed-text"))) {
  if (!config.contains("dimension")) {
    throw ConfigurationError("OllamaEmbedder requires an explicit 'dimension' for model " + model_);
  }
  const int dimension = config.value("dimension", 0);
  if (dimension <= 0) {
    throw ConfigurationError("OllamaEmbedder dimension must be greater than 0");
  }
  dimension_ = static_cast<size_t>(dimension);
  if (model_.empty()) {
    throw ConfigurationError("OllamaEmbedder model must not be empty");
  }
}

bool OllamaEmbedder::is_available() const {
  std::lock_guard<std::mutex> lock(ollama_call_mutex());
  ollama::setServerURL(base_url_);
  return ollama::is_running();
}

std::vector<float> OllamaEmbedder::parse_embedding_response(const nlohmann::json& response) {
  if (!response.contains("embeddings")) {
    throw EmbeddingError("Response does not contain embeddings field", false);
  }
  const auto& embeddings = response["embeddings"];
  if (!embeddings.is_array() || embeddings.empty()) {
    throw EmbeddingError("Embeddings field is not a non-empty array", false);
  }
  try {
    // Either an array of vectors (take the first) or a single vector.
    if (embeddings[0].is_array()) {
      return embeddings[0].get<std::vector<float>>();
    }
    return embeddings.get<std::vector<float>>();
  } catch (const nlohmann::json::exception& e) {
    throw EmbeddingError(std::string("Malformed embedding values: ") + e.what(), false);
  }
}

std::vector<float> OllamaEmbedder::embed_one(const std::string& text) {
  nlohmann::json json_response;
  try {
    std::lock_guard<std::mutex> lock(ollama_call_mutex());
    ollama::setServerURL(base_url_);
    ollama::response response = ollama::generate_embeddings(model_, text);
    json_response = response.as_json();
  } catch (const ollama::exception& e) {
    throw EmbeddingError("Embedding request to " + base_url_ + " failed: " + e.what(), true);
  }
  return parse_embedding_response(json_response);
}

std::vector<std::vector<float>> OllamaEmbedder::embed(const std::vector<std::string>& texts) {
  std::vector<std::vector<float>> vectors;
  vectors.reserve(texts.size());
  for (const auto& text : texts) {
    vectors.push_back(embed_one(text));
  }
  return vectors;
}

}  // namespace rag_core

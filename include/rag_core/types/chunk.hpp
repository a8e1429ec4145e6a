#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace rag_core {

// Text emitted by a parser, in document order, with parser-local metadata.
struct ParsedChunk {
  std::string text;
  nlohmann::json metadata = nlohmann::json::object();
};

struct Chunk {
  std::string id;
  std::string document_hash;
  std::string chunk_hash;
  int chunk_index = 0;
  std::string content;
  nlohmann::json metadata = nlohmann::json::object();
  std::vector<float> vector_embedding;
};

struct ScoredChunk {
  Chunk chunk;
  float score = 0.0f;
};

}  // namespace rag_core

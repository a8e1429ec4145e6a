#pragma once

#include <nlohmann/json.hpp>

#include "rag_core/parsers/chunker.hpp"
#include "rag_core/parsers/parser.hpp"

namespace rag_core {

// Plain text of any kind. Also serves as the last resort for markdown, csv and json.
class TextParser : public Parser {
 public:
  static constexpr const char* TYPE = "TextParser";

  explicit TextParser(const nlohmann::json& config = nlohmann::json::object());

  std::string type() const override {
    return TYPE;
  }
  std::vector<ParsedChunk> parse(const fs::path& file_path) const override;

  static std::vector<std::string> supported_formats();

 private:
  ChunkingConfig chunking_;
};

}  // namespace rag_core

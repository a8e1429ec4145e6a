#pragma once

#include <nlohmann/json.hpp>

#include "rag_core/parsers/chunker.hpp"
#include "rag_core/parsers/parser.hpp"

namespace rag_core {

/**
 * Markdown documents. Chunks default to heading boundaries and carry the
 * nearest preceding heading as "section" metadata. Headings inside fenced
 * code blocks are treated as text; a leading YAML front matter block is
 * dropped.
 */
class MarkdownParser : public Parser {
 public:
  static constexpr const char* TYPE = "MarkdownParser";

  explicit MarkdownParser(const nlohmann::json& config = nlohmann::json::object());

  std::string type() const override {
    return TYPE;
  }
  std::vector<ParsedChunk> parse(const fs::path& file_path) const override;

  static std::vector<std::string> supported_formats();

 private:
  ChunkingConfig chunking_;
};

}  // namespace rag_core

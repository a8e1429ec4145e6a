#include "rag_core/parsers/text_parser.hpp"

#include "rag_core/routing/format_sniffer.hpp"

namespace rag_core {

TextParser::TextParser(const nlohmann::json& config)
    : chunking_(ChunkingConfig::from_json(config, ChunkStrategy::PARAGRAPH)) {
  chunking_.validate();
}

std::vector<std::string> TextParser::supported_formats() {
  return {formats::TEXT, formats::MARKDOWN, formats::CSV, formats::JSON};
}

std::vector<ParsedChunk> TextParser::parse(const fs::path& file_path) const {
  std::vector<ParsedChunk> chunks;
  Chunker chunker(chunking_, [&chunks](ParsedChunk chunk) { chunks.push_back(std::move(chunk)); });

  LineReader::for_each_line(file_path, [&chunker](std::string_view line, size_t) {
    chunker.add_line(line);
  });
  chunker.finish();
  return chunks;
}

}  // namespace rag_core

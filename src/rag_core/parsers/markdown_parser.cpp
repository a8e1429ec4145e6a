#include "rag_core/parsers/markdown_parser.hpp"

#include "rag_core/routing/format_sniffer.hpp"
#include "rag_core/text/text_utils.hpp"

namespace rag_core {

namespace {

bool is_fence(std::string_view line) {
  std::string trimmed = text::trim(line);
  return trimmed.rfind("```", 0) == 0 || trimmed.rfind("~~~", 0) == 0;
}

}  // namespace

MarkdownParser::MarkdownParser(const nlohmann::json& config)
    : chunking_(ChunkingConfig::from_json(config, ChunkStrategy::HEADING)) {
  chunking_.validate();
}

std::vector<std::string> MarkdownParser::supported_formats() {
  return {formats::MARKDOWN, formats::TEXT};
}

std::vector<ParsedChunk> MarkdownParser::parse(const fs::path& file_path) const {
  std::vector<ParsedChunk> chunks;
  Chunker chunker(
      chunking_, [&chunks](ParsedChunk chunk) { chunks.push_back(std::move(chunk)); }, true);

  bool in_front_matter = false;
  bool in_code_fence = false;
  LineReader::for_each_line(file_path, [&](std::string_view line, size_t line_number) {
    if (line_number == 1 && text::trim(line) == "---") {
      in_front_matter = true;
      return;
    }
    if (in_front_matter) {
      if (text::trim(line) == "---") {
        in_front_matter = false;
      }
      return;
    }
    if (is_fence(line)) {
      in_code_fence = !in_code_fence;
    }
    chunker.add_line(line, !in_code_fence);
  });
  chunker.finish();
  return chunks;
}

}  // namespace rag_core

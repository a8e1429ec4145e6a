#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "rag_core/parsers/chunker.hpp"
#include "rag_core/parsers/parser.hpp"

namespace rag_core {

/**
 * Delimited tables with a header row. Each record is rendered as one
 * "column: value" line per field and whole records are packed into chunks of
 * at most chunk_size bytes; a record larger than that is split into fixed
 * windows. Chunks carry "row_start"/"row_end" (1-based data rows) and
 * "columns" metadata. Records do not overlap across chunks.
 *
 * Quoted fields may span lines; a quote left open at end of file is a ParseError.
 * Without a configured "delimiter", .tsv files split on tabs and everything
 * else on commas.
 */
class CSVParser : public Parser {
 public:
  static constexpr const char* TYPE = "CSVParser";

  explicit CSVParser(const nlohmann::json& config = nlohmann::json::object());

  std::string type() const override {
    return TYPE;
  }
  std::vector<ParsedChunk> parse(const fs::path& file_path) const override;

  static std::vector<std::string> supported_formats();

  // Splits one complete record. Throws ParseError on an unterminated quote.
  static std::vector<std::string> split_record(const std::string& record, char delimiter);

  // The delimiter parse() uses for `file_path`.
  char delimiter_for(const fs::path& file_path) const;

 private:
  static bool has_open_quote(const std::string& record);

  ChunkingConfig chunking_;
  std::optional<char> delimiter_;
};

}  // namespace rag_core

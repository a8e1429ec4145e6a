#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "rag_core/types/chunk.hpp"

namespace fs = std::filesystem;

namespace rag_core {

// Turns one file into an ordered sequence of chunks. Implementations are
// stateless after construction and may be shared across worker threads.
class Parser {
 public:
  virtual ~Parser() = default;

  virtual std::string type() const = 0;

  // Chunk order is document order; the caller assigns chunk indexes from it.
  virtual std::vector<ParsedChunk> parse(const fs::path& file_path) const = 0;
};

using ParserPtr = std::shared_ptr<Parser>;

// Reads a file line by line without loading it whole. Strips "\r" and a
// leading BOM; throws ParseError on unreadable files or invalid UTF-8.
class LineReader {
 public:
  using LineCallback = std::function<void(std::string_view line, size_t line_number)>;

  static void for_each_line(const fs::path& file_path, const LineCallback& callback);
};

}  // namespace rag_core

#pragma once

#include <string>
#include <vector>

#include "rag_core/parsers/parser.hpp"

namespace rag_core {

// Result of trying one parser of the chain.
struct ParseAttempt {
  std::string parser_type;
  bool succeeded = false;
  size_t chunk_count = 0;
  std::string error;
};

struct ParseOutcome {
  std::vector<ParsedChunk> chunks;
  std::string parser_type;  // the parser whose output was kept
  std::vector<ParseAttempt> attempts;
};

/**
 * Tries candidate parsers in order and keeps the first usable output. A parser
 * that throws, or yields no chunks for a non-empty file, hands over to the next
 * one. When every candidate fails, a ParseError carrying the last error is thrown.
 */
class ParserChain {
 public:
  explicit ParserChain(std::vector<ParserPtr> parsers);

  ParseOutcome parse(const fs::path& file_path) const;

  size_t size() const {
    return parsers_.size();
  }

 private:
  std::vector<ParserPtr> parsers_;
};

}  // namespace rag_core

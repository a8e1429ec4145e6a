#include "rag_core/parsers/parser_chain.hpp"

#include <iostream>
#include <system_error>

#include "rag_core/errors.hpp"

namespace rag_core {

ParserChain::ParserChain(std::vector<ParserPtr> parsers) : parsers_(std::move(parsers)) {}

ParseOutcome ParserChain::parse(const fs::path& file_path) const {
  if (parsers_.empty()) {
    throw FormatUnsupportedError("No parser available for " + file_path.filename().string());
  }

  std::error_code ec;
  const auto file_size = fs::file_size(file_path, ec);
  if (ec) {
    throw ParseError("Could not stat " + file_path.string() + ": " + ec.message());
  }
  const bool empty_file = file_size == 0;

  ParseOutcome outcome;
  std::string last_error;
  for (const auto& parser : parsers_) {
    ParseAttempt attempt;
    attempt.parser_type = parser->type();
    try {
      std::vector<ParsedChunk> chunks = parser->parse(file_path);
      attempt.chunk_count = chunks.size();
      if (!chunks.empty() || empty_file) {
        attempt.succeeded = true;
        outcome.attempts.push_back(attempt);
        outcome.chunks = std::move(chunks);
        outcome.parser_type = parser->type();
        return outcome;
      }
      attempt.error = "no chunks produced for non-empty file";
    } catch (const std::exception& e) {
      attempt.error = e.what();
    }

    std::cerr << "[ParserChain] " << attempt.parser_type << " failed on "
              << file_path.filename().string() << ": " << attempt.error << std::endl;
    last_error = attempt.parser_type + ": " + attempt.error;
    outcome.attempts.push_back(std::move(attempt));
  }

  throw ParseError("All " + std::to_string(parsers_.size()) + " parser(s) failed for " +
                   file_path.filename().string() + "; last error: " + last_error);
}

}  // namespace rag_core

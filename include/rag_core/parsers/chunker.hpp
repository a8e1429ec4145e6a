#pragma once

#include <cstddef>
#include <functional>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include "rag_core/types/chunk.hpp"

namespace rag_core {

enum class ChunkStrategy { PARAGRAPH, SENTENCE, HEADING, SEMANTIC, FIXED };

std::string to_string(ChunkStrategy strategy);
// Accepts "paragraph(s)", "sentence(s)", "heading"/"sections", "semantic", "fixed"/"characters".
ChunkStrategy chunk_strategy_from_string(const std::string& str);

struct ChunkingConfig {
  // Room for the longest UTF-8 sequence, so no chunk has to overshoot its size.
  static constexpr size_t MIN_CHUNK_SIZE = 4;

  ChunkStrategy strategy = ChunkStrategy::PARAGRAPH;
  size_t chunk_size = 1000;
  size_t chunk_overlap = 100;
  double semantic_threshold = 0.15;

  static ChunkingConfig from_json(const nlohmann::json& config,
                                  ChunkStrategy default_strategy = ChunkStrategy::PARAGRAPH);

  // Throws ConfigurationError; called at strategy resolution time.
  void validate() const;
};

using ChunkSink = std::function<void(ParsedChunk)>;

/**
 * Incremental chunker. Parsers feed it one line at a time and receive chunks
 * through the sink, so only the current paragraph and the chunk under
 * construction are held in memory.
 *
 * Every emitted chunk is at most chunk_size bytes. Consecutive chunks carry up
 * to chunk_overlap bytes of overlap, cut on UTF-8 code point boundaries, except
 * across heading breaks and semantic breaks.
 */
class Chunker {
 public:
  Chunker(ChunkingConfig config, ChunkSink sink, bool track_sections = false);

  // heading_allowed is false for lines that only look like headings (e.g. inside code fences).
  void add_line(std::string_view line, bool heading_allowed = true);
  void finish();

  void set_context(const std::string& key, nlohmann::json value);

  static std::vector<std::string> split_fixed(std::string_view text, size_t size, size_t overlap);
  static std::vector<std::string> split_sentences(std::string_view paragraph);
  static bool is_heading(std::string_view line);

 private:
  static constexpr size_t LARGE_PARAGRAPH_BYTES = 1024 * 1024;

  void flush_paragraph();
  void add_unit(const std::string& unit, const char* separator);
  void add_fixed_line(std::string_view line);
  void emit(std::string text);
  void emit_with_overlap();
  void hard_break();
  bool has_new_content() const {
    return current_.size() > carried_;
  }

  ChunkingConfig config_;
  ChunkSink sink_;
  bool track_sections_;
  nlohmann::json context_ = nlohmann::json::object();

  std::string paragraph_;
  std::string current_;
  // Leading bytes of current_ that were carried over as overlap.
  size_t carried_ = 0;
  std::unordered_set<std::string> current_terms_;
};

}  // namespace rag_core

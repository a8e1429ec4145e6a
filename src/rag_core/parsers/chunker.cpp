#include "rag_core/parsers/chunker.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>

#include "rag_core/errors.hpp"
#include "rag_core/text/text_utils.hpp"

namespace rag_core {

namespace {

bool is_continuation_byte(char c) {
  return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

// Largest code point boundary <= pos.
size_t floor_boundary(std::string_view text, size_t pos) {
  if (pos >= text.size()) {
    return text.size();
  }
  while (pos > 0 && is_continuation_byte(text[pos])) {
    --pos;
  }
  return pos;
}

// Smallest code point boundary >= pos.
size_t ceil_boundary(std::string_view text, size_t pos) {
  while (pos < text.size() && is_continuation_byte(text[pos])) {
    ++pos;
  }
  return pos;
}

std::string overlap_tail(std::string_view text, size_t overlap) {
  if (overlap == 0 || text.empty()) {
    return "";
  }
  size_t start = text.size() > overlap ? text.size() - overlap : 0;
  start = ceil_boundary(text, start);
  return std::string(text.substr(start));
}

size_t read_size(const nlohmann::json& config, const char* key, size_t fallback) {
  if (!config.contains(key)) {
    return fallback;
  }
  const auto& value = config.at(key);
  if (!value.is_number_integer()) {
    throw ConfigurationError(std::string(key) + " must be an integer");
  }
  int64_t raw = value.get<int64_t>();
  if (raw < 0) {
    throw ConfigurationError(std::string(key) + " must not be negative");
  }
  return static_cast<size_t>(raw);
}

}  // namespace

std::string to_string(ChunkStrategy strategy) {
  switch (strategy) {
    case ChunkStrategy::PARAGRAPH: return "paragraph";
    case ChunkStrategy::SENTENCE: return "sentence";
    case ChunkStrategy::HEADING: return "heading";
    case ChunkStrategy::SEMANTIC: return "semantic";
    case ChunkStrategy::FIXED: return "fixed";
  }
  return "unknown";
}

ChunkStrategy chunk_strategy_from_string(const std::string& str) {
  if (str == "paragraph" || str == "paragraphs") return ChunkStrategy::PARAGRAPH;
  if (str == "sentence" || str == "sentences") return ChunkStrategy::SENTENCE;
  if (str == "heading" || str == "sections") return ChunkStrategy::HEADING;
  if (str == "semantic") return ChunkStrategy::SEMANTIC;
  if (str == "fixed" || str == "characters") return ChunkStrategy::FIXED;
  throw ConfigurationError("Unknown chunk_strategy: " + str);
}

ChunkingConfig ChunkingConfig::from_json(const nlohmann::json& config,
                                         ChunkStrategy default_strategy) {
  ChunkingConfig chunking;
  chunking.strategy = default_strategy;
  try {
    if (config.contains("chunk_strategy")) {
      chunking.strategy = chunk_strategy_from_string(config.at("chunk_strategy").get<std::string>());
    }
    chunking.chunk_size = read_size(config, "chunk_size", chunking.chunk_size);
    chunking.chunk_overlap = read_size(config, "chunk_overlap", chunking.chunk_overlap);
    chunking.semantic_threshold = config.value("semantic_threshold", chunking.semantic_threshold);
  } catch (const nlohmann::json::exception& e) {
    throw ConfigurationError(std::string("Invalid chunking config: ") + e.what());
  }
  return chunking;
}

void ChunkingConfig::validate() const {
  if (chunk_size < MIN_CHUNK_SIZE) {
    throw ConfigurationError("chunk_size must be at least " + std::to_string(MIN_CHUNK_SIZE) +
                             ", got " + std::to_string(chunk_size));
  }
  if (chunk_overlap >= chunk_size) {
    throw ConfigurationError("chunk_overlap (" + std::to_string(chunk_overlap) +
                             ") must be strictly less than chunk_size (" +
                             std::to_string(chunk_size) + ")");
  }
  if (semantic_threshold < 0.0 || semantic_threshold > 1.0) {
    throw ConfigurationError("semantic_threshold must be within [0, 1]");
  }
}

Chunker::Chunker(ChunkingConfig config, ChunkSink sink, bool track_sections)
    : config_(std::move(config)), sink_(std::move(sink)), track_sections_(track_sections) {
  config_.validate();
}

void Chunker::set_context(const std::string& key, nlohmann::json value) {
  context_[key] = std::move(value);
}

bool Chunker::is_heading(std::string_view line) {
  size_t hashes = 0;
  while (hashes < line.size() && line[hashes] == '#') {
    ++hashes;
  }
  return hashes >= 1 && hashes <= 6 && hashes < line.size() && line[hashes] == ' ';
}

void Chunker::add_line(std::string_view line, bool heading_allowed) {
  const bool heading = heading_allowed && is_heading(line);
  if (config_.strategy == ChunkStrategy::FIXED) {
    if (track_sections_ && heading) {
      context_["section"] = text::trim(line.substr(line.find(' ')));
    }
    add_fixed_line(line);
    return;
  }

  if (heading) {
    flush_paragraph();
    if (config_.strategy == ChunkStrategy::HEADING) {
      hard_break();
    }
    if (track_sections_) {
      context_["section"] = text::trim(line.substr(line.find(' ')));
    }
    paragraph_.append(line);
    paragraph_.push_back('\n');
    return;
  }

  if (text::trim(line).empty()) {
    flush_paragraph();
    return;
  }

  paragraph_.append(line);
  paragraph_.push_back('\n');
  if (paragraph_.size() > LARGE_PARAGRAPH_BYTES) {
    flush_paragraph();
  }
}

void Chunker::finish() {
  flush_paragraph();
  if (has_new_content()) {
    emit(current_);
  }
  current_.clear();
  carried_ = 0;
  current_terms_.clear();
}

void Chunker::flush_paragraph() {
  if (paragraph_.empty()) {
    return;
  }
  std::string paragraph = std::move(paragraph_);
  paragraph_.clear();

  switch (config_.strategy) {
    case ChunkStrategy::PARAGRAPH:
    case ChunkStrategy::HEADING:
      add_unit(text::trim(paragraph), "\n\n");
      break;
    case ChunkStrategy::SENTENCE:
      for (const auto& sentence : split_sentences(paragraph)) {
        add_unit(sentence, " ");
      }
      break;
    case ChunkStrategy::SEMANTIC:
      for (const auto& sentence : split_sentences(paragraph)) {
        auto terms = text::term_set(sentence);
        // A topic shift only breaks a chunk that already has some body.
        if (has_new_content() && current_.size() >= config_.chunk_size / 4 && !terms.empty() &&
            text::term_overlap(terms, current_terms_) < config_.semantic_threshold) {
          hard_break();
        }
        add_unit(sentence, " ");
        current_terms_.insert(terms.begin(), terms.end());
      }
      break;
    case ChunkStrategy::FIXED:
      add_fixed_line(paragraph);
      break;
  }
}

void Chunker::add_unit(const std::string& unit, const char* separator) {
  if (unit.empty()) {
    return;
  }
  const std::string sep(separator);

  if (unit.size() > config_.chunk_size) {
    if (has_new_content()) {
      emit_with_overlap();
    }
    std::vector<std::string> pieces = split_fixed(unit, config_.chunk_size, config_.chunk_overlap);
    for (auto& piece : pieces) {
      emit(piece);
    }
    current_ = overlap_tail(pieces.back(), config_.chunk_overlap);
    carried_ = current_.size();
    return;
  }

  auto needed = [&]() {
    return current_.empty() ? unit.size() : current_.size() + sep.size() + unit.size();
  };
  if (needed() > config_.chunk_size && has_new_content()) {
    emit_with_overlap();
  }
  if (needed() > config_.chunk_size) {
    current_.clear();
    carried_ = 0;
  }
  if (!current_.empty()) {
    current_ += sep;
  }
  current_ += unit;
}

void Chunker::add_fixed_line(std::string_view line) {
  current_.append(line);
  current_.push_back('\n');
  while (current_.size() > config_.chunk_size) {
    size_t cut = floor_boundary(current_, config_.chunk_size);
    if (cut == 0) {
      cut = ceil_boundary(current_, 1);
    }
    std::string piece = current_.substr(0, cut);
    size_t keep_from = config_.chunk_overlap == 0
                           ? cut
                           : ceil_boundary(current_, cut > config_.chunk_overlap
                                                         ? cut - config_.chunk_overlap
                                                         : cut);
    if (keep_from == 0) {
      keep_from = cut;
    }
    emit(std::move(piece));
    current_.erase(0, keep_from);
    carried_ = cut - keep_from;
  }
}

void Chunker::emit(std::string text) {
  if (text::trim(text).empty()) {
    return;
  }
  sink_(ParsedChunk{std::move(text), context_});
}

void Chunker::emit_with_overlap() {
  emit(current_);
  current_ = overlap_tail(current_, config_.chunk_overlap);
  carried_ = current_.size();
  current_terms_.clear();
}

void Chunker::hard_break() {
  if (has_new_content()) {
    emit(current_);
  }
  current_.clear();
  carried_ = 0;
  current_terms_.clear();
}

std::vector<std::string> Chunker::split_fixed(std::string_view text, size_t size, size_t overlap) {
  std::vector<std::string> out;
  if (text.empty() || size == 0) {
    return out;
  }

  size_t start = 0;
  while (start < text.size()) {
    size_t end = floor_boundary(text, std::min(start + size, text.size()));
    if (end <= start) {
      end = ceil_boundary(text, start + 1);
    }
    out.emplace_back(text.substr(start, end - start));
    if (end >= text.size()) {
      break;
    }
    size_t next = end > overlap ? ceil_boundary(text, end - overlap) : end;
    start = next > start ? next : end;
  }
  return out;
}

std::vector<std::string> Chunker::split_sentences(std::string_view paragraph) {
  std::vector<std::string> sentences;
  size_t begin = 0;
  for (size_t i = 0; i < paragraph.size(); ++i) {
    char c = paragraph[i];
    if (c != '.' && c != '!' && c != '?') {
      continue;
    }
    bool at_end = i + 1 == paragraph.size();
    if (at_end || std::isspace(static_cast<unsigned char>(paragraph[i + 1]))) {
      std::string sentence = text::trim(paragraph.substr(begin, i + 1 - begin));
      if (!sentence.empty()) {
        sentences.push_back(std::move(sentence));
      }
      begin = i + 1;
    }
  }
  std::string rest = text::trim(paragraph.substr(begin));
  if (!rest.empty()) {
    sentences.push_back(std::move(rest));
  }
  return sentences;
}

}  // namespace rag_core

#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "rag_core/extractors/extractor.hpp"

namespace rag_core {

// word_count, character_count (code points), sentence_count,
// reading_time_minutes, avg_sentence_length.
class StatisticsExtractor : public Extractor {
 public:
  static constexpr const char* TYPE = "StatisticsExtractor";

  explicit StatisticsExtractor(const nlohmann::json& config = nlohmann::json::object());

  std::string type() const override {
    return TYPE;
  }
  nlohmann::json extract(const std::string& text, const nlohmann::json& metadata) const override;

 private:
  double words_per_minute_ = 200.0;
};

// "headings": [{"level": n, "text": "..."}] for markdown headings in the chunk.
class HeadingExtractor : public Extractor {
 public:
  static constexpr const char* TYPE = "HeadingExtractor";

  explicit HeadingExtractor(const nlohmann::json& config = nlohmann::json::object());

  std::string type() const override {
    return TYPE;
  }
  nlohmann::json extract(const std::string& text, const nlohmann::json& metadata) const override;
};

// "keywords": most frequent non-stopword terms, ties broken alphabetically.
class KeywordExtractor : public Extractor {
 public:
  static constexpr const char* TYPE = "KeywordExtractor";

  explicit KeywordExtractor(const nlohmann::json& config = nlohmann::json::object());

  std::string type() const override {
    return TYPE;
  }
  nlohmann::json extract(const std::string& text, const nlohmann::json& metadata) const override;

 private:
  size_t max_keywords_ = 5;
  size_t min_term_length_ = 3;
};

// "emails", "urls" and "dates" found by pattern; entity_types selects a subset.
class EntityExtractor : public Extractor {
 public:
  static constexpr const char* TYPE = "EntityExtractor";

  explicit EntityExtractor(const nlohmann::json& config = nlohmann::json::object());

  std::string type() const override {
    return TYPE;
  }
  nlohmann::json extract(const std::string& text, const nlohmann::json& metadata) const override;

 private:
  std::vector<std::string> entity_types_;
};

}  // namespace rag_core

#include "rag_core/extractors/builtin_extractors.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <map>
#include <regex>
#include <sstream>
#include <utf8.h>

#include "rag_core/errors.hpp"
#include "rag_core/parsers/chunker.hpp"
#include "rag_core/text/text_utils.hpp"

namespace rag_core {

namespace {

double round_to(double value, int decimals) {
  const double factor = std::pow(10.0, decimals);
  return std::round(value * factor) / factor;
}

// Unique matches in order of first appearance.
std::vector<std::string> find_all(const std::string& text, const std::regex& pattern) {
  std::vector<std::string> found;
  for (auto it = std::sregex_iterator(text.begin(), text.end(), pattern); it != std::sregex_iterator();
       ++it) {
    std::string match = it->str();
    if (std::find(found.begin(), found.end(), match) == found.end()) {
      found.push_back(std::move(match));
    }
  }
  return found;
}

}  // namespace

StatisticsExtractor::StatisticsExtractor(const nlohmann::json& config) {
  words_per_minute_ = config.value("words_per_minute", words_per_minute_);
  if (words_per_minute_ <= 0) {
    throw ConfigurationError("StatisticsExtractor words_per_minute must be positive");
  }
}

nlohmann::json StatisticsExtractor::extract(const std::string& text, const nlohmann::json&) const {
  if (!utf8::is_valid(text.begin(), text.end())) {
    throw ExtractionError("chunk text is not valid UTF-8");
  }

  std::istringstream words_stream(text);
  std::string word;
  size_t word_count = 0;
  while (words_stream >> word) {
    ++word_count;
  }
  const size_t sentence_count = Chunker::split_sentences(text).size();
  const auto character_count = utf8::distance(text.begin(), text.end());

  return {
      {"word_count", word_count},
      {"character_count", character_count},
      {"sentence_count", sentence_count},
      {"reading_time_minutes", round_to(word_count / words_per_minute_, 2)},
      {"avg_sentence_length",
       sentence_count == 0 ? 0.0 : round_to(static_cast<double>(word_count) / sentence_count, 2)},
  };
}

HeadingExtractor::HeadingExtractor(const nlohmann::json&) {}

nlohmann::json HeadingExtractor::extract(const std::string& text, const nlohmann::json&) const {
  nlohmann::json headings = nlohmann::json::array();
  std::istringstream lines(text);
  std::string line;
  while (std::getline(lines, line)) {
    if (!Chunker::is_heading(line)) {
      continue;
    }
    const size_t level = line.find(' ');
    headings.push_back({{"level", level}, {"text", text::trim(std::string_view(line).substr(level))}});
  }
  return {{"headings", headings}};
}

KeywordExtractor::KeywordExtractor(const nlohmann::json& config) {
  const int max_keywords = config.value("max_keywords", static_cast<int>(max_keywords_));
  if (max_keywords <= 0) {
    throw ConfigurationError("KeywordExtractor max_keywords must be greater than 0");
  }
  max_keywords_ = static_cast<size_t>(max_keywords);
  const int min_length = config.value("min_term_length", static_cast<int>(min_term_length_));
  min_term_length_ = min_length > 0 ? static_cast<size_t>(min_length) : 1;
}

nlohmann::json KeywordExtractor::extract(const std::string& text, const nlohmann::json&) const {
  std::map<std::string, int> frequencies;
  const auto& stop = text::stop_words();
  for (const auto& token : text::tokenize(text)) {
    if (token.size() < min_term_length_ || stop.count(token) > 0) {
      continue;
    }
    if (std::all_of(token.begin(), token.end(), [](unsigned char c) { return std::isdigit(c); })) {
      continue;
    }
    ++frequencies[token];
  }

  std::vector<std::pair<std::string, int>> ranked(frequencies.begin(), frequencies.end());
  // std::map iteration is alphabetical, so a stable sort keeps ties in that order.
  std::stable_sort(ranked.begin(), ranked.end(),
                   [](const auto& a, const auto& b) { return a.second > b.second; });

  nlohmann::json keywords = nlohmann::json::array();
  for (size_t i = 0; i < ranked.size() && i < max_keywords_; ++i) {
    keywords.push_back(ranked[i].first);
  }
  return {{"keywords", keywords}};
}

EntityExtractor::EntityExtractor(const nlohmann::json& config) {
  entity_types_ = config.value("entity_types", std::vector<std::string>{"emails", "urls", "dates"});
  for (const auto& entity_type : entity_types_) {
    if (entity_type != "emails" && entity_type != "urls" && entity_type != "dates") {
      throw ConfigurationError("EntityExtractor does not know entity type '" + entity_type + "'");
    }
  }
}

nlohmann::json EntityExtractor::extract(const std::string& text, const nlohmann::json&) const {
  static const std::regex email_regex(R"([A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\.[A-Za-z]{2,})");
  static const std::regex url_regex(R"(https?://[^\s<>"'()\]]+)");
  static const std::regex date_regex(
      R"(\b(\d{4}-\d{2}-\d{2}|\d{1,2}/\d{1,2}/\d{4})\b)");

  nlohmann::json entities = nlohmann::json::object();
  for (const auto& entity_type : entity_types_) {
    if (entity_type == "emails") {
      entities["emails"] = find_all(text, email_regex);
    } else if (entity_type == "urls") {
      entities["urls"] = find_all(text, url_regex);
    } else {
      entities["dates"] = find_all(text, date_regex);
    }
  }
  return entities;
}

}  // namespace rag_core

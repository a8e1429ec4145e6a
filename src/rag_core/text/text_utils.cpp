#include "rag_core/text/text_utils.hpp"

#include <cctype>

namespace rag_core::text {

namespace {

bool is_word_byte(unsigned char c) {
  return std::isalnum(c) || c >= 0x80;
}

}  // namespace

std::string to_lower(std::string_view text) {
  std::string out(text);
  for (char& c : out) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return out;
}

std::vector<std::string> tokenize(std::string_view text) {
  std::vector<std::string> tokens;
  std::string current;
  for (char c : text) {
    unsigned char uc = static_cast<unsigned char>(c);
    if (is_word_byte(uc)) {
      current.push_back(static_cast<char>(std::tolower(uc)));
    } else if (!current.empty()) {
      tokens.push_back(std::move(current));
      current.clear();
    }
  }
  if (!current.empty()) {
    tokens.push_back(std::move(current));
  }
  return tokens;
}

const std::unordered_set<std::string>& stop_words() {
  static const std::unordered_set<std::string> words = {
      "a",      "an",     "the",    "and",     "or",      "but",   "in",    "on",
      "at",     "to",     "for",    "of",      "with",    "by",    "from",  "up",
      "about",  "into",   "through", "during", "before",  "after", "above", "below",
      "between", "among", "this",   "that",    "these",   "those", "is",    "are",
      "was",    "were",   "be",     "been",    "have",    "has",   "had",   "will",
      "would",  "could",  "should", "may",     "might",   "it",    "its",   "as",
      "not",    "no",     "do",     "does",    "did",     "so",    "if",    "than",
      "then",   "there",  "their",  "they",    "we",      "you",   "he",    "she",
      "i",      "me",     "my",     "our",     "your",    "his",   "her",   "them",
      "what",   "which",  "who",    "when",    "where",   "how",   "can",   "also"};
  return words;
}

std::unordered_set<std::string> term_set(std::string_view text, bool drop_stop_words) {
  std::unordered_set<std::string> terms;
  const auto& stops = stop_words();
  for (auto& token : tokenize(text)) {
    if (drop_stop_words && stops.count(token) > 0) {
      continue;
    }
    terms.insert(std::move(token));
  }
  return terms;
}

double jaccard_similarity(const std::unordered_set<std::string>& a,
                          const std::unordered_set<std::string>& b) {
  if (a.empty() && b.empty()) {
    return 1.0;
  }
  size_t shared = 0;
  for (const auto& term : a) {
    if (b.count(term) > 0) {
      ++shared;
    }
  }
  size_t total = a.size() + b.size() - shared;
  return total == 0 ? 0.0 : static_cast<double>(shared) / static_cast<double>(total);
}

double term_overlap(const std::unordered_set<std::string>& query_terms,
                    const std::unordered_set<std::string>& passage_terms) {
  if (query_terms.empty()) {
    return 0.0;
  }
  size_t matched = 0;
  for (const auto& term : query_terms) {
    if (passage_terms.count(term) > 0) {
      ++matched;
    }
  }
  return static_cast<double>(matched) / static_cast<double>(query_terms.size());
}

std::string trim(std::string_view text) {
  size_t begin = 0;
  size_t end = text.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) {
    ++begin;
  }
  while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
    --end;
  }
  return std::string(text.substr(begin, end - begin));
}

}  // namespace rag_core::text

#include "rag_core/retrieval/relevance_scorer.hpp"

#include <algorithm>
#include <iostream>
#include <regex>
#include <unordered_set>

#include "ollama.hpp"
#include "rag_core/embedders/ollama_embedder.hpp"
#include "rag_core/errors.hpp"
#include "rag_core/text/text_utils.hpp"

namespace rag_core {

namespace {

std::unordered_set<std::string> bigrams(const std::vector<std::string>& tokens) {
  std::unordered_set<std::string> out;
  for (size_t i = 0; i + 1 < tokens.size(); ++i) {
    out.insert(tokens[i] + ' ' + tokens[i + 1]);
  }
  return out;
}

}  // namespace

double LexicalRelevanceScorer::score_pair(const std::string& query,
                                          const std::string& passage) const {
  const auto query_terms = text::term_set(query);
  if (query_terms.empty()) {
    return 0.0;
  }
  const auto passage_terms = text::term_set(passage);
  const double coverage = text::term_overlap(query_terms, passage_terms);

  const auto query_tokens = text::tokenize(query);
  const auto query_bigrams = bigrams(query_tokens);
  double bigram_coverage = 0.0;
  if (!query_bigrams.empty()) {
    const auto passage_bigrams = bigrams(text::tokenize(passage));
    size_t found = 0;
    for (const auto& bigram : query_bigrams) {
      found += passage_bigrams.count(bigram);
    }
    bigram_coverage = static_cast<double>(found) / query_bigrams.size();
  }

  const std::string lowered_passage = text::to_lower(passage);
  const std::string lowered_query = text::to_lower(text::trim(query));
  const double phrase_bonus =
      !lowered_query.empty() && lowered_passage.find(lowered_query) != std::string::npos ? 1.0 : 0.0;

  return 0.6 * coverage + 0.3 * bigram_coverage + 0.1 * phrase_bonus;
}

std::vector<double> LexicalRelevanceScorer::score(const std::string& query,
                                                  const std::vector<std::string>& passages) const {
  std::vector<double> scores;
  scores.reserve(passages.size());
  for (const auto& passage : passages) {
    scores.push_back(score_pair(query, passage));
  }
  return scores;
}

OllamaRelevanceScorer::OllamaRelevanceScorer(const nlohmann::json& config)
    : base_url_(config.value("base_url", std::string("http://localhost:11434"))),
      model_(config.value("model", std::string(""))) {
  if (model_.empty()) {
    throw ConfigurationError("The ollama reranker scorer requires a 'model'");
  }
  const int max_chars = config.value("max_passage_chars", static_cast<int>(max_passage_chars_));
  if (max_chars <= 0) {
    throw ConfigurationError("max_passage_chars must be greater than 0");
  }
  max_passage_chars_ = static_cast<size_t>(max_chars);
}

double OllamaRelevanceScorer::parse_rating(const std::string& answer) {
  static const std::regex number_regex(R"((\d+(?:\.\d+)?))");
  std::smatch match;
  if (!std::regex_search(answer, match, number_regex)) {
    return 0.0;
  }
  return std::clamp(std::stod(match[1].str()), 0.0, 10.0);
}

std::vector<double> OllamaRelevanceScorer::score(const std::string& query,
                                                 const std::vector<std::string>& passages) const {
  std::vector<double> scores;
  scores.reserve(passages.size());
  for (const auto& passage : passages) {
    const std::string prompt =
        "Rate how relevant the passage is to the query on a scale from 0 (irrelevant) to 10 "
        "(answers it fully). Reply with the number only.\n\nQuery: " +
        query + "\n\nPassage: " + passage.substr(0, max_passage_chars_) + "\n\nRating:";
    std::string answer;
    try {
      std::lock_guard<std::mutex> lock(ollama_call_mutex());
      ollama::setServerURL(base_url_);
      answer = ollama::generate(model_, prompt).as_simple_string();
    } catch (const ollama::exception& e) {
      throw BackendUnavailableError("Reranker model " + model_ + " at " + base_url_ +
                                    " failed: " + e.what());
    }
    scores.push_back(parse_rating(answer));
  }
  return scores;
}

}  // namespace rag_core

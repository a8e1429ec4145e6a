#pragma once

#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace rag_core {

// Pairwise (query, passage) relevance, higher is better. Scores of one call
// are comparable with each other only.
class RelevanceScorer {
 public:
  virtual ~RelevanceScorer() = default;

  virtual std::string name() const = 0;

  virtual std::vector<double> score(const std::string& query,
                                    const std::vector<std::string>& passages) const = 0;
};

using RelevanceScorerPtr = std::shared_ptr<RelevanceScorer>;

// Reads the query and passage jointly: term coverage, ordered bigram coverage
// and an exact phrase bonus.
class LexicalRelevanceScorer : public RelevanceScorer {
 public:
  std::string name() const override {
    return "lexical";
  }
  std::vector<double> score(const std::string& query,
                            const std::vector<std::string>& passages) const override;

  double score_pair(const std::string& query, const std::string& passage) const;
};

// Asks an Ollama model to rate each passage from 0 to 10.
class OllamaRelevanceScorer : public RelevanceScorer {
 public:
  explicit OllamaRelevanceScorer(const nlohmann::json& config);

  std::string name() const override {
    return "ollama";
  }
  std::vector<double> score(const std::string& query,
                            const std::vector<std::string>& passages) const override;

  // First number in the model's answer, clamped to [0, 10]; 0 when there is none.
  static double parse_rating(const std::string& answer);

 private:
  std::string base_url_;
  std::string model_;
  size_t max_passage_chars_ = 2000;
};

}  // namespace rag_core

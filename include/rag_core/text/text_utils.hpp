#pragma once

#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace rag_core::text {

std::string to_lower(std::string_view text);

// Lowercased word tokens. Bytes >= 0x80 are treated as word characters so UTF-8
// words stay whole.
std::vector<std::string> tokenize(std::string_view text);

const std::unordered_set<std::string>& stop_words();

std::unordered_set<std::string> term_set(std::string_view text, bool drop_stop_words = true);

double jaccard_similarity(const std::unordered_set<std::string>& a,
                          const std::unordered_set<std::string>& b);

// Fraction of the distinct query terms that appear in the passage, in [0, 1].
double term_overlap(const std::unordered_set<std::string>& query_terms,
                    const std::unordered_set<std::string>& passage_terms);

std::string trim(std::string_view text);

}  // namespace rag_core::text

#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace rag_core {

enum class FilterOp { EQ, NE, IN, GT, GTE, LT, LTE };

std::string to_string(FilterOp op);
FilterOp filter_op_from_string(const std::string& str);

struct FilterCondition {
  std::string field;
  FilterOp op = FilterOp::EQ;
  nlohmann::json value;
};

/**
 * Conjunction of predicates over chunk metadata.
 *
 * JSON forms accepted by from_json:
 *   {"format": "csv"}                       equality
 *   {"chunk_index": {"gte": 2, "lt": 5}}    range
 *   {"format": {"in": ["csv", "markdown"]}} membership
 *   [{"field": "f", "op": "ne", "value": 1}] explicit list
 * Dotted field names address nested objects ("author.name").
 * A metadata value that is an array matches eq/in when any element matches.
 */
class MetadataFilter {
 public:
  MetadataFilter() = default;
  explicit MetadataFilter(std::vector<FilterCondition> conditions);

  // Throws std::invalid_argument on malformed filters.
  static MetadataFilter from_json(const nlohmann::json& filter);

  bool matches(const nlohmann::json& metadata) const;

  bool empty() const {
    return conditions_.empty();
  }
  const std::vector<FilterCondition>& conditions() const {
    return conditions_;
  }

  // Conditions of both filters must hold.
  MetadataFilter combined_with(const MetadataFilter& other) const;

  nlohmann::json to_json() const;

 private:
  static bool condition_holds(const FilterCondition& condition, const nlohmann::json& metadata);
  static bool compare(const nlohmann::json& actual, FilterOp op, const nlohmann::json& expected);

  std::vector<FilterCondition> conditions_;
};

}  // namespace rag_core

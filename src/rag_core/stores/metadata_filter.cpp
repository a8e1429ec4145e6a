#include "rag_core/stores/metadata_filter.hpp"

#include <stdexcept>

namespace rag_core {

namespace {

const nlohmann::json* lookup(const nlohmann::json& metadata, const std::string& field) {
  if (metadata.contains(field)) {
    return &metadata.at(field);
  }
  const nlohmann::json* current = &metadata;
  size_t start = 0;
  while (start <= field.size()) {
    size_t dot = field.find('.', start);
    std::string part = field.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
    if (!current->is_object() || !current->contains(part)) {
      return nullptr;
    }
    current = &current->at(part);
    if (dot == std::string::npos) {
      return current;
    }
    start = dot + 1;
  }
  return nullptr;
}

bool is_operator_object(const nlohmann::json& value) {
  if (!value.is_object() || value.empty()) {
    return false;
  }
  for (const auto& [key, _] : value.items()) {
    if (key != "eq" && key != "ne" && key != "in" && key != "gt" && key != "gte" && key != "lt" &&
        key != "lte") {
      return false;
    }
  }
  return true;
}

}  // namespace

std::string to_string(FilterOp op) {
  switch (op) {
    case FilterOp::EQ: return "eq";
    case FilterOp::NE: return "ne";
    case FilterOp::IN: return "in";
    case FilterOp::GT: return "gt";
    case FilterOp::GTE: return "gte";
    case FilterOp::LT: return "lt";
    case FilterOp::LTE: return "lte";
  }
  return "eq";
}

FilterOp filter_op_from_string(const std::string& str) {
  if (str == "eq") return FilterOp::EQ;
  if (str == "ne") return FilterOp::NE;
  if (str == "in") return FilterOp::IN;
  if (str == "gt") return FilterOp::GT;
  if (str == "gte") return FilterOp::GTE;
  if (str == "lt") return FilterOp::LT;
  if (str == "lte") return FilterOp::LTE;
  throw std::invalid_argument("Unknown filter operator: " + str);
}

MetadataFilter::MetadataFilter(std::vector<FilterCondition> conditions)
    : conditions_(std::move(conditions)) {
  for (const auto& condition : conditions_) {
    if (condition.op == FilterOp::IN && !condition.value.is_array()) {
      throw std::invalid_argument("Filter 'in' on '" + condition.field + "' needs an array value");
    }
  }
}

MetadataFilter MetadataFilter::from_json(const nlohmann::json& filter) {
  std::vector<FilterCondition> conditions;
  if (filter.is_null()) {
    return MetadataFilter();
  }

  if (filter.is_array()) {
    for (const auto& entry : filter) {
      if (!entry.is_object() || !entry.contains("field") || !entry.contains("value") ||
          !entry.at("field").is_string() || (entry.contains("op") && !entry.at("op").is_string())) {
        throw std::invalid_argument("Filter conditions need a string 'field' and a 'value'");
      }
      conditions.push_back({entry.at("field").get<std::string>(),
                            filter_op_from_string(entry.value("op", std::string("eq"))),
                            entry.at("value")});
    }
    return MetadataFilter(std::move(conditions));
  }

  if (!filter.is_object()) {
    throw std::invalid_argument("Filters must be a JSON object or array");
  }
  for (const auto& [field, value] : filter.items()) {
    if (is_operator_object(value)) {
      for (const auto& [op, operand] : value.items()) {
        conditions.push_back({field, filter_op_from_string(op), operand});
      }
    } else {
      conditions.push_back({field, FilterOp::EQ, value});
    }
  }
  return MetadataFilter(std::move(conditions));
}

bool MetadataFilter::compare(const nlohmann::json& actual, FilterOp op,
                             const nlohmann::json& expected) {
  switch (op) {
    case FilterOp::EQ:
      return actual == expected;
    case FilterOp::NE:
      return actual != expected;
    case FilterOp::IN:
      for (const auto& candidate : expected) {
        if (actual == candidate) {
          return true;
        }
      }
      return false;
    default:
      break;
  }

  // Ranges compare numbers with numbers and strings with strings only.
  if (actual.is_number() && expected.is_number()) {
    const double a = actual.get<double>();
    const double b = expected.get<double>();
    switch (op) {
      case FilterOp::GT: return a > b;
      case FilterOp::GTE: return a >= b;
      case FilterOp::LT: return a < b;
      case FilterOp::LTE: return a <= b;
      default: return false;
    }
  }
  if (actual.is_string() && expected.is_string()) {
    const auto& a = actual.get_ref<const std::string&>();
    const auto& b = expected.get_ref<const std::string&>();
    switch (op) {
      case FilterOp::GT: return a > b;
      case FilterOp::GTE: return a >= b;
      case FilterOp::LT: return a < b;
      case FilterOp::LTE: return a <= b;
      default: return false;
    }
  }
  return false;
}

bool MetadataFilter::condition_holds(const FilterCondition& condition,
                                     const nlohmann::json& metadata) {
  const nlohmann::json* actual = lookup(metadata, condition.field);
  if (actual == nullptr) {
    return condition.op == FilterOp::NE;
  }
  if (actual->is_array() && (condition.op == FilterOp::EQ || condition.op == FilterOp::IN)) {
    for (const auto& element : *actual) {
      if (compare(element, condition.op, condition.value)) {
        return true;
      }
    }
    return compare(*actual, condition.op, condition.value);
  }
  return compare(*actual, condition.op, condition.value);
}

bool MetadataFilter::matches(const nlohmann::json& metadata) const {
  for (const auto& condition : conditions_) {
    if (!condition_holds(condition, metadata)) {
      return false;
    }
  }
  return true;
}

MetadataFilter MetadataFilter::combined_with(const MetadataFilter& other) const {
  std::vector<FilterCondition> merged = conditions_;
  merged.insert(merged.end(), other.conditions_.begin(), other.conditions_.end());
  return MetadataFilter(std::move(merged));
}

nlohmann::json MetadataFilter::to_json() const {
  nlohmann::json out = nlohmann::json::array();
  for (const auto& condition : conditions_) {
    out.push_back({{"field", condition.field}, {"op", to_string(condition.op)}, {"value", condition.value}});
  }
  return out;
}

}  // namespace rag_core

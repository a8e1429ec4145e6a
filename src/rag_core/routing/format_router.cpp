#include "rag_core/routing/format_router.hpp"

#include <fnmatch.h>

#include <algorithm>

#include "rag_core/routing/format_sniffer.hpp"
#include "rag_core/text/text_utils.hpp"

namespace rag_core {

bool matches_any_pattern(const std::string& path, const std::vector<std::string>& patterns) {
  const std::string lowered_path = text::to_lower(path);
  const std::string base_name =
      text::to_lower(std::filesystem::path(path).filename().string());
  for (const auto& pattern : patterns) {
    const std::string lowered_pattern = text::to_lower(pattern);
    if (fnmatch(lowered_pattern.c_str(), lowered_path.c_str(), 0) == 0 ||
        fnmatch(lowered_pattern.c_str(), base_name.c_str(), 0) == 0) {
      return true;
    }
  }
  return false;
}

FormatRouter::FormatRouter(const ProcessingStrategyConfig& strategy, FormatTable parser_formats)
    : directory_rules_(strategy.directory_rules),
      parsers_(strategy.parsers),
      parser_formats_(std::move(parser_formats)) {}

RouteDecision FormatRouter::route(const std::string& relative_path, std::string_view head) const {
  RouteDecision decision;
  decision.format = FormatSniffer::detect(relative_path, head);

  for (const auto& rule : directory_rules_) {
    if (!matches_any_pattern(relative_path, {rule.pattern})) {
      continue;
    }
    decision.matched_by = "directory";
    for (const auto& type : rule.parsers) {
      for (const auto& parser : parsers_) {
        if (parser.type != type || is_excluded(parser, relative_path)) {
          continue;
        }
        bool claimed = matches_any_pattern(relative_path, parser.file_include_patterns);
        if (claimed || reads_format(parser, decision.format)) {
          decision.parsers.push_back(parser);
        }
      }
    }
    return decision;
  }

  for (const auto& parser : parsers_) {
    if (!parser.file_include_patterns.empty() &&
        matches_any_pattern(relative_path, parser.file_include_patterns) &&
        !is_excluded(parser, relative_path)) {
      decision.parsers.push_back(parser);
    }
  }
  if (!decision.parsers.empty()) {
    decision.matched_by = "extension";
    sort_by_priority(decision.parsers);
    return decision;
  }

  for (const auto& parser : parsers_) {
    if (!is_excluded(parser, relative_path) && reads_format(parser, decision.format)) {
      decision.parsers.push_back(parser);
    }
  }
  decision.matched_by = "content";
  sort_by_priority(decision.parsers);
  return decision;
}

RouteDecision FormatRouter::route_file(const std::string& relative_path,
                                       const std::filesystem::path& stored_path) const {
  return route(relative_path, FormatSniffer::read_head(stored_path));
}

bool FormatRouter::is_excluded(const ComponentConfig& parser, const std::string& path) const {
  return matches_any_pattern(path, parser.file_exclude_patterns);
}

bool FormatRouter::reads_format(const ComponentConfig& parser, const std::string& format) const {
  auto it = parser_formats_.find(parser.type);
  if (it == parser_formats_.end()) {
    return false;
  }
  return std::find(it->second.begin(), it->second.end(), format) != it->second.end();
}

void FormatRouter::sort_by_priority(std::vector<ComponentConfig>& parsers) {
  std::stable_sort(parsers.begin(), parsers.end(),
                   [](const ComponentConfig& a, const ComponentConfig& b) {
                     return a.priority > b.priority;
                   });
}

}  // namespace rag_core

#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "rag_core/config/rag_config.hpp"

namespace rag_core {

struct RouteDecision {
  std::string format;
  // Primary parser first, then fallbacks in the order they should be tried.
  std::vector<ComponentConfig> parsers;
  std::string matched_by;  // "directory", "extension" or "content"

  bool supported() const {
    return !parsers.empty();
  }
};

// Case-insensitive glob match (fnmatch, '*' also crosses '/').
bool matches_any_pattern(const std::string& path, const std::vector<std::string>& patterns);

/**
 * Selects the candidate parsers of one processing strategy for a file.
 *
 * Order of decisions:
 *  1. the first directory rule whose pattern matches the dataset-relative path
 *     restricts candidates to its parser types, in the rule's order;
 *  2. parsers whose file_include_patterns match (and no exclude pattern does),
 *     highest priority first;
 *  3. otherwise the content is sniffed and parsers whose type reads that format
 *     tag are used, highest priority first.
 * An empty candidate list means the file is unsupported.
 */
class FormatRouter {
 public:
  using FormatTable = std::unordered_map<std::string, std::vector<std::string>>;

  // parser_formats maps a parser type name to the format tags it can read.
  FormatRouter(const ProcessingStrategyConfig& strategy, FormatTable parser_formats);

  RouteDecision route(const std::string& relative_path, std::string_view head) const;

  RouteDecision route_file(const std::string& relative_path,
                           const std::filesystem::path& stored_path) const;

 private:
  bool is_excluded(const ComponentConfig& parser, const std::string& path) const;
  bool reads_format(const ComponentConfig& parser, const std::string& format) const;
  static void sort_by_priority(std::vector<ComponentConfig>& parsers);

  std::vector<DirectoryRule> directory_rules_;
  std::vector<ComponentConfig> parsers_;
  FormatTable parser_formats_;
};

}  // namespace rag_core

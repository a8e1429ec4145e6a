#include "rag_core/routing/format_sniffer.hpp"

#include <utf8.h>

#include <algorithm>
#include <fstream>
#include <regex>
#include <sstream>
#include <unordered_map>
#include <vector>

#include "rag_core/errors.hpp"
#include "rag_core/text/text_utils.hpp"

namespace rag_core {

std::string FormatSniffer::format_from_extension(const std::filesystem::path& file_path) {
  static const std::unordered_map<std::string, std::string> extension_formats = {
      {".txt", formats::TEXT},     {".text", formats::TEXT},    {".log", formats::TEXT},
      {".md", formats::MARKDOWN},  {".markdown", formats::MARKDOWN},
      {".csv", formats::CSV},      {".tsv", formats::CSV},      {".json", formats::JSON},
      {".jsonl", formats::JSON},   {".html", formats::HTML},    {".htm", formats::HTML},
      {".pdf", formats::PDF},      {".zip", formats::ZIP},      {".docx", formats::ZIP},
      {".xlsx", formats::ZIP},     {".pptx", formats::ZIP}};

  std::string extension = text::to_lower(file_path.extension().string());
  auto it = extension_formats.find(extension);
  return it == extension_formats.end() ? std::string() : it->second;
}

std::string FormatSniffer::sniff(std::string_view head) {
  if (head.rfind("%PDF", 0) == 0) {
    return formats::PDF;
  }
  if (head.size() >= 4 && head.substr(0, 4) == std::string_view("PK\x03\x04", 4)) {
    return formats::ZIP;
  }
  if (head.find('\0') != std::string_view::npos) {
    return formats::BINARY;
  }

  // A sniff window can cut the last code point in half; only an error before
  // the final three bytes means the content is not UTF-8.
  auto invalid = utf8::find_invalid(head.begin(), head.end());
  if (invalid != head.end() && std::distance(invalid, head.end()) > 3) {
    return formats::BINARY;
  }

  std::string trimmed = text::trim(head.substr(0, 512));
  if (!trimmed.empty() && (trimmed.front() == '{' || trimmed.front() == '[')) {
    return formats::JSON;
  }
  std::string lowered = text::to_lower(trimmed);
  if (lowered.rfind("<!doctype html", 0) == 0 || lowered.rfind("<html", 0) == 0) {
    return formats::HTML;
  }
  if (looks_like_markdown(head)) {
    return formats::MARKDOWN;
  }
  if (looks_like_csv(head)) {
    return formats::CSV;
  }
  return formats::TEXT;
}

std::string FormatSniffer::read_head(const std::filesystem::path& file_path) {
  std::ifstream file_stream(file_path, std::ios::binary);
  if (!file_stream.is_open()) {
    throw RagError("Could not open file: " + file_path.string());
  }
  std::string head(SNIFF_BYTES, '\0');
  file_stream.read(head.data(), static_cast<std::streamsize>(head.size()));
  head.resize(static_cast<size_t>(file_stream.gcount()));
  return head;
}

std::string FormatSniffer::detect(const std::filesystem::path& file_path, std::string_view head) {
  std::string format = format_from_extension(file_path);
  if (!format.empty()) {
    return format;
  }
  return sniff(head);
}

bool FormatSniffer::looks_like_csv(std::string_view head) {
  std::istringstream lines{std::string(head)};
  std::string line;
  std::vector<size_t> delimiter_counts;
  while (std::getline(lines, line) && delimiter_counts.size() < 5) {
    if (text::trim(line).empty()) {
      continue;
    }
    size_t commas = static_cast<size_t>(std::count(line.begin(), line.end(), ','));
    delimiter_counts.push_back(commas);
  }
  if (delimiter_counts.size() < 2 || delimiter_counts.front() == 0) {
    return false;
  }
  for (size_t count : delimiter_counts) {
    if (count != delimiter_counts.front()) {
      return false;
    }
  }
  return true;
}

bool FormatSniffer::looks_like_markdown(std::string_view head) {
  constexpr auto line_flags = std::regex_constants::ECMAScript | std::regex_constants::multiline;
  static const std::vector<std::regex> patterns = {
      std::regex(R"(^#{1,6}\s+\S)", line_flags),
      std::regex(R"(^\s*[-*+]\s+\S)", line_flags),
      std::regex(R"(^```)", line_flags),
      std::regex(R"(\[[^\]]+\]\([^)]+\))"),
      std::regex(R"(\*\*[^*]+\*\*)"),
      std::regex(R"(^>\s)", line_flags),
  };
  const std::string content(head);
  int matches = 0;
  for (const auto& pattern : patterns) {
    if (std::regex_search(content, pattern)) {
      ++matches;
    }
  }
  return matches >= 3;
}

}  // namespace rag_core

#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace rag_core {

namespace formats {
inline constexpr const char* TEXT = "text";
inline constexpr const char* MARKDOWN = "markdown";
inline constexpr const char* CSV = "csv";
inline constexpr const char* JSON = "json";
inline constexpr const char* HTML = "html";
inline constexpr const char* PDF = "pdf";
inline constexpr const char* ZIP = "zip";
inline constexpr const char* BINARY = "binary";
}  // namespace formats

// Detects a format tag from a file extension, or from the first bytes of the file.
class FormatSniffer {
 public:
  static constexpr size_t SNIFF_BYTES = 8 * 1024;

  // Empty string when the extension is absent or unknown.
  static std::string format_from_extension(const std::filesystem::path& file_path);

  static std::string sniff(std::string_view head);

  static std::string read_head(const std::filesystem::path& file_path);

  // Extension first, then content.
  static std::string detect(const std::filesystem::path& file_path, std::string_view head);

 private:
  static bool looks_like_csv(std::string_view head);
  static bool looks_like_markdown(std::string_view head);
};

}  // namespace rag_core

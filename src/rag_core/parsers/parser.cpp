#include "rag_core/parsers/parser.hpp"

#include <fstream>
#include <utf8.h>

#include "rag_core/errors.hpp"

namespace rag_core {

void LineReader::for_each_line(const fs::path& file_path, const LineCallback& callback) {
  std::ifstream file_stream(file_path, std::ios::binary);
  if (!file_stream.is_open()) {
    throw ParseError("Could not open file: " + file_path.string());
  }

  std::string line;
  size_t line_number = 0;
  while (std::getline(file_stream, line)) {
    ++line_number;
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    std::string_view view(line);
    if (line_number == 1 && utf8::starts_with_bom(line.begin(), line.end())) {
      view.remove_prefix(3);
    }
    if (!utf8::is_valid(view.begin(), view.end())) {
      throw ParseError("Invalid UTF-8 in " + file_path.filename().string() + " at line " +
                       std::to_string(line_number));
    }
    callback(view, line_number);
  }
  if (file_stream.bad()) {
    throw ParseError("Read error on file: " + file_path.string());
  }
}

}  // namespace rag_core

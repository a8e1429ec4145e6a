#include "rag_core/parsers/csv_parser.hpp"

#include "rag_core/errors.hpp"
#include "rag_core/routing/format_sniffer.hpp"
#include "rag_core/text/text_utils.hpp"

namespace rag_core {

CSVParser::CSVParser(const nlohmann::json& config)
    : chunking_(ChunkingConfig::from_json(config, ChunkStrategy::PARAGRAPH)) {
  chunking_.validate();
  if (!config.is_object() || !config.contains("delimiter")) {
    return;
  }
  std::string delimiter = config.at("delimiter").get<std::string>();
  if (delimiter == "\\t" || delimiter == "tab") {
    delimiter = "\t";
  }
  if (delimiter.size() != 1) {
    throw ConfigurationError("CSVParser delimiter must be a single character, got '" + delimiter +
                             "'");
  }
  delimiter_ = delimiter[0];
}

std::vector<std::string> CSVParser::supported_formats() {
  return {formats::CSV};
}

char CSVParser::delimiter_for(const fs::path& file_path) const {
  if (delimiter_) {
    return *delimiter_;
  }
  return text::to_lower(file_path.extension().string()) == ".tsv" ? '\t' : ',';
}

bool CSVParser::has_open_quote(const std::string& record) {
  bool in_quotes = false;
  for (char c : record) {
    if (c == '"') {
      in_quotes = !in_quotes;
    }
  }
  return in_quotes;
}

std::vector<std::string> CSVParser::split_record(const std::string& record, char delimiter) {
  std::vector<std::string> fields;
  std::string field;
  bool in_quotes = false;

  for (size_t i = 0; i < record.size(); ++i) {
    char c = record[i];
    if (in_quotes) {
      if (c == '"') {
        if (i + 1 < record.size() && record[i + 1] == '"') {
          field.push_back('"');
          ++i;
        } else {
          in_quotes = false;
        }
      } else {
        field.push_back(c);
      }
    } else if (c == '"') {
      in_quotes = true;
    } else if (c == delimiter) {
      fields.push_back(text::trim(field));
      field.clear();
    } else {
      field.push_back(c);
    }
  }
  if (in_quotes) {
    throw ParseError("Unterminated quoted field in record: " + record.substr(0, 80));
  }
  fields.push_back(text::trim(field));
  return fields;
}

std::vector<ParsedChunk> CSVParser::parse(const fs::path& file_path) const {
  std::vector<ParsedChunk> chunks;
  std::vector<std::string> columns;
  const char delimiter = delimiter_for(file_path);

  std::string current;
  size_t row_start = 0;
  size_t row_end = 0;

  auto emit_current = [&]() {
    if (current.empty()) {
      return;
    }
    nlohmann::json metadata = {{"row_start", row_start}, {"row_end", row_end}};
    metadata["columns"] = columns;
    chunks.push_back(ParsedChunk{current, std::move(metadata)});
    current.clear();
  };

  size_t data_row = 0;
  auto handle_record = [&](const std::string& record) {
    if (text::trim(record).empty()) {
      return;
    }
    std::vector<std::string> fields = split_record(record, delimiter);
    if (columns.empty()) {
      columns = fields;
      return;
    }

    ++data_row;
    std::string rendered;
    for (size_t i = 0; i < fields.size(); ++i) {
      if (fields[i].empty()) {
        continue;
      }
      const std::string name =
          i < columns.size() && !columns[i].empty() ? columns[i] : "column_" + std::to_string(i + 1);
      if (!rendered.empty()) {
        rendered.push_back('\n');
      }
      rendered += name + ": " + fields[i];
    }
    if (rendered.empty()) {
      return;
    }

    if (rendered.size() > chunking_.chunk_size) {
      emit_current();
      for (auto& piece : Chunker::split_fixed(rendered, chunking_.chunk_size, chunking_.chunk_overlap)) {
        nlohmann::json metadata = {{"row_start", data_row}, {"row_end", data_row}};
        metadata["columns"] = columns;
        chunks.push_back(ParsedChunk{std::move(piece), std::move(metadata)});
      }
      return;
    }

    if (!current.empty() && current.size() + 2 + rendered.size() > chunking_.chunk_size) {
      emit_current();
    }
    if (current.empty()) {
      row_start = data_row;
    } else {
      current += "\n\n";
    }
    current += rendered;
    row_end = data_row;
  };

  std::string pending;
  LineReader::for_each_line(file_path, [&](std::string_view line, size_t) {
    if (!pending.empty()) {
      pending.push_back('\n');
    }
    pending.append(line);
    if (has_open_quote(pending)) {
      return;
    }
    handle_record(pending);
    pending.clear();
  });

  if (!pending.empty()) {
    throw ParseError("Unterminated quoted field at end of " + file_path.filename().string());
  }
  emit_current();
  return chunks;
}

}  // namespace rag_core

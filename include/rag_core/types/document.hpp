#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <stdexcept>
#include <string>

namespace rag_core {

// A source file registered in a dataset. Immutable once hashed.
struct DocumentRecord {
  std::string dataset;
  std::string content_hash;
  std::string filename;  // relative path as uploaded, e.g. "reports/q3.md"
  std::string format;
  size_t byte_size = 0;
  std::filesystem::path stored_path;
  std::chrono::system_clock::time_point ingested_at;
};

enum class FileOutcomeKind { PROCESSED, FAILED, SKIPPED_DUPLICATE, SKIPPED_UNSUPPORTED, CANCELLED };

inline std::string to_string(FileOutcomeKind kind) {
  switch (kind) {
    case FileOutcomeKind::PROCESSED: return "processed";
    case FileOutcomeKind::FAILED: return "failed";
    case FileOutcomeKind::SKIPPED_DUPLICATE: return "skipped_duplicate";
    case FileOutcomeKind::SKIPPED_UNSUPPORTED: return "skipped_unsupported";
    case FileOutcomeKind::CANCELLED: return "cancelled";
  }
  return "unknown";
}

inline FileOutcomeKind file_outcome_from_string(const std::string& str) {
  if (str == "processed") return FileOutcomeKind::PROCESSED;
  if (str == "failed") return FileOutcomeKind::FAILED;
  if (str == "skipped_duplicate") return FileOutcomeKind::SKIPPED_DUPLICATE;
  if (str == "skipped_unsupported") return FileOutcomeKind::SKIPPED_UNSUPPORTED;
  if (str == "cancelled") return FileOutcomeKind::CANCELLED;
  throw std::invalid_argument("Invalid FileOutcomeKind string: " + str);
}

struct FileOutcome {
  std::string filename;
  std::string content_hash;
  FileOutcomeKind outcome = FileOutcomeKind::FAILED;
  std::string detail;
  int chunk_count = 0;
  int failed_chunks = 0;
  int extraction_failures = 0;
};

}  // namespace rag_core

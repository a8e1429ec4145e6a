#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace rag_core {

// SHA-256 fingerprints for documents (raw bytes) and chunks (chunk text).
class ContentHasher {
 public:
  static std::string sha256_hex(std::string_view data);

  // Streams the file in fixed blocks; never loads it whole.
  static std::string hash_file(const std::filesystem::path& file_path);

  // "<first 16 hex chars of document hash>_<index, zero padded to 4>"
  static std::string chunk_id(const std::string& document_hash, int chunk_index);

 private:
  static constexpr size_t READ_BLOCK_SIZE = 64 * 1024;
};

}  // namespace rag_core

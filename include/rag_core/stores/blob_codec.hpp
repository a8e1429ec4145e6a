#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace rag_core {

// Encodings for sqlite BLOB columns: zstd-compressed chunk text and raw
// float32 vectors. Corrupt blobs throw StoreError.
class BlobCodec {
 public:
  static constexpr int DEFAULT_COMPRESSION_LEVEL = 3;

  static std::vector<char> compress_text(std::string_view text,
                                         int compression_level = DEFAULT_COMPRESSION_LEVEL);
  static std::string decompress_text(const std::vector<char>& blob);

  static std::vector<char> encode_vector(const std::vector<float>& vector);
  // expected_dimension 0 accepts any length.
  static std::vector<float> decode_vector(const std::vector<char>& blob,
                                          size_t expected_dimension = 0);
};

}  // namespace rag_core

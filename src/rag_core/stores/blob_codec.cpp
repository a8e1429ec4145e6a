#include "rag_core/stores/blob_codec.hpp"

#include <zstd.h>

#include <cstring>

#include "rag_core/errors.hpp"

namespace rag_core {

std::vector<char> BlobCodec::compress_text(std::string_view text, int compression_level) {
  if (text.empty()) {
    return {};
  }
  const size_t worst_case_size = ZSTD_compressBound(text.size());
  std::vector<char> compressed(worst_case_size);

  const size_t compressed_size = ZSTD_compress(compressed.data(), compressed.size(), text.data(),
                                               text.size(), compression_level);
  if (ZSTD_isError(compressed_size)) {
    throw StoreError("zstd compression failed: " + std::string(ZSTD_getErrorName(compressed_size)));
  }
  compressed.resize(compressed_size);
  return compressed;
}

std::string BlobCodec::decompress_text(const std::vector<char>& blob) {
  if (blob.empty()) {
    return "";
  }
  const unsigned long long content_size = ZSTD_getFrameContentSize(blob.data(), blob.size());
  if (content_size == ZSTD_CONTENTSIZE_ERROR || content_size == ZSTD_CONTENTSIZE_UNKNOWN) {
    throw StoreError("Stored chunk text is not a zstd frame with a known size");
  }

  std::string text(content_size, '\0');
  const size_t actual_size = ZSTD_decompress(text.data(), text.size(), blob.data(), blob.size());
  if (ZSTD_isError(actual_size) || actual_size != content_size) {
    throw StoreError("zstd decompression failed: " + std::string(ZSTD_getErrorName(actual_size)));
  }
  return text;
}

std::vector<char> BlobCodec::encode_vector(const std::vector<float>& vector) {
  std::vector<char> blob(vector.size() * sizeof(float));
  if (!blob.empty()) {
    std::memcpy(blob.data(), vector.data(), blob.size());
  }
  return blob;
}

std::vector<float> BlobCodec::decode_vector(const std::vector<char>& blob,
                                            size_t expected_dimension) {
  if (blob.size() % sizeof(float) != 0) {
    throw StoreError("Vector blob of " + std::to_string(blob.size()) +
                     " bytes is not a float32 array");
  }
  const size_t dimension = blob.size() / sizeof(float);
  if (expected_dimension != 0 && dimension != expected_dimension) {
    throw StoreError("Stored vector has " + std::to_string(dimension) + " dimensions, expected " +
                     std::to_string(expected_dimension));
  }
  std::vector<float> vector(dimension);
  if (dimension > 0) {
    std::memcpy(vector.data(), blob.data(), blob.size());
  }
  return vector;
}

}  // namespace rag_core

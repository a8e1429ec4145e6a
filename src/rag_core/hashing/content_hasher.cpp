#include "rag_core/hashing/content_hasher.hpp"

#include <openssl/evp.h>

#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <vector>

#include "rag_core/errors.hpp"

namespace rag_core {

namespace {

using DigestContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

DigestContext new_sha256_context() {
  DigestContext ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  if (!ctx) {
    throw RagError("Failed to create EVP context for hashing");
  }
  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
    throw RagError("Failed to initialize SHA256 digest");
  }
  return ctx;
}

std::string finalize_hex(EVP_MD_CTX* ctx) {
  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;
  if (EVP_DigestFinal_ex(ctx, hash, &hash_len) != 1) {
    throw RagError("Failed to finalize SHA256 digest");
  }

  std::stringstream ss;
  for (unsigned int i = 0; i < hash_len; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
  }
  return ss.str();
}

}  // namespace

std::string ContentHasher::sha256_hex(std::string_view data) {
  DigestContext ctx = new_sha256_context();
  if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
    throw RagError("Failed to update SHA256 digest");
  }
  return finalize_hex(ctx.get());
}

std::string ContentHasher::hash_file(const std::filesystem::path& file_path) {
  std::ifstream file_stream(file_path, std::ios::binary);
  if (!file_stream.is_open()) {
    throw RagError("Could not open file for hashing: " + file_path.string());
  }

  DigestContext ctx = new_sha256_context();
  std::vector<char> block(READ_BLOCK_SIZE);
  while (file_stream) {
    file_stream.read(block.data(), static_cast<std::streamsize>(block.size()));
    std::streamsize got = file_stream.gcount();
    if (got > 0 && EVP_DigestUpdate(ctx.get(), block.data(), static_cast<size_t>(got)) != 1) {
      throw RagError("Failed to update SHA256 digest for " + file_path.string());
    }
  }
  if (file_stream.bad()) {
    throw RagError("Read error while hashing " + file_path.string());
  }
  return finalize_hex(ctx.get());
}

std::string ContentHasher::chunk_id(const std::string& document_hash, int chunk_index) {
  std::stringstream ss;
  ss << document_hash.substr(0, 16) << "_" << std::setw(4) << std::setfill('0') << chunk_index;
  return ss.str();
}

}  // namespace rag_core

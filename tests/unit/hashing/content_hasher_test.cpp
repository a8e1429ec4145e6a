#include <gtest/gtest.h>

#include <string>

#include "common/utilities_test.hpp"
#include "rag_core/errors.hpp"
#include "rag_core/hashing/content_hasher.hpp"

namespace rag_tests {

using rag_core::ContentHasher;

TEST(ContentHasherTest, KnownDigests) {
  EXPECT_EQ(ContentHasher::sha256_hex(""),
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
  EXPECT_EQ(ContentHasher::sha256_hex("abc"),
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(ContentHasherTest, FileHashMatchesInMemoryHash) {
  auto dir = TestUtilities::create_temp_dir("hasher");
  // Larger than one read block so the streaming path loops.
  std::string content(200 * 1024, 'x');
  content += "tail";
  auto path = TestUtilities::write_file(dir / "big.txt", content);

  EXPECT_EQ(ContentHasher::hash_file(path), ContentHasher::sha256_hex(content));
  TestUtilities::cleanup_dir(dir);
}

TEST(ContentHasherTest, MissingFileThrows) {
  EXPECT_THROW(ContentHasher::hash_file("/nonexistent/file.txt"), rag_core::RagError);
}

TEST(ContentHasherTest, ChunkIdFormat) {
  const std::string hash = ContentHasher::sha256_hex("abc");

  EXPECT_EQ(ContentHasher::chunk_id(hash, 3), "ba7816bf8f01cfea_0003");
  EXPECT_EQ(ContentHasher::chunk_id(hash, 12345), "ba7816bf8f01cfea_12345");
}

}  // namespace rag_tests

#include <gtest/gtest.h>

#include "common/utilities_test.hpp"
#include "rag_core/hashing/content_hasher.hpp"
#include "rag_core/ingest/document_ingestor.hpp"

namespace rag_tests {

using namespace rag_core;

class DocumentIngestorTest : public ServiceTestBase {
 protected:
  void SetUp() override {
    ServiceTestBase::SetUp();
    dataset_service_->create_dataset("notes", "standard", "docs_db");
  }

  DocumentRecord upload(const std::string& filename, const std::string& content) {
    UploadResult result = dataset_service_->upload_file("notes", filename, content);
    return *dataset_repo_->get_document("notes", result.content_hash);
  }

  DatasetRecord notes() {
    return *dataset_repo_->get_dataset("notes");
  }
};

TEST_F(DocumentIngestorTest, IngestsMarkdownWithCoreMetadata) {
  DocumentRecord document = upload("guide.md", "# Guide\n\nKeep the vector index fresh.\n");
  DocumentIngestor ingestor(*resolver_);

  FileOutcome outcome = ingestor.ingest(notes(), document);

  EXPECT_EQ(outcome.outcome, FileOutcomeKind::PROCESSED);
  EXPECT_EQ(outcome.detail, "parsed by MarkdownParser");
  EXPECT_EQ(outcome.failed_chunks, 0);
  auto chunks = resolver_->resolve_database("docs_db")->store->get_document_chunks(
      document.content_hash);
  ASSERT_EQ(static_cast<int>(chunks.size()), outcome.chunk_count);
  const nlohmann::json& metadata = chunks[0].metadata;
  EXPECT_EQ(metadata["document_hash"], document.content_hash);
  EXPECT_EQ(metadata["chunk_index"], 0);
  EXPECT_EQ(metadata["total_chunks"], chunks.size());
  EXPECT_EQ(metadata["dataset"], "notes");
  EXPECT_EQ(metadata["format"], "markdown");
  EXPECT_EQ(metadata["parser"], "MarkdownParser");
  EXPECT_EQ(chunks[0].id, ContentHasher::chunk_id(document.content_hash, 0));
}

TEST_F(DocumentIngestorTest, SecondIngestIsDuplicate) {
  DocumentRecord document = upload("a.txt", "Plain text that is stored once.\n");
  DocumentIngestor ingestor(*resolver_);
  ASSERT_EQ(ingestor.ingest(notes(), document).outcome, FileOutcomeKind::PROCESSED);

  FileOutcome again = ingestor.ingest(notes(), document);

  EXPECT_EQ(again.outcome, FileOutcomeKind::SKIPPED_DUPLICATE);
  EXPECT_EQ(again.detail, "already present in database docs_db");
}

TEST_F(DocumentIngestorTest, BinaryContentIsUnsupported) {
  DocumentRecord document = upload("image.png", std::string("\x89PNG\r\n\x1a\n\0\0\0\rIHDR", 16));
  DocumentIngestor ingestor(*resolver_);

  FileOutcome outcome = ingestor.ingest(notes(), document);

  EXPECT_EQ(outcome.outcome, FileOutcomeKind::SKIPPED_UNSUPPORTED);
  EXPECT_EQ(outcome.detail, "unsupported format: binary");
}

TEST_F(DocumentIngestorTest, MalformedCsvFails) {
  DocumentRecord document = upload("broken.csv", "name,value\n\"open,1\n");
  DocumentIngestor ingestor(*resolver_);

  FileOutcome outcome = ingestor.ingest(notes(), document);

  EXPECT_EQ(outcome.outcome, FileOutcomeKind::FAILED);
  EXPECT_FALSE(outcome.detail.empty());
  EXPECT_FALSE(resolver_->resolve_database("docs_db")->store->contains_document(
      document.content_hash));
}

TEST_F(DocumentIngestorTest, BuildChunksDropsRepeatsWhenDeduplicating) {
  nlohmann::json config = TestUtilities::rag_config_json();
  config["data_processing_strategies"][0]["deduplicate_chunks"] = true;
  rebuild(config, ComponentRegistry::with_builtins());
  DocumentRecord document = upload("a.txt", "irrelevant");
  ResolvedPipelinePtr pipeline = resolver_->resolve("standard", "docs_db");

  std::vector<ParsedChunk> parsed = {{"same text", nlohmann::json::object()},
                                     {"same text", nlohmann::json::object()},
                                     {"other text", {{"section", "b"}}}};
  int extraction_failures = 0;
  std::vector<Chunk> chunks = DocumentIngestor::build_chunks(
      *pipeline, notes(), document, std::move(parsed), "TextParser", extraction_failures);

  ASSERT_EQ(chunks.size(), 2u);
  EXPECT_EQ(chunks[0].chunk_index, 0);
  EXPECT_EQ(chunks[1].chunk_index, 2);
  EXPECT_EQ(chunks[1].metadata["section"], "b");
  EXPECT_EQ(chunks[1].metadata["total_chunks"], 2);
  EXPECT_EQ(chunks[1].metadata["parser"], "TextParser");
  EXPECT_EQ(extraction_failures, 0);
}

}  // namespace rag_tests

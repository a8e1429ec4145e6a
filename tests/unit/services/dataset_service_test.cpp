#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>

#include "common/utilities_test.hpp"
#include "rag_core/errors.hpp"
#include "rag_core/hashing/content_hasher.hpp"

namespace rag_tests {

using namespace rag_core;

namespace {

class FlakyParser : public Parser {
 public:
  std::string type() const override {
    return "FlakyParser";
  }
  std::vector<ParsedChunk> parse(const fs::path&) const override {
    throw ParseError("flaky parser gave up");
  }
};

std::string read_all(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  std::stringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

}  // namespace

class DatasetServiceTest : public ServiceTestBase {
 protected:
  VectorStore& store() {
    return *resolver_->resolve_database("docs_db")->store;
  }
};

TEST_F(DatasetServiceTest, CreateDatasetPersistsAndMakesDirectory) {
  DatasetRecord dataset = dataset_service_->create_dataset("notes", "standard", "docs_db");

  EXPECT_EQ(dataset.name, "notes");
  EXPECT_TRUE(dataset_repo_->get_dataset("notes").has_value());
  EXPECT_TRUE(std::filesystem::is_directory(data_dir_ / "notes"));
  ASSERT_EQ(dataset_service_->list_datasets().size(), 1u);
}

TEST_F(DatasetServiceTest, CreateDatasetRejectsBadNames) {
  for (const char* name : {"", "has space", "a/b", "..", "semi;colon"}) {
    EXPECT_THROW(dataset_service_->create_dataset(name, "standard", "docs_db"),
                 std::invalid_argument)
        << name;
  }
  EXPECT_THROW(dataset_service_->create_dataset(std::string(129, 'a'), "standard", "docs_db"),
               std::invalid_argument);
}

TEST_F(DatasetServiceTest, CreateDatasetRejectsDuplicates) {
  dataset_service_->create_dataset("notes", "standard", "docs_db");

  EXPECT_THROW(dataset_service_->create_dataset("notes", "standard", "docs_db"),
               std::invalid_argument);
}

TEST_F(DatasetServiceTest, CreateDatasetChecksReferencesFirst) {
  EXPECT_THROW(dataset_service_->create_dataset("notes", "missing", "docs_db"), ConfigurationError);
  EXPECT_THROW(dataset_service_->create_dataset("notes", "standard", "missing_db"),
               ConfigurationError);
  EXPECT_FALSE(dataset_repo_->get_dataset("notes").has_value());
}

TEST_F(DatasetServiceTest, CreateDeclaredDatasetsIsIdempotent) {
  nlohmann::json config = TestUtilities::rag_config_json();
  config["datasets"] = {
      {{"name", "handbook"}, {"data_processing_strategy", "standard"}, {"database", "docs_db"}}};
  rebuild(config, ComponentRegistry::with_builtins());

  EXPECT_EQ(dataset_service_->create_declared_datasets(), 1u);
  EXPECT_EQ(dataset_service_->create_declared_datasets(), 0u);
  EXPECT_TRUE(dataset_repo_->get_dataset("handbook").has_value());
}

TEST_F(DatasetServiceTest, UploadStoresContentUnderHash) {
  dataset_service_->create_dataset("notes", "standard", "docs_db");
  const std::string content = "# Title\n\nSome body text.\n";

  UploadResult result = dataset_service_->upload_file("notes", "docs/title.md", content);

  EXPECT_EQ(result.content_hash, ContentHasher::sha256_hex(content));
  EXPECT_EQ(result.format, "markdown");
  EXPECT_EQ(result.byte_size, content.size());
  EXPECT_FALSE(result.skipped);
  EXPECT_FALSE(result.processed);
  EXPECT_FALSE(result.outcome.has_value());
  EXPECT_EQ(read_all(data_dir_ / "notes" / result.content_hash), content);

  auto document = dataset_repo_->get_document("notes", result.content_hash);
  ASSERT_TRUE(document.has_value());
  EXPECT_EQ(document->filename, "docs/title.md");
}

TEST_F(DatasetServiceTest, IdenticalUploadIsSkipped) {
  dataset_service_->create_dataset("notes", "standard", "docs_db");
  dataset_service_->upload_file("notes", "a.txt", "same bytes");

  UploadResult again = dataset_service_->upload_file("notes", "renamed.txt", "same bytes");

  EXPECT_TRUE(again.skipped);
  EXPECT_EQ(dataset_repo_->count_documents("notes"), 1u);
  EXPECT_EQ(dataset_repo_->get_documents("notes")[0].filename, "a.txt");
}

TEST_F(DatasetServiceTest, UploadValidatesFilenameAndDataset) {
  dataset_service_->create_dataset("notes", "standard", "docs_db");

  EXPECT_THROW(dataset_service_->upload_file("notes", "", "x"), std::invalid_argument);
  EXPECT_THROW(dataset_service_->upload_file("notes", "/etc/passwd", "x"), std::invalid_argument);
  EXPECT_THROW(dataset_service_->upload_file("notes", "../escape.txt", "x"),
               std::invalid_argument);
  EXPECT_THROW(dataset_service_->upload_file("ghost", "a.txt", "x"), NotFoundError);
}

TEST_F(DatasetServiceTest, UploadWithProcessNowIngests) {
  dataset_service_->create_dataset("notes", "standard", "docs_db");

  UploadResult result = dataset_service_->upload_file(
      "notes", "guide.md", "# Guide\n\nRebuild the vector index nightly.\n", true);

  EXPECT_TRUE(result.processed);
  ASSERT_TRUE(result.outcome.has_value());
  EXPECT_EQ(result.outcome->outcome, FileOutcomeKind::PROCESSED);
  EXPECT_GT(result.outcome->chunk_count, 0);
  EXPECT_TRUE(store().contains_document(result.content_hash));

  auto chunks = store().get_document_chunks(result.content_hash);
  ASSERT_FALSE(chunks.empty());
  EXPECT_EQ(chunks[0].metadata["filename"], "guide.md");
  EXPECT_EQ(chunks[0].metadata["dataset"], "notes");
  EXPECT_EQ(chunks[0].metadata["parser"], "MarkdownParser");
  EXPECT_EQ(chunks[0].metadata["extractor_StatisticsExtractor"], true);
  EXPECT_TRUE(chunks[0].metadata.contains("keywords"));
}

TEST_F(DatasetServiceTest, ParserFallbackIsReportedInOutcome) {
  nlohmann::json config = TestUtilities::rag_config_json();
  config["data_processing_strategies"].push_back(
      {{"name", "flaky"},
       {"parsers",
        {{{"type", "FlakyParser"}, {"file_include_patterns", {"*.txt"}}, {"priority", 10}},
         {{"type", "TextParser"}, {"file_include_patterns", {"*.txt"}}, {"priority", 0}}}}});
  ComponentRegistry registry = ComponentRegistry::with_builtins();
  registry.register_parser(
      "FlakyParser", [](const nlohmann::json&) { return std::make_shared<FlakyParser>(); },
      {"text"});
  rebuild(config, std::move(registry));
  dataset_service_->create_dataset("flaky_ds", "flaky", "docs_db");

  UploadResult result =
      dataset_service_->upload_file("flaky_ds", "a.txt", "Fallback parsing still works.\n", true);

  ASSERT_TRUE(result.outcome.has_value());
  EXPECT_EQ(result.outcome->outcome, FileOutcomeKind::PROCESSED);
  EXPECT_EQ(result.outcome->detail, "parsed by TextParser after 1 failed parser(s)");
}

TEST_F(DatasetServiceTest, ProcessDatasetQueuesSnapshotOfDocuments) {
  dataset_service_->create_dataset("notes", "standard", "docs_db");
  UploadResult a = dataset_service_->upload_file("notes", "a.txt", "first");
  UploadResult b = dataset_service_->upload_file("notes", "b.txt", "second");

  long long task_id = dataset_service_->process_dataset("notes", 3);

  auto task = task_repo_->get_task(task_id);
  ASSERT_TRUE(task.has_value());
  EXPECT_EQ(task->task_type, "INGEST_DATASET");
  EXPECT_EQ(task->dataset_name, "notes");
  EXPECT_EQ(task->priority, 3);
  EXPECT_EQ(nlohmann::json::parse(task->payload)["content_hashes"],
            nlohmann::json({a.content_hash, b.content_hash}));
  EXPECT_THROW(dataset_service_->process_dataset("ghost"), NotFoundError);
}

TEST_F(DatasetServiceTest, GetDatasetListsDocuments) {
  dataset_service_->create_dataset("notes", "standard", "docs_db");
  dataset_service_->upload_file("notes", "a.txt", "first");

  DatasetInfo info = dataset_service_->get_dataset("notes");

  EXPECT_EQ(info.dataset.database_name, "docs_db");
  ASSERT_EQ(info.documents.size(), 1u);
  EXPECT_EQ(info.documents[0].filename, "a.txt");
  EXPECT_THROW(dataset_service_->get_dataset("ghost"), NotFoundError);
}

TEST_F(DatasetServiceTest, DeleteDatasetKeepsChunksOtherDatasetsShare) {
  const std::string shared = "Shared handbook text about retention policies.\n";
  dataset_service_->create_dataset("first", "standard", "docs_db");
  dataset_service_->create_dataset("second", "standard", "docs_db");
  UploadResult uploaded = dataset_service_->upload_file("first", "shared.txt", shared, true);
  dataset_service_->upload_file("second", "shared.txt", shared);
  UploadResult own = dataset_service_->upload_file("first", "own.txt", "Only in first.\n", true);

  dataset_service_->delete_dataset("first");

  EXPECT_FALSE(dataset_repo_->get_dataset("first").has_value());
  EXPECT_EQ(dataset_repo_->count_documents("first"), 0u);
  EXPECT_FALSE(std::filesystem::exists(data_dir_ / "first"));
  EXPECT_TRUE(store().contains_document(uploaded.content_hash));
  EXPECT_FALSE(store().contains_document(own.content_hash));

  dataset_service_->delete_dataset("second");
  EXPECT_FALSE(store().contains_document(uploaded.content_hash));
  EXPECT_THROW(dataset_service_->delete_dataset("second"), NotFoundError);
}

TEST_F(DatasetServiceTest, RemoveFileDeletesChunksAndBytes) {
  dataset_service_->create_dataset("notes", "standard", "docs_db");
  UploadResult uploaded =
      dataset_service_->upload_file("notes", "a.txt", "Text that will be removed.\n", true);
  const size_t stored = store().get_document_chunks(uploaded.content_hash).size();
  ASSERT_GT(stored, 0u);

  EXPECT_EQ(dataset_service_->remove_file("notes", uploaded.content_hash), stored);

  EXPECT_FALSE(store().contains_document(uploaded.content_hash));
  EXPECT_FALSE(std::filesystem::exists(data_dir_ / "notes" / uploaded.content_hash));
  EXPECT_THROW(dataset_service_->remove_file("notes", uploaded.content_hash), NotFoundError);
}

}  // namespace rag_tests

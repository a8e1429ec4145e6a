#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "rag_core/types/dataset.hpp"
#include "rag_core/types/document.hpp"

namespace rag_core {

class DatasetRepo;
class IngestionTaskRepo;
class StrategyResolver;

struct UploadResult {
  std::string filename;
  std::string content_hash;
  std::string format;
  size_t byte_size = 0;
  bool processed = false;
  bool skipped = false;
  std::optional<FileOutcome> outcome;  // set when processed synchronously
};

struct DatasetInfo {
  DatasetRecord dataset;
  std::vector<DocumentRecord> documents;
};

/**
 * Dataset lifecycle: create, upload, process, inspect and delete. Uploaded
 * bytes live under data_dir/<dataset>/<content_hash>; identical content is
 * stored once per dataset.
 */
class DatasetService {
 public:
  DatasetService(std::shared_ptr<DatasetRepo> dataset_repo,
                 std::shared_ptr<IngestionTaskRepo> task_repo,
                 std::shared_ptr<StrategyResolver> resolver, std::filesystem::path data_dir);

  // Resolves the strategy/database pair first, so a bad reference is a
  // ConfigurationError and nothing is created. Throws std::invalid_argument
  // for an invalid or taken name.
  DatasetRecord create_dataset(const std::string& name, const std::string& strategy_name,
                               const std::string& database_name);

  // Creates the datasets declared in the RAG config that do not exist yet.
  size_t create_declared_datasets();

  UploadResult upload_file(const std::string& dataset_name, const std::string& filename,
                           std::string_view content, bool process_now = false);

  // Queues an ingestion task over every document currently in the dataset.
  long long process_dataset(const std::string& dataset_name, int priority = 10);

  std::vector<DatasetRecord> list_datasets();
  DatasetInfo get_dataset(const std::string& dataset_name);

  // Removes the dataset's chunks from its database (unless another dataset on
  // that database holds the same content), its documents and stored files.
  void delete_dataset(const std::string& dataset_name);

  // Same cascade for a single document. Returns the number of chunks deleted.
  size_t remove_file(const std::string& dataset_name, const std::string& content_hash);

  static void validate_dataset_name(const std::string& name);
  static void validate_filename(const std::string& filename);

 private:
  DatasetRecord require_dataset(const std::string& dataset_name);
  size_t delete_document_chunks(const DatasetRecord& dataset, const std::string& content_hash);

  std::shared_ptr<DatasetRepo> dataset_repo_;
  std::shared_ptr<IngestionTaskRepo> task_repo_;
  std::shared_ptr<StrategyResolver> resolver_;
  std::filesystem::path data_dir_;
};

}  // namespace rag_core

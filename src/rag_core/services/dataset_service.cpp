#include "rag_core/services/dataset_service.hpp"

#include <cctype>
#include <fstream>
#include <iostream>
#include <stdexcept>

#include "rag_core/async/ingest_dataset_task.hpp"
#include "rag_core/db/dataset_repo.hpp"
#include "rag_core/db/task_repo.hpp"
#include "rag_core/errors.hpp"
#include "rag_core/hashing/content_hasher.hpp"
#include "rag_core/ingest/document_ingestor.hpp"
#include "rag_core/resolver/strategy_resolver.hpp"
#include "rag_core/routing/format_sniffer.hpp"

namespace fs = std::filesystem;

namespace rag_core {

DatasetService::DatasetService(std::shared_ptr<DatasetRepo> dataset_repo,
                               std::shared_ptr<IngestionTaskRepo> task_repo,
                               std::shared_ptr<StrategyResolver> resolver, fs::path data_dir)
    : dataset_repo_(std::move(dataset_repo)),
      task_repo_(std::move(task_repo)),
      resolver_(std::move(resolver)),
      data_dir_(std::move(data_dir)) {}

void DatasetService::validate_dataset_name(const std::string& name) {
  if (name.empty() || name.size() > 128) {
    throw std::invalid_argument("Dataset name must be 1 to 128 characters");
  }
  for (char c : name) {
    const bool ok = std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' || c == '.';
    if (!ok) {
      throw std::invalid_argument("Dataset name may only contain letters, digits, '_', '-' and '.': " +
                                  name);
    }
  }
  if (name == "." || name == "..") {
    throw std::invalid_argument("Invalid dataset name: " + name);
  }
}

void DatasetService::validate_filename(const std::string& filename) {
  if (filename.empty()) {
    throw std::invalid_argument("Filename must not be empty");
  }
  fs::path path(filename);
  if (path.is_absolute()) {
    throw std::invalid_argument("Filename must be relative: " + filename);
  }
  for (const auto& part : path) {
    if (part == "..") {
      throw std::invalid_argument("Filename must not leave the dataset: " + filename);
    }
  }
}

DatasetRecord DatasetService::require_dataset(const std::string& dataset_name) {
  std::optional<DatasetRecord> dataset = dataset_repo_->get_dataset(dataset_name);
  if (!dataset) {
    throw NotFoundError("Dataset not found: " + dataset_name);
  }
  return *dataset;
}

DatasetRecord DatasetService::create_dataset(const std::string& name,
                                             const std::string& strategy_name,
                                             const std::string& database_name) {
  validate_dataset_name(name);
  resolver_->resolve(strategy_name, database_name);

  DatasetRecord dataset{name, strategy_name, database_name, std::chrono::system_clock::now()};
  if (!dataset_repo_->create_dataset(dataset)) {
    throw std::invalid_argument("Dataset already exists: " + name);
  }
  fs::create_directories(data_dir_ / name);
  std::cout << "[DatasetService] Created dataset " << name << " (" << strategy_name << " -> "
            << database_name << ")" << std::endl;
  return dataset;
}

size_t DatasetService::create_declared_datasets() {
  size_t created = 0;
  for (const auto& declared : resolver_->config().datasets) {
    if (dataset_repo_->get_dataset(declared.name)) {
      continue;
    }
    create_dataset(declared.name, declared.data_processing_strategy, declared.database);
    ++created;
  }
  return created;
}

UploadResult DatasetService::upload_file(const std::string& dataset_name,
                                         const std::string& filename, std::string_view content,
                                         bool process_now) {
  validate_filename(filename);
  DatasetRecord dataset = require_dataset(dataset_name);

  UploadResult result;
  result.filename = filename;
  result.content_hash = ContentHasher::sha256_hex(content);
  result.byte_size = content.size();
  result.format = FormatSniffer::detect(filename, content.substr(0, FormatSniffer::SNIFF_BYTES));

  if (dataset_repo_->get_document(dataset_name, result.content_hash)) {
    result.skipped = true;
    return result;
  }

  const fs::path stored_path = data_dir_ / dataset_name / result.content_hash;
  if (!fs::exists(stored_path)) {
    fs::create_directories(stored_path.parent_path());
    const fs::path partial = stored_path.string() + ".part";
    {
      std::ofstream out(partial, std::ios::binary | std::ios::trunc);
      if (!out) {
        throw StoreError("Could not write upload to " + partial.string());
      }
      out.write(content.data(), static_cast<std::streamsize>(content.size()));
      if (!out) {
        throw StoreError("Could not write upload to " + partial.string());
      }
    }
    fs::rename(partial, stored_path);
  }

  DocumentRecord document;
  document.dataset = dataset_name;
  document.content_hash = result.content_hash;
  document.filename = filename;
  document.format = result.format;
  document.byte_size = content.size();
  document.stored_path = stored_path;
  document.ingested_at = std::chrono::system_clock::now();
  if (!dataset_repo_->add_document(document)) {
    // Same content registered concurrently.
    result.skipped = true;
    return result;
  }

  if (process_now) {
    DocumentIngestor ingestor(*resolver_);
    FileOutcome outcome = ingestor.ingest(dataset, document);
    result.processed = outcome.outcome == FileOutcomeKind::PROCESSED;
    result.skipped = outcome.outcome == FileOutcomeKind::SKIPPED_DUPLICATE;
    result.outcome = std::move(outcome);
  }
  return result;
}

long long DatasetService::process_dataset(const std::string& dataset_name, int priority) {
  DatasetRecord dataset = require_dataset(dataset_name);
  resolver_->resolve(dataset.data_processing_strategy, dataset.database_name);

  std::vector<std::string> hashes;
  for (const auto& document : dataset_repo_->get_documents(dataset_name)) {
    hashes.push_back(document.content_hash);
  }
  const long long task_id = task_repo_->create_task(
      IngestDatasetTask::TYPE, dataset_name, IngestDatasetTask::make_payload(hashes), priority);
  std::cout << "[DatasetService] Queued task " << task_id << " for dataset " << dataset_name
            << " (" << hashes.size() << " files)" << std::endl;
  return task_id;
}

std::vector<DatasetRecord> DatasetService::list_datasets() {
  return dataset_repo_->list_datasets();
}

DatasetInfo DatasetService::get_dataset(const std::string& dataset_name) {
  DatasetInfo info;
  info.dataset = require_dataset(dataset_name);
  info.documents = dataset_repo_->get_documents(dataset_name);
  return info;
}

size_t DatasetService::delete_document_chunks(const DatasetRecord& dataset,
                                              const std::string& content_hash) {
  if (dataset_repo_->count_other_references(dataset.database_name, content_hash, dataset.name) > 0) {
    return 0;
  }
  DatabaseBindingPtr binding = resolver_->resolve_database(dataset.database_name);
  return binding->store->delete_document(content_hash);
}

void DatasetService::delete_dataset(const std::string& dataset_name) {
  DatasetRecord dataset = require_dataset(dataset_name);

  size_t removed_chunks = 0;
  for (const auto& document : dataset_repo_->get_documents(dataset_name)) {
    removed_chunks += delete_document_chunks(dataset, document.content_hash);
  }
  dataset_repo_->delete_dataset(dataset_name);

  std::error_code ec;
  fs::remove_all(data_dir_ / dataset_name, ec);
  if (ec) {
    std::cerr << "[DatasetService] Could not remove files of dataset " << dataset_name << ": "
              << ec.message() << std::endl;
  }
  std::cout << "[DatasetService] Deleted dataset " << dataset_name << " (" << removed_chunks
            << " chunks removed)" << std::endl;
}

size_t DatasetService::remove_file(const std::string& dataset_name,
                                   const std::string& content_hash) {
  DatasetRecord dataset = require_dataset(dataset_name);
  std::optional<DocumentRecord> document = dataset_repo_->get_document(dataset_name, content_hash);
  if (!document) {
    throw NotFoundError("Document " + content_hash + " not found in dataset " + dataset_name);
  }

  const size_t removed_chunks = delete_document_chunks(dataset, content_hash);
  dataset_repo_->remove_document(dataset_name, content_hash);

  std::error_code ec;
  fs::remove(document->stored_path, ec);
  if (ec) {
    std::cerr << "[DatasetService] Could not remove " << document->stored_path << ": "
              << ec.message() << std::endl;
  }
  return removed_chunks;
}

}  // namespace rag_core

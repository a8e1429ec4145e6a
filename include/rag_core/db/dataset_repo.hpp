#pragma once

#include <optional>
#include <string>
#include <vector>

#include "rag_core/db/database_manager.hpp"
#include "rag_core/types/dataset.hpp"
#include "rag_core/types/document.hpp"

namespace rag_core {

class DatasetRepoError : public std::exception {
 public:
  explicit DatasetRepoError(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Dataset and document bookkeeping. Chunks live in the vector stores.
class DatasetRepo {
 public:
  explicit DatasetRepo(DatabaseManager& db_manager);

  // False when a dataset of that name already exists.
  bool create_dataset(const DatasetRecord& dataset);
  std::optional<DatasetRecord> get_dataset(const std::string& name);
  std::vector<DatasetRecord> list_datasets();
  // Removes the dataset and, by cascade, its document rows.
  bool delete_dataset(const std::string& name);

  // Registers a document unless the dataset already holds that content hash.
  // Returns false for the duplicate; the check and insert are one statement.
  bool add_document(const DocumentRecord& document);
  std::optional<DocumentRecord> get_document(const std::string& dataset_name,
                                             const std::string& content_hash);
  std::vector<DocumentRecord> get_documents(const std::string& dataset_name);
  bool remove_document(const std::string& dataset_name, const std::string& content_hash);
  size_t count_documents(const std::string& dataset_name);

  // Datasets other than `excluded_dataset` that are bound to `database_name`
  // and hold `content_hash`.
  size_t count_other_references(const std::string& database_name, const std::string& content_hash,
                                const std::string& excluded_dataset);

 private:
  DatabaseManager& db_manager_;
};

}  // namespace rag_core

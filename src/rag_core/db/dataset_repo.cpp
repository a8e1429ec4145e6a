#include "rag_core/db/dataset_repo.hpp"

#include <sqlite_modern_cpp.h>

#include "rag_core/db/pooled_connection.hpp"
#include "rag_core/db/sqlite_support.hpp"

namespace rag_core {

namespace {

const char* DOCUMENT_COLUMNS =
    "SELECT dataset_name, content_hash, filename, format, byte_size, stored_path, ingested_at "
    "FROM documents ";

DocumentRecord make_document(std::string dataset_name, std::string content_hash,
                             std::string filename, std::string format, long long byte_size,
                             const std::string& stored_path, const std::string& ingested_at) {
  DocumentRecord document;
  document.dataset = std::move(dataset_name);
  document.content_hash = std::move(content_hash);
  document.filename = std::move(filename);
  document.format = std::move(format);
  document.byte_size = static_cast<size_t>(byte_size);
  document.stored_path = stored_path;
  document.ingested_at = string_to_time_point(ingested_at);
  return document;
}

}  // namespace

DatasetRepo::DatasetRepo(DatabaseManager& db_manager) : db_manager_(db_manager) {}

bool DatasetRepo::create_dataset(const DatasetRecord& dataset) {
  try {
    PooledConnection conn(db_manager_);
    *conn << "INSERT OR IGNORE INTO datasets (name, data_processing_strategy, database_name, "
             "created_at) VALUES (?,?,?,?)"
          << dataset.name << dataset.data_processing_strategy << dataset.database_name
          << time_point_to_string(dataset.created_at);
    return conn->rows_modified() > 0;
  } catch (const sqlite::sqlite_exception& e) {
    throw DatasetRepoError(format_db_error("create_dataset", e));
  }
}

std::optional<DatasetRecord> DatasetRepo::get_dataset(const std::string& name) {
  try {
    PooledConnection conn(db_manager_);
    std::optional<DatasetRecord> result;
    *conn << "SELECT name, data_processing_strategy, database_name, created_at FROM datasets "
             "WHERE name = ?"
          << name >>
        [&](std::string ds_name, std::string strategy, std::string database_name,
            std::string created_at) {
          result = DatasetRecord{std::move(ds_name), std::move(strategy), std::move(database_name),
                                 string_to_time_point(created_at)};
        };
    return result;
  } catch (const sqlite::sqlite_exception& e) {
    throw DatasetRepoError(format_db_error("get_dataset", e));
  }
}

std::vector<DatasetRecord> DatasetRepo::list_datasets() {
  try {
    PooledConnection conn(db_manager_);
    std::vector<DatasetRecord> datasets;
    *conn << "SELECT name, data_processing_strategy, database_name, created_at FROM datasets "
             "ORDER BY name ASC" >>
        [&](std::string ds_name, std::string strategy, std::string database_name,
            std::string created_at) {
          datasets.push_back(DatasetRecord{std::move(ds_name), std::move(strategy),
                                           std::move(database_name),
                                           string_to_time_point(created_at)});
        };
    return datasets;
  } catch (const sqlite::sqlite_exception& e) {
    throw DatasetRepoError(format_db_error("list_datasets", e));
  }
}

bool DatasetRepo::delete_dataset(const std::string& name) {
  try {
    PooledConnection conn(db_manager_);
    *conn << "DELETE FROM datasets WHERE name = ?" << name;
    return conn->rows_modified() > 0;
  } catch (const sqlite::sqlite_exception& e) {
    throw DatasetRepoError(format_db_error("delete_dataset", e));
  }
}

bool DatasetRepo::add_document(const DocumentRecord& document) {
  try {
    PooledConnection conn(db_manager_);
    *conn << "INSERT OR IGNORE INTO documents (dataset_name, content_hash, filename, format, "
             "byte_size, stored_path, ingested_at) VALUES (?,?,?,?,?,?,?)"
          << document.dataset << document.content_hash << document.filename << document.format
          << static_cast<long long>(document.byte_size) << document.stored_path.string()
          << time_point_to_string(document.ingested_at);
    return conn->rows_modified() > 0;
  } catch (const sqlite::sqlite_exception& e) {
    throw DatasetRepoError(format_db_error("add_document", e));
  }
}

std::optional<DocumentRecord> DatasetRepo::get_document(const std::string& dataset_name,
                                                        const std::string& content_hash) {
  try {
    PooledConnection conn(db_manager_);
    std::optional<DocumentRecord> result;
    *conn << std::string(DOCUMENT_COLUMNS) + "WHERE dataset_name = ? AND content_hash = ?"
          << dataset_name << content_hash >>
        [&](std::string ds, std::string hash, std::string filename, std::string format,
            long long byte_size, std::string stored_path, std::string ingested_at) {
          result = make_document(std::move(ds), std::move(hash), std::move(filename),
                                 std::move(format), byte_size, stored_path, ingested_at);
        };
    return result;
  } catch (const sqlite::sqlite_exception& e) {
    throw DatasetRepoError(format_db_error("get_document", e));
  }
}

std::vector<DocumentRecord> DatasetRepo::get_documents(const std::string& dataset_name) {
  try {
    PooledConnection conn(db_manager_);
    std::vector<DocumentRecord> documents;
    *conn << std::string(DOCUMENT_COLUMNS) + "WHERE dataset_name = ? ORDER BY id ASC"
          << dataset_name >>
        [&](std::string ds, std::string hash, std::string filename, std::string format,
            long long byte_size, std::string stored_path, std::string ingested_at) {
          documents.push_back(make_document(std::move(ds), std::move(hash), std::move(filename),
                                            std::move(format), byte_size, stored_path,
                                            ingested_at));
        };
    return documents;
  } catch (const sqlite::sqlite_exception& e) {
    throw DatasetRepoError(format_db_error("get_documents", e));
  }
}

bool DatasetRepo::remove_document(const std::string& dataset_name,
                                  const std::string& content_hash) {
  try {
    PooledConnection conn(db_manager_);
    *conn << "DELETE FROM documents WHERE dataset_name = ? AND content_hash = ?" << dataset_name
          << content_hash;
    return conn->rows_modified() > 0;
  } catch (const sqlite::sqlite_exception& e) {
    throw DatasetRepoError(format_db_error("remove_document", e));
  }
}

size_t DatasetRepo::count_documents(const std::string& dataset_name) {
  try {
    PooledConnection conn(db_manager_);
    long long count = 0;
    *conn << "SELECT COUNT(*) FROM documents WHERE dataset_name = ?" << dataset_name >> count;
    return static_cast<size_t>(count);
  } catch (const sqlite::sqlite_exception& e) {
    throw DatasetRepoError(format_db_error("count_documents", e));
  }
}

size_t DatasetRepo::count_other_references(const std::string& database_name,
                                           const std::string& content_hash,
                                           const std::string& excluded_dataset) {
  try {
    PooledConnection conn(db_manager_);
    long long count = 0;
    *conn << "SELECT COUNT(*) FROM documents d JOIN datasets s ON d.dataset_name = s.name "
             "WHERE s.database_name = ? AND d.content_hash = ? AND d.dataset_name != ?"
          << database_name << content_hash << excluded_dataset >>
        count;
    return static_cast<size_t>(count);
  } catch (const sqlite::sqlite_exception& e) {
    throw DatasetRepoError(format_db_error("count_other_references", e));
  }
}

}  // namespace rag_core

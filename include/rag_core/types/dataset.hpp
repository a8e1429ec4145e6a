#pragma once

#include <chrono>
#include <string>

namespace rag_core {

// A named group of documents sharing one processing strategy and one database.
struct DatasetRecord {
  std::string name;
  std::string data_processing_strategy;
  std::string database_name;
  std::chrono::system_clock::time_point created_at;
};

}  // namespace rag_core

#include "rag_core/async/task_factory.hpp"

#include <nlohmann/json.hpp>
#include <stdexcept>

#include "rag_core/async/ingest_dataset_task.hpp"

namespace rag_core {

ITaskPtr TaskFactory::create_task(const IngestionTask& record) {
  if (record.task_type == IngestDatasetTask::TYPE) {
    std::vector<std::string> content_hashes;
    try {
      nlohmann::json payload = nlohmann::json::parse(record.payload);
      content_hashes = payload.at("content_hashes").get<std::vector<std::string>>();
    } catch (const nlohmann::json::exception& e) {
      throw std::invalid_argument("INGEST_DATASET task " + std::to_string(record.id) +
                                  " has a malformed payload: " + e.what());
    }
    return std::make_unique<IngestDatasetTask>(record, std::move(content_hashes));
  }

  throw std::invalid_argument("Unknown task type: " + record.task_type);
}

}  // namespace rag_core

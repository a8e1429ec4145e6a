#pragma once

#include "rag_core/async/ITask.hpp"
#include "rag_core/db/models/task_record.hpp"

namespace rag_core {

class TaskFactory {
 public:
  // Throws std::invalid_argument for unknown task types or malformed payloads.
  static ITaskPtr create_task(const IngestionTask& record);
};

}  // namespace rag_core

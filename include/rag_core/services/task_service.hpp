#pragma once

#include <memory>
#include <optional>
#include <vector>

#include "rag_core/async/ingest_dataset_task.hpp"
#include "rag_core/db/models/task_record.hpp"
#include "rag_core/types/document.hpp"

namespace rag_core {

class IngestionTaskRepo;

// Everything known about one task: state, per-file outcomes and progress.
struct TaskReport {
  IngestionTask task;
  std::vector<FileOutcome> outcomes;
  IngestionSummary counts;
  std::optional<TaskProgress> progress;
};

class TaskService {
 public:
  explicit TaskService(std::shared_ptr<IngestionTaskRepo> task_repo);

  // Throws NotFoundError for unknown ids.
  TaskReport get_task(long long task_id);

  std::vector<IngestionTask> list_tasks(std::optional<TaskStatus> status = std::nullopt,
                                        int limit = 100);

  // Pending tasks are cancelled at once; running ones stop starting new files.
  TaskReport cancel_task(long long task_id);

  // Deletes finished tasks last updated more than older_than_days ago.
  void clear_completed_tasks(int older_than_days = 7);

 private:
  std::shared_ptr<IngestionTaskRepo> task_repo_;
};

}  // namespace rag_core

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "rag_core/db/database_manager.hpp"
#include "rag_core/db/models/task_record.hpp"
#include "rag_core/types/document.hpp"

namespace rag_core {

class TaskRepoError : public std::exception {
 public:
  explicit TaskRepoError(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// The ingestion task queue and everything recorded about each task.
class IngestionTaskRepo {
 public:
  explicit IngestionTaskRepo(DatabaseManager& db_manager);

  long long create_task(const std::string& task_type, const std::string& dataset_name,
                        const std::string& payload, int priority = 10);

  // Claims the best pending task (lowest priority value, then oldest) and marks it running.
  std::optional<IngestionTask> fetch_and_claim_next_task();

  void update_task_status(long long task_id, TaskStatus new_status);
  void mark_task_as_failed(long long task_id, const std::string& error_message);

  // A pending task is cancelled on the spot; a running one gets its cancel flag
  // set. Returns false when the task does not exist.
  bool request_cancel(long long task_id);
  bool is_cancel_requested(long long task_id);

  // Running tasks left behind by a previous process go back to pending.
  int requeue_interrupted_tasks();

  void record_file_outcome(long long task_id, const FileOutcome& outcome);
  std::vector<FileOutcome> get_file_outcomes(long long task_id);

  void upsert_task_progress(long long task_id, float percent, const std::string& message);
  std::optional<TaskProgress> get_task_progress(long long task_id);

  std::optional<IngestionTask> get_task(long long task_id);
  std::vector<IngestionTask> get_tasks_by_status(TaskStatus status);
  std::vector<IngestionTask> get_all_tasks(int limit = 100);

  void clear_completed_tasks(int older_than_days = 7);

 private:
  DatabaseManager& db_manager_;
};

}  // namespace rag_core

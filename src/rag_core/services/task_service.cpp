#include "rag_core/services/task_service.hpp"

#include <iostream>
#include <stdexcept>

#include "rag_core/db/task_repo.hpp"
#include "rag_core/errors.hpp"

namespace rag_core {

TaskService::TaskService(std::shared_ptr<IngestionTaskRepo> task_repo)
    : task_repo_(std::move(task_repo)) {}

TaskReport TaskService::get_task(long long task_id) {
  std::optional<IngestionTask> task = task_repo_->get_task(task_id);
  if (!task) {
    throw NotFoundError("Task not found: " + std::to_string(task_id));
  }
  TaskReport report;
  report.task = std::move(*task);
  report.outcomes = task_repo_->get_file_outcomes(task_id);
  for (const auto& outcome : report.outcomes) {
    report.counts.add(outcome.outcome);
  }
  report.progress = task_repo_->get_task_progress(task_id);
  return report;
}

std::vector<IngestionTask> TaskService::list_tasks(std::optional<TaskStatus> status, int limit) {
  if (status) {
    return task_repo_->get_tasks_by_status(*status);
  }
  return task_repo_->get_all_tasks(limit);
}

TaskReport TaskService::cancel_task(long long task_id) {
  if (!task_repo_->request_cancel(task_id)) {
    throw NotFoundError("Task not found: " + std::to_string(task_id));
  }
  std::cout << "[TaskService] Cancellation requested for task " << task_id << std::endl;
  return get_task(task_id);
}

void TaskService::clear_completed_tasks(int older_than_days) {
  if (older_than_days < 0) {
    throw std::invalid_argument("older_than_days must not be negative");
  }
  task_repo_->clear_completed_tasks(older_than_days);
}

}  // namespace rag_core

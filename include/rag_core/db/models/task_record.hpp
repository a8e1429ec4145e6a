#pragma once

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace rag_core {

enum class TaskStatus { PENDING, RUNNING, SUCCEEDED, FAILED, PARTIAL, CANCELLED };

inline std::string to_string(TaskStatus status) {
  switch (status) {
    case TaskStatus::PENDING: return "pending";
    case TaskStatus::RUNNING: return "running";
    case TaskStatus::SUCCEEDED: return "succeeded";
    case TaskStatus::FAILED: return "failed";
    case TaskStatus::PARTIAL: return "partial";
    case TaskStatus::CANCELLED: return "cancelled";
  }
  return "unknown";
}

inline TaskStatus task_status_from_string(const std::string& str) {
  if (str == "pending") return TaskStatus::PENDING;
  if (str == "running") return TaskStatus::RUNNING;
  if (str == "succeeded") return TaskStatus::SUCCEEDED;
  if (str == "failed") return TaskStatus::FAILED;
  if (str == "partial") return TaskStatus::PARTIAL;
  if (str == "cancelled") return TaskStatus::CANCELLED;
  throw std::invalid_argument("Invalid TaskStatus string: " + str);
}

inline bool is_terminal(TaskStatus status) {
  return status != TaskStatus::PENDING && status != TaskStatus::RUNNING;
}

struct IngestionTask {
  long long id = 0;
  std::string task_type;
  TaskStatus status = TaskStatus::PENDING;
  int priority = 10;
  std::string dataset_name;
  std::string payload;  // JSON text, shape depends on task_type
  bool cancel_requested = false;
  std::string error_message;
  std::chrono::system_clock::time_point created_at;
  std::chrono::system_clock::time_point updated_at;
};

struct TaskProgress {
  long long task_id = 0;
  float progress_percent = 0.0f;
  std::string status_message;
  int64_t updated_at = 0;  // unix seconds
};

}  // namespace rag_core

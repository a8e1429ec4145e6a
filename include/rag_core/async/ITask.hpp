#pragma once

#include <functional>
#include <memory>
#include <string>
#include <utility>

#include "rag_core/db/models/task_record.hpp"

namespace rag_core {

class ServiceProvider;

// Called with a percentage in [0, 100] and a short status line.
using ProgressUpdater = std::function<void(float, const std::string&)>;

struct TaskResult {
  TaskStatus status = TaskStatus::SUCCEEDED;
  std::string summary;
};

// Executable form of a claimed queue row. The row is captured when the worker
// claims it; cancellation and progress go through the task repository, not
// through this copy.
class ITask {
 public:
  explicit ITask(IngestionTask record) : record_(std::move(record)) {}
  virtual ~ITask() = default;

  ITask(const ITask&) = delete;
  ITask& operator=(const ITask&) = delete;

  // Returns the final state to persist. Throwing marks the task FAILED with
  // the exception text as its error.
  virtual TaskResult execute(ServiceProvider& services, const ProgressUpdater& on_progress) = 0;

  virtual const char* type() const = 0;

  long long id() const {
    return record_.id;
  }
  const std::string& dataset_name() const {
    return record_.dataset_name;
  }
  int priority() const {
    return record_.priority;
  }
  const IngestionTask& record() const {
    return record_;
  }

 protected:
  IngestionTask record_;
};

using ITaskPtr = std::unique_ptr<ITask>;

}  // namespace rag_core

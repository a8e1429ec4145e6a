#include "rag_core/async/worker.hpp"

#include <iostream>
#include <optional>
#include <stdexcept>

#include "rag_core/async/ITask.hpp"
#include "rag_core/async/service_provider.hpp"
#include "rag_core/async/task_factory.hpp"
#include "rag_core/db/task_repo.hpp"

namespace rag_core {
namespace async {

Worker::Worker(int worker_id, std::shared_ptr<ServiceProvider> services,
               std::chrono::milliseconds poll_interval)
    : worker_id_(worker_id), services_(std::move(services)), poll_interval_(poll_interval) {
  std::cout << "Worker [" << worker_id_ << "] created." << std::endl;
}

Worker::~Worker() {
  stop();
  join();
}

void Worker::join() {
  if (thread_.joinable()) {
    thread_.join();
    std::cout << "Worker [" << worker_id_ << "] joined." << std::endl;
  }
}

void Worker::start() {
  if (thread_.joinable()) {
    throw std::runtime_error("Worker is already running.");
  }
  should_stop_.store(false);
  thread_ = std::thread(&Worker::run_loop, this);
}

void Worker::stop() {
  should_stop_.store(true);
}

void Worker::run_loop() {
  std::cout << "Worker [" << worker_id_ << "] starting run loop." << std::endl;
  while (!should_stop_.load()) {
    bool found = false;
    try {
      found = run_one_task();
    } catch (const std::exception& e) {
      // The queue itself failed (e.g. database locked); try again next poll.
      std::cerr << "Worker [" << worker_id_ << "] queue error: " << e.what() << std::endl;
    }
    if (!found) {
      std::this_thread::sleep_for(poll_interval_);
    }
  }
  std::cout << "Worker [" << worker_id_ << "] run loop terminated." << std::endl;
}

bool Worker::run_one_task() {
  IngestionTaskRepo& task_repo = services_->get_task_repo();
  std::optional<IngestionTask> record = task_repo.fetch_and_claim_next_task();
  if (!record) {
    return false;
  }

  std::cout << "Worker [" << worker_id_ << "] claimed task " << record->id << " ("
            << record->task_type << ", dataset " << record->dataset_name << ")" << std::endl;
  try {
    ITaskPtr task = TaskFactory::create_task(*record);
    ProgressUpdater on_progress = [&](float p, const std::string& msg) {
      task_repo.upsert_task_progress(record->id, p * 100.0f, msg);
    };

    TaskResult result = task->execute(*services_, on_progress);
    if (result.status == TaskStatus::FAILED) {
      task_repo.mark_task_as_failed(record->id, result.summary);
    } else {
      task_repo.update_task_status(record->id, result.status);
    }
    task_repo.upsert_task_progress(record->id, 100.0f, result.summary);
  } catch (const std::exception& e) {
    std::cerr << "Worker [" << worker_id_ << "] ERROR processing task " << record->id << ": "
              << e.what() << std::endl;
    task_repo.mark_task_as_failed(record->id, e.what());
  }
  return true;
}

}  // namespace async
}  // namespace rag_core

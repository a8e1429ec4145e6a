#pragma once

#include <chrono>
#include <memory>
#include <vector>

#include "rag_core/async/worker.hpp"

namespace rag_core::async {

/**
 * @brief Fixed set of workers draining the ingestion queue.
 *
 * stop() signals every worker before joining any of them, so shutdown takes as
 * long as the slowest in-flight task rather than the sum of them.
 */
class WorkerPool {
 public:
  WorkerPool(size_t worker_count, std::shared_ptr<ServiceProvider> services,
             std::chrono::milliseconds poll_interval = Worker::DEFAULT_POLL_INTERVAL);
  ~WorkerPool();

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  void start();
  // Blocks until every in-flight task has finished.
  void stop();

  size_t size() const {
    return workers_.size();
  }
  bool is_running() const {
    return running_;
  }

 private:
  std::vector<std::unique_ptr<Worker>> workers_;
  bool running_ = false;
};

}  // namespace rag_core::async

#include "rag_core/async/worker_pool.hpp"

#include <iostream>
#include <stdexcept>

namespace rag_core::async {

WorkerPool::WorkerPool(size_t worker_count, std::shared_ptr<ServiceProvider> services,
                       std::chrono::milliseconds poll_interval) {
  if (worker_count == 0) {
    throw std::invalid_argument("WorkerPool needs at least one worker");
  }
  workers_.reserve(worker_count);
  for (size_t id = 0; id < worker_count; ++id) {
    workers_.push_back(std::make_unique<Worker>(static_cast<int>(id), services, poll_interval));
  }
}

WorkerPool::~WorkerPool() {
  stop();
}

void WorkerPool::start() {
  if (running_) {
    return;
  }
  for (auto& worker : workers_) {
    worker->start();
  }
  running_ = true;
  std::cout << "WorkerPool: " << workers_.size() << " workers polling the ingestion queue"
            << std::endl;
}

void WorkerPool::stop() {
  if (!running_) {
    return;
  }
  for (auto& worker : workers_) {
    worker->stop();
  }
  for (auto& worker : workers_) {
    worker->join();
  }
  running_ = false;
  std::cout << "WorkerPool: all workers stopped" << std::endl;
}

}  // namespace rag_core::async

#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

namespace rag_core {
class ServiceProvider;
}

namespace rag_core {
namespace async {

/**
 * @class Worker
 * @brief A background thread that claims ingestion tasks from the queue and runs them.
 *
 * The worker polls the task queue, executes the claimed task and records its
 * final state. When the queue is empty it sleeps for the poll interval.
 * Non-copyable and non-movable so the thread has a single owner.
 */
class Worker {
 public:
  static constexpr std::chrono::milliseconds DEFAULT_POLL_INTERVAL{500};

  Worker(int worker_id, std::shared_ptr<ServiceProvider> services,
         std::chrono::milliseconds poll_interval = DEFAULT_POLL_INTERVAL);

  /**
   * @brief Stops the loop and joins the thread. The current task finishes first.
   */
  ~Worker();

  /**
   * @brief Starts the processing loop in a new thread. Throws if already running.
   */
  void start();

  /**
   * @brief Asks the loop to exit after its current task. Does not block.
   */
  void stop();

  // Waits for the loop to exit. No-op if the thread was never started.
  void join();

  // Claims and runs at most one task on the calling thread. Returns false when
  // the queue was empty.
  bool run_one_task();

  Worker(const Worker&) = delete;
  Worker& operator=(const Worker&) = delete;
  Worker(Worker&&) = delete;
  Worker& operator=(Worker&&) = delete;

 private:
  void run_loop();

  int worker_id_;
  std::shared_ptr<ServiceProvider> services_;
  std::chrono::milliseconds poll_interval_;
  std::atomic<bool> should_stop_{false};
  std::thread thread_;
};

}  // namespace async
}  // namespace rag_core

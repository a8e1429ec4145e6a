#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <thread>

#include "common/utilities_test.hpp"
#include "rag_core/async/worker_pool.hpp"

namespace rag_tests {

using namespace rag_core;
using namespace rag_core::async;

class WorkerPoolTest : public ServiceTestBase {
 protected:
  // Polls the task until it leaves pending/running or the deadline passes.
  TaskStatus wait_for_terminal(long long task_id, std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
      auto task = task_repo_->get_task(task_id);
      if (task && is_terminal(task->status)) {
        return task->status;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return task_repo_->get_task(task_id)->status;
  }
};

TEST_F(WorkerPoolTest, ConstructorThrowsOnZeroThreads) {
  EXPECT_THROW({ WorkerPool pool(0, provider_); }, std::invalid_argument);
}

TEST_F(WorkerPoolTest, StopWithoutStartIsNoOp) {
  EXPECT_NO_THROW({
    WorkerPool pool(1, provider_);
    pool.stop();
  });
}

TEST_F(WorkerPoolTest, StartThenStopLifecycle_NoTasks) {
  EXPECT_NO_THROW({
    WorkerPool pool(2, provider_, std::chrono::milliseconds(10));
    EXPECT_EQ(pool.size(), 2u);
    pool.start();
    EXPECT_TRUE(pool.is_running());
    std::this_thread::sleep_for(std::chrono::milliseconds(25));
    pool.stop();
    EXPECT_FALSE(pool.is_running());
  });
}

TEST_F(WorkerPoolTest, StartTwiceIsNoThrow) {
  WorkerPool pool(1, provider_, std::chrono::milliseconds(10));
  pool.start();
  EXPECT_NO_THROW(pool.start());
  pool.stop();
}

TEST_F(WorkerPoolTest, DrainsQueuedTask) {
  dataset_service_->create_dataset("notes", "standard", "docs_db");
  dataset_service_->upload_file("notes", "a.txt", "Worker pools drain the ingestion queue.\n");
  long long task_id = dataset_service_->process_dataset("notes");

  {
    WorkerPool pool(2, provider_, std::chrono::milliseconds(10));
    pool.start();
    EXPECT_EQ(wait_for_terminal(task_id, std::chrono::seconds(10)), TaskStatus::SUCCEEDED);
    pool.stop();
  }

  EXPECT_EQ(task_repo_->get_file_outcomes(task_id).size(), 1u);
}

}  // namespace rag_tests

#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "common/utilities_test.hpp"
#include "rag_core/async/ingest_dataset_task.hpp"
#include "rag_core/async/worker.hpp"

namespace rag_tests {

using namespace rag_core;
using namespace rag_core::async;

class WorkerTest : public ServiceTestBase {
 protected:
  void SetUp() override {
    ServiceTestBase::SetUp();
    worker_ = std::make_unique<Worker>(1, provider_);
  }

  void TearDown() override {
    worker_.reset();
    ServiceTestBase::TearDown();
  }

  std::unique_ptr<Worker> worker_;
};

TEST_F(WorkerTest, RunOneTaskWithNoPendingTasks) {
  EXPECT_FALSE(worker_->run_one_task());
}

TEST_F(WorkerTest, RunOneTaskRecordsSuccessAndProgress) {
  dataset_service_->create_dataset("notes", "standard", "docs_db");
  dataset_service_->upload_file("notes", "a.txt", "Alpha notes on vector search.\n");
  dataset_service_->upload_file("notes", "b.md", "# Beta\n\nBeta notes on chunking.\n");
  long long task_id = dataset_service_->process_dataset("notes");

  EXPECT_TRUE(worker_->run_one_task());

  auto task = task_repo_->get_task(task_id);
  ASSERT_TRUE(task.has_value());
  EXPECT_EQ(task->status, TaskStatus::SUCCEEDED);
  auto progress = task_repo_->get_task_progress(task_id);
  ASSERT_TRUE(progress.has_value());
  EXPECT_FLOAT_EQ(progress->progress_percent, 100.0f);
  EXPECT_EQ(progress->status_message,
            "2 processed, 0 duplicate, 0 unsupported, 0 failed, 0 cancelled");
  EXPECT_FALSE(worker_->run_one_task());
}

TEST_F(WorkerTest, AllFilesFailingMarksTaskFailedWithSummary) {
  dataset_service_->create_dataset("notes", "standard", "docs_db");
  dataset_service_->upload_file("notes", "broken.csv", "name,value\n\"open,1\n");
  long long task_id = dataset_service_->process_dataset("notes");

  EXPECT_TRUE(worker_->run_one_task());

  auto task = task_repo_->get_task(task_id);
  EXPECT_EQ(task->status, TaskStatus::FAILED);
  EXPECT_EQ(task->error_message, "0 processed, 0 duplicate, 0 unsupported, 1 failed, 0 cancelled");
}

TEST_F(WorkerTest, UnknownTaskTypeMarksTaskFailed) {
  long long task_id = task_repo_->create_task("REINDEX", "notes", "{}");

  EXPECT_TRUE(worker_->run_one_task());

  auto task = task_repo_->get_task(task_id);
  EXPECT_EQ(task->status, TaskStatus::FAILED);
  EXPECT_EQ(task->error_message, "Unknown task type: REINDEX");
}

TEST_F(WorkerTest, ExceptionDuringExecuteMarksTaskFailed) {
  long long task_id =
      task_repo_->create_task(IngestDatasetTask::TYPE, "ghost", IngestDatasetTask::make_payload({}));

  EXPECT_TRUE(worker_->run_one_task());

  auto task = task_repo_->get_task(task_id);
  EXPECT_EQ(task->status, TaskStatus::FAILED);
  EXPECT_EQ(task->error_message, "Dataset not found: ghost");
}

TEST_F(WorkerTest, StartTwiceThrows) {
  worker_->start();
  EXPECT_THROW(worker_->start(), std::runtime_error);
  worker_->stop();
}

}  // namespace rag_tests

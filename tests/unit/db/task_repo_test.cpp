#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <vector>

#include "common/utilities_test.hpp"
#include "rag_core/db/models/task_record.hpp"

namespace rag_tests {

using namespace rag_core;

class IngestionTaskRepoTest : public DatabaseTestBase {};

TEST_F(IngestionTaskRepoTest, CreateTask_BasicFunctionality) {
  long long task_id = task_repo_->create_task("INGEST_FILES", "notes", R"({"files":[]})", 5);

  EXPECT_GT(task_id, 0);

  auto pending_tasks = task_repo_->get_tasks_by_status(TaskStatus::PENDING);
  ASSERT_EQ(pending_tasks.size(), 1);
  EXPECT_EQ(pending_tasks[0].id, task_id);
  EXPECT_EQ(pending_tasks[0].task_type, "INGEST_FILES");
  EXPECT_EQ(pending_tasks[0].dataset_name, "notes");
  EXPECT_EQ(pending_tasks[0].payload, R"({"files":[]})");
  EXPECT_EQ(pending_tasks[0].status, TaskStatus::PENDING);
  EXPECT_EQ(pending_tasks[0].priority, 5);
  EXPECT_FALSE(pending_tasks[0].cancel_requested);
}

TEST_F(IngestionTaskRepoTest, CreateTask_DefaultPriority) {
  task_repo_->create_task("INGEST_FILES", "notes", "{}");

  auto pending_tasks = task_repo_->get_tasks_by_status(TaskStatus::PENDING);
  ASSERT_EQ(pending_tasks.size(), 1);
  EXPECT_EQ(pending_tasks[0].priority, 10);
}

TEST_F(IngestionTaskRepoTest, FetchAndClaimNextTask_LowestPriorityValueFirst) {
  task_repo_->create_task("INGEST_FILES", "a", "{}", 5);
  long long urgent = task_repo_->create_task("INGEST_FILES", "b", "{}", 1);
  task_repo_->create_task("INGEST_FILES", "c", "{}", 10);

  auto claimed = task_repo_->fetch_and_claim_next_task();

  ASSERT_TRUE(claimed.has_value());
  EXPECT_EQ(claimed->id, urgent);
  EXPECT_EQ(claimed->status, TaskStatus::RUNNING);

  auto running = task_repo_->get_tasks_by_status(TaskStatus::RUNNING);
  ASSERT_EQ(running.size(), 1);
  EXPECT_EQ(running[0].id, urgent);
}

TEST_F(IngestionTaskRepoTest, FetchAndClaimNextTask_SamePriorityInCreationOrder) {
  long long first = task_repo_->create_task("INGEST_FILES", "a", "{}", 10);
  long long second = task_repo_->create_task("INGEST_FILES", "a", "{}", 10);

  EXPECT_EQ(task_repo_->fetch_and_claim_next_task()->id, first);
  EXPECT_EQ(task_repo_->fetch_and_claim_next_task()->id, second);
  EXPECT_FALSE(task_repo_->fetch_and_claim_next_task().has_value());
}

TEST_F(IngestionTaskRepoTest, FetchAndClaimNextTask_NoTasksAvailable) {
  EXPECT_FALSE(task_repo_->fetch_and_claim_next_task().has_value());
}

TEST_F(IngestionTaskRepoTest, UpdateStatusAndFailure) {
  long long ok = task_repo_->create_task("INGEST_FILES", "a", "{}");
  long long bad = task_repo_->create_task("INGEST_FILES", "a", "{}");

  task_repo_->update_task_status(ok, TaskStatus::SUCCEEDED);
  task_repo_->mark_task_as_failed(bad, "disk full");

  EXPECT_EQ(task_repo_->get_task(ok)->status, TaskStatus::SUCCEEDED);
  auto failed = task_repo_->get_task(bad);
  EXPECT_EQ(failed->status, TaskStatus::FAILED);
  EXPECT_EQ(failed->error_message, "disk full");
  EXPECT_FALSE(task_repo_->get_task(9999).has_value());
}

TEST_F(IngestionTaskRepoTest, RequestCancel_PendingTaskIsCancelledImmediately) {
  long long task_id = task_repo_->create_task("INGEST_FILES", "a", "{}");

  EXPECT_TRUE(task_repo_->request_cancel(task_id));

  auto task = task_repo_->get_task(task_id);
  EXPECT_EQ(task->status, TaskStatus::CANCELLED);
  EXPECT_TRUE(task->cancel_requested);
  EXPECT_FALSE(task_repo_->fetch_and_claim_next_task().has_value());
}

TEST_F(IngestionTaskRepoTest, RequestCancel_RunningTaskOnlyGetsFlag) {
  long long task_id = task_repo_->create_task("INGEST_FILES", "a", "{}");
  task_repo_->fetch_and_claim_next_task();

  EXPECT_FALSE(task_repo_->is_cancel_requested(task_id));
  EXPECT_TRUE(task_repo_->request_cancel(task_id));

  EXPECT_EQ(task_repo_->get_task(task_id)->status, TaskStatus::RUNNING);
  EXPECT_TRUE(task_repo_->is_cancel_requested(task_id));
}

TEST_F(IngestionTaskRepoTest, RequestCancel_FinishedTaskUnchanged) {
  long long task_id = task_repo_->create_task("INGEST_FILES", "a", "{}");
  task_repo_->update_task_status(task_id, TaskStatus::SUCCEEDED);

  EXPECT_TRUE(task_repo_->request_cancel(task_id));
  EXPECT_EQ(task_repo_->get_task(task_id)->status, TaskStatus::SUCCEEDED);
}

TEST_F(IngestionTaskRepoTest, RequestCancel_MissingTask) {
  EXPECT_FALSE(task_repo_->request_cancel(424242));
}

TEST_F(IngestionTaskRepoTest, RequeueInterruptedTasks) {
  long long a = task_repo_->create_task("INGEST_FILES", "a", "{}");
  long long b = task_repo_->create_task("INGEST_FILES", "a", "{}");
  task_repo_->create_task("INGEST_FILES", "a", "{}");
  task_repo_->update_task_status(a, TaskStatus::RUNNING);
  task_repo_->update_task_status(b, TaskStatus::RUNNING);

  EXPECT_EQ(task_repo_->requeue_interrupted_tasks(), 2);
  EXPECT_EQ(task_repo_->get_tasks_by_status(TaskStatus::PENDING).size(), 3u);
  EXPECT_EQ(task_repo_->requeue_interrupted_tasks(), 0);
}

TEST_F(IngestionTaskRepoTest, RequeueDropsPartialResultsOfInterruptedRun) {
  long long interrupted = task_repo_->create_task("INGEST_FILES", "a", "{}");
  long long finished = task_repo_->create_task("INGEST_FILES", "a", "{}");
  FileOutcome outcome;
  outcome.filename = "a.md";
  outcome.outcome = FileOutcomeKind::PROCESSED;
  task_repo_->update_task_status(interrupted, TaskStatus::RUNNING);
  task_repo_->record_file_outcome(interrupted, outcome);
  task_repo_->upsert_task_progress(interrupted, 33.0f, "1 of 3 files");
  task_repo_->record_file_outcome(finished, outcome);
  task_repo_->upsert_task_progress(finished, 100.0f, "done");
  task_repo_->update_task_status(finished, TaskStatus::SUCCEEDED);

  ASSERT_EQ(task_repo_->requeue_interrupted_tasks(), 1);

  EXPECT_EQ(task_repo_->get_task(interrupted)->status, TaskStatus::PENDING);
  EXPECT_TRUE(task_repo_->get_file_outcomes(interrupted).empty());
  EXPECT_FALSE(task_repo_->get_task_progress(interrupted).has_value());
  EXPECT_EQ(task_repo_->get_file_outcomes(finished).size(), 1u);
  EXPECT_TRUE(task_repo_->get_task_progress(finished).has_value());
}

TEST_F(IngestionTaskRepoTest, FileOutcomesKeepInsertionOrder) {
  long long task_id = task_repo_->create_task("INGEST_FILES", "a", "{}");
  FileOutcome processed;
  processed.filename = "a.md";
  processed.content_hash = "abc";
  processed.outcome = FileOutcomeKind::PROCESSED;
  processed.chunk_count = 4;
  processed.extraction_failures = 1;
  FileOutcome unsupported;
  unsupported.filename = "b.png";
  unsupported.outcome = FileOutcomeKind::SKIPPED_UNSUPPORTED;
  unsupported.detail = "no parser for format binary";

  task_repo_->record_file_outcome(task_id, processed);
  task_repo_->record_file_outcome(task_id, unsupported);

  auto outcomes = task_repo_->get_file_outcomes(task_id);
  ASSERT_EQ(outcomes.size(), 2u);
  EXPECT_EQ(outcomes[0].filename, "a.md");
  EXPECT_EQ(outcomes[0].content_hash, "abc");
  EXPECT_EQ(outcomes[0].outcome, FileOutcomeKind::PROCESSED);
  EXPECT_EQ(outcomes[0].chunk_count, 4);
  EXPECT_EQ(outcomes[0].extraction_failures, 1);
  EXPECT_EQ(outcomes[1].outcome, FileOutcomeKind::SKIPPED_UNSUPPORTED);
  EXPECT_EQ(outcomes[1].detail, "no parser for format binary");
  EXPECT_TRUE(task_repo_->get_file_outcomes(task_id + 1).empty());
}

TEST_F(IngestionTaskRepoTest, ProgressUpsertOverwrites) {
  long long task_id = task_repo_->create_task("INGEST_FILES", "a", "{}");
  EXPECT_FALSE(task_repo_->get_task_progress(task_id).has_value());

  task_repo_->upsert_task_progress(task_id, 25.0f, "1/4 files");
  task_repo_->upsert_task_progress(task_id, 50.0f, "2/4 files");

  auto progress = task_repo_->get_task_progress(task_id);
  ASSERT_TRUE(progress.has_value());
  EXPECT_FLOAT_EQ(progress->progress_percent, 50.0f);
  EXPECT_EQ(progress->status_message, "2/4 files");
  EXPECT_GT(progress->updated_at, 0);
}

TEST_F(IngestionTaskRepoTest, GetAllTasksNewestFirst) {
  long long first = task_repo_->create_task("INGEST_FILES", "a", "{}");
  long long second = task_repo_->create_task("INGEST_FILES", "a", "{}");

  auto tasks = task_repo_->get_all_tasks();
  ASSERT_EQ(tasks.size(), 2u);
  EXPECT_EQ(tasks[0].id, second);
  EXPECT_EQ(tasks[1].id, first);
  EXPECT_EQ(task_repo_->get_all_tasks(1).size(), 1u);
}

TEST_F(IngestionTaskRepoTest, ClearCompletedTasksKeepsActiveOnes) {
  long long done = task_repo_->create_task("INGEST_FILES", "a", "{}");
  long long partial = task_repo_->create_task("INGEST_FILES", "a", "{}");
  long long pending = task_repo_->create_task("INGEST_FILES", "a", "{}");
  task_repo_->update_task_status(done, TaskStatus::SUCCEEDED);
  task_repo_->update_task_status(partial, TaskStatus::PARTIAL);
  task_repo_->upsert_task_progress(done, 100.0f, "done");

  task_repo_->clear_completed_tasks(7);
  EXPECT_EQ(task_repo_->get_all_tasks().size(), 3u);

  task_repo_->clear_completed_tasks(0);
  EXPECT_FALSE(task_repo_->get_task(done).has_value());
  EXPECT_FALSE(task_repo_->get_task(partial).has_value());
  EXPECT_TRUE(task_repo_->get_task(pending).has_value());
  EXPECT_FALSE(task_repo_->get_task_progress(done).has_value());
}

TEST(TaskStatusTest, StringConversions) {
  EXPECT_EQ(to_string(TaskStatus::PARTIAL), "partial");
  EXPECT_EQ(task_status_from_string("cancelled"), TaskStatus::CANCELLED);
  EXPECT_THROW(task_status_from_string("PROCESSING"), std::invalid_argument);
  EXPECT_TRUE(is_terminal(TaskStatus::FAILED));
  EXPECT_FALSE(is_terminal(TaskStatus::RUNNING));
}

}  // namespace rag_tests

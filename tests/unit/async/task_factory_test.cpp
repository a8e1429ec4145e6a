#include <gtest/gtest.h>

#include <chrono>
#include <memory>

#include "rag_core/async/ingest_dataset_task.hpp"
#include "rag_core/async/task_factory.hpp"
#include "rag_core/db/models/task_record.hpp"

namespace rag_tests {

using namespace rag_core;

class TaskFactoryTest : public ::testing::Test {
 protected:
  IngestionTask create_test_record(const std::string& task_type, const std::string& payload) {
    IngestionTask task;
    task.id = 123;
    task.task_type = task_type;
    task.status = TaskStatus::PENDING;
    task.priority = 5;
    task.dataset_name = "notes";
    task.payload = payload;
    task.created_at = std::chrono::system_clock::now();
    task.updated_at = std::chrono::system_clock::now();
    return task;
  }
};

TEST_F(TaskFactoryTest, CreateTask_IngestDatasetTask) {
  IngestionTask record = create_test_record(
      IngestDatasetTask::TYPE, IngestDatasetTask::make_payload({"hash_a", "hash_b"}));

  ITaskPtr task = TaskFactory::create_task(record);

  ASSERT_NE(task, nullptr);
  EXPECT_STREQ(task->type(), "INGEST_DATASET");
  EXPECT_EQ(task->id(), 123);
  EXPECT_EQ(task->priority(), 5);
  EXPECT_EQ(task->dataset_name(), "notes");

  auto* ingest_task = dynamic_cast<IngestDatasetTask*>(task.get());
  ASSERT_NE(ingest_task, nullptr);
  EXPECT_EQ(ingest_task->content_hashes(), (std::vector<std::string>{"hash_a", "hash_b"}));
}

TEST_F(TaskFactoryTest, CreateTask_EmptyFileList) {
  ITaskPtr task =
      TaskFactory::create_task(create_test_record(IngestDatasetTask::TYPE, R"({"content_hashes":[]})"));

  auto* ingest_task = dynamic_cast<IngestDatasetTask*>(task.get());
  ASSERT_NE(ingest_task, nullptr);
  EXPECT_TRUE(ingest_task->content_hashes().empty());
}

TEST_F(TaskFactoryTest, CreateTask_MalformedPayloadThrows) {
  EXPECT_THROW(TaskFactory::create_task(create_test_record(IngestDatasetTask::TYPE, "not json")),
               std::invalid_argument);
  EXPECT_THROW(TaskFactory::create_task(create_test_record(IngestDatasetTask::TYPE, "{}")),
               std::invalid_argument);
  EXPECT_THROW(TaskFactory::create_task(
                   create_test_record(IngestDatasetTask::TYPE, R"({"content_hashes":[1,2]})")),
               std::invalid_argument);
}

TEST_F(TaskFactoryTest, CreateTask_UnknownTypeThrows) {
  EXPECT_THROW(TaskFactory::create_task(create_test_record("PROCESS_FILE", "{}")),
               std::invalid_argument);
}

TEST(IngestDatasetTaskPayloadTest, MakePayloadListsHashes) {
  EXPECT_EQ(IngestDatasetTask::make_payload({"a", "b"}), R"({"content_hashes":["a","b"]})");
  EXPECT_EQ(IngestDatasetTask::make_payload({}), R"({"content_hashes":[]})");
}

TEST(IngestionSummaryTest, FinalStatusRules) {
  IngestionSummary all_processed;
  all_processed.add(FileOutcomeKind::PROCESSED);
  all_processed.add(FileOutcomeKind::SKIPPED_DUPLICATE);
  EXPECT_EQ(all_processed.final_status(false), TaskStatus::SUCCEEDED);
  EXPECT_EQ(all_processed.final_status(true), TaskStatus::CANCELLED);

  IngestionSummary mixed = all_processed;
  mixed.add(FileOutcomeKind::FAILED);
  EXPECT_EQ(mixed.final_status(false), TaskStatus::PARTIAL);

  IngestionSummary nothing_usable;
  nothing_usable.add(FileOutcomeKind::FAILED);
  nothing_usable.add(FileOutcomeKind::SKIPPED_UNSUPPORTED);
  EXPECT_EQ(nothing_usable.final_status(false), TaskStatus::FAILED);

  IngestionSummary duplicates_and_unsupported;
  duplicates_and_unsupported.add(FileOutcomeKind::SKIPPED_DUPLICATE);
  duplicates_and_unsupported.add(FileOutcomeKind::SKIPPED_UNSUPPORTED);
  EXPECT_EQ(duplicates_and_unsupported.final_status(false), TaskStatus::PARTIAL);

  EXPECT_EQ(IngestionSummary().final_status(false), TaskStatus::SUCCEEDED);
}

TEST(IngestionSummaryTest, DescribeAndTotal) {
  IngestionSummary summary;
  summary.add(FileOutcomeKind::PROCESSED);
  summary.add(FileOutcomeKind::PROCESSED);
  summary.add(FileOutcomeKind::CANCELLED);

  EXPECT_EQ(summary.total(), 3u);
  EXPECT_EQ(summary.describe(),
            "2 processed, 0 duplicate, 0 unsupported, 0 failed, 1 cancelled");
}

}  // namespace rag_tests

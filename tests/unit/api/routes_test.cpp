#include <gtest/gtest.h>

#include "common/utilities_test.hpp"
#include "rag_api/routes.hpp"
#include "rag_core/hashing/content_hasher.hpp"

namespace rag_tests {

using namespace rag_core;

class RoutesTest : public ServiceTestBase {
 protected:
  void SetUp() override {
    ServiceTestBase::SetUp();
    routes_ = std::make_unique<rag_api::Routes>(dataset_service_, query_service_, task_service_,
                                                resolver_);
  }

  void TearDown() override {
    routes_.reset();
    ServiceTestBase::TearDown();
  }

  static crow::request request(const std::string& body = "", const std::string& query = "") {
    crow::request req;
    req.body = body;
    if (!query.empty()) {
      req.url_params = crow::query_string(query);
    }
    return req;
  }

  static nlohmann::json body_of(const crow::response& response) {
    return nlohmann::json::parse(response.body);
  }

  void create_notes() {
    crow::response response = routes_->handle_create_dataset(request(
        R"({"name":"notes","data_processing_strategy":"standard","database":"docs_db"})"));
    ASSERT_EQ(response.code, 201);
  }

  std::unique_ptr<rag_api::Routes> routes_;
};

TEST_F(RoutesTest, HealthCheckListsConfiguration) {
  crow::response response = routes_->handle_health_check(request());

  EXPECT_EQ(response.code, 200);
  nlohmann::json body = body_of(response);
  EXPECT_EQ(body["success"], true);
  EXPECT_EQ(body["status"], "healthy");
  EXPECT_EQ(body["databases"], nlohmann::json({"docs_db"}));
  EXPECT_EQ(body["data_processing_strategies"], nlohmann::json({"standard"}));
}

TEST_F(RoutesTest, CreateAndListDatasets) {
  create_notes();

  crow::response response = routes_->handle_list_datasets(request());

  EXPECT_EQ(response.code, 200);
  nlohmann::json body = body_of(response);
  ASSERT_EQ(body["data"].size(), 1u);
  EXPECT_EQ(body["data"][0]["name"], "notes");
  EXPECT_EQ(body["data"][0]["database"], "docs_db");
}

TEST_F(RoutesTest, CreateDatasetErrors) {
  create_notes();

  crow::response duplicate = routes_->handle_create_dataset(request(
      R"({"name":"notes","data_processing_strategy":"standard","database":"docs_db"})"));
  EXPECT_EQ(duplicate.code, 400);
  EXPECT_EQ(body_of(duplicate)["error_type"], "invalid_argument");

  crow::response unknown_db = routes_->handle_create_dataset(
      request(R"({"name":"b","data_processing_strategy":"standard","database":"nope"})"));
  EXPECT_EQ(unknown_db.code, 400);
  EXPECT_EQ(body_of(unknown_db)["error_type"], "configuration_error");

  crow::response missing_field = routes_->handle_create_dataset(request(R"({"name":"b"})"));
  EXPECT_EQ(missing_field.code, 400);
  EXPECT_EQ(body_of(missing_field)["error_type"], "invalid_json");

  crow::response malformed = routes_->handle_create_dataset(request("{ nope"));
  EXPECT_EQ(malformed.code, 400);
  EXPECT_EQ(body_of(malformed)["success"], false);

  EXPECT_EQ(routes_->handle_create_dataset(request()).code, 400);
}

TEST_F(RoutesTest, UploadThenGetDataset) {
  create_notes();
  const std::string content = "# Guide\n\nRebuild the vector index nightly.\n";

  crow::response uploaded =
      routes_->handle_upload_file(request(content, "?filename=guide.md"), "notes");
  EXPECT_EQ(uploaded.code, 201);
  EXPECT_EQ(body_of(uploaded)["data"]["content_hash"], ContentHasher::sha256_hex(content));
  EXPECT_EQ(body_of(uploaded)["data"]["processed"], false);

  crow::response again =
      routes_->handle_upload_file(request(content, "?filename=copy.md"), "notes");
  EXPECT_EQ(again.code, 200);
  EXPECT_EQ(body_of(again)["data"]["skipped"], true);

  nlohmann::json info = body_of(routes_->handle_get_dataset(request(), "notes"));
  EXPECT_EQ(info["data"]["document_count"], 1);
  EXPECT_EQ(info["data"]["documents"][0]["filename"], "guide.md");
}

TEST_F(RoutesTest, UploadErrors) {
  create_notes();

  EXPECT_EQ(routes_->handle_upload_file(request("x"), "notes").code, 400);
  EXPECT_EQ(routes_->handle_upload_file(request("x", "?filename=../a.txt"), "notes").code, 400);

  crow::response ghost = routes_->handle_upload_file(request("x", "?filename=a.txt"), "ghost");
  EXPECT_EQ(ghost.code, 404);
  EXPECT_EQ(body_of(ghost)["error_type"], "not_found");
}

TEST_F(RoutesTest, UploadWithProcessThenQuery) {
  create_notes();
  crow::response uploaded = routes_->handle_upload_file(
      request("# Guide\n\nRebuild the vector index nightly.\n", "?filename=guide.md&process=true"),
      "notes");
  ASSERT_EQ(uploaded.code, 201);
  EXPECT_EQ(body_of(uploaded)["data"]["outcome"]["outcome"], "processed");

  crow::response response = routes_->handle_query(
      request(R"({"database":"docs_db","query":"rebuild vector index","top_k":1})"));

  EXPECT_EQ(response.code, 200);
  nlohmann::json body = body_of(response);
  EXPECT_EQ(body["data"]["retrieval_strategy"], "semantic");
  ASSERT_EQ(body["data"]["count"], 1);
  EXPECT_EQ(body["data"]["results"][0]["metadata"]["filename"], "guide.md");
}

TEST_F(RoutesTest, QueryErrors) {
  EXPECT_EQ(routes_->handle_query(request(R"({"query":"x"})")).code, 400);
  EXPECT_EQ(routes_->handle_query(request(R"({"database":"docs_db","query":""})")).code, 400);

  crow::response unknown = routes_->handle_query(
      request(R"({"database":"docs_db","query":"x","retrieval_strategy":"nope"})"));
  EXPECT_EQ(unknown.code, 400);
  EXPECT_EQ(body_of(unknown)["error_type"], "configuration_error");
}

TEST_F(RoutesTest, ProcessDatasetQueuesTask) {
  create_notes();
  routes_->handle_upload_file(request("first file", "?filename=a.txt"), "notes");

  crow::response queued = routes_->handle_process_dataset(request(R"({"priority":2})"), "notes");

  EXPECT_EQ(queued.code, 202);
  const long long task_id = body_of(queued)["data"]["task_id"].get<long long>();
  EXPECT_EQ(task_repo_->get_task(task_id)->priority, 2);

  crow::response task = routes_->handle_get_task(request(), std::to_string(task_id));
  EXPECT_EQ(task.code, 200);
  EXPECT_EQ(body_of(task)["data"]["status"], "pending");

  nlohmann::json listed = body_of(routes_->handle_list_tasks(request("", "?status=pending")));
  EXPECT_EQ(listed["data"]["count"], 1);

  EXPECT_EQ(routes_->handle_process_dataset(request(), "ghost").code, 404);
}

TEST_F(RoutesTest, CancelTask) {
  create_notes();
  const long long task_id = dataset_service_->process_dataset("notes");

  crow::response cancelled = routes_->handle_cancel_task(request(), std::to_string(task_id));

  EXPECT_EQ(cancelled.code, 200);
  EXPECT_EQ(body_of(cancelled)["data"]["status"], "cancelled");
  EXPECT_EQ(routes_->handle_cancel_task(request(), "999").code, 404);
}

TEST_F(RoutesTest, TaskIdValidation) {
  for (const char* id : {"abc", "12abc", "0", "-3", ""}) {
    crow::response response = routes_->handle_get_task(request(), id);
    EXPECT_EQ(response.code, 400) << id;
    EXPECT_EQ(body_of(response)["error_type"], "invalid_argument") << id;
  }
  EXPECT_EQ(routes_->handle_get_task(request(), "424242").code, 404);
}

TEST_F(RoutesTest, ListTasksRejectsBadParams) {
  EXPECT_EQ(routes_->handle_list_tasks(request("", "?status=PROCESSING")).code, 400);
  EXPECT_EQ(routes_->handle_list_tasks(request("", "?limit=many")).code, 400);
}

TEST_F(RoutesTest, RemoveFileAndDeleteDataset) {
  create_notes();
  nlohmann::json uploaded = body_of(routes_->handle_upload_file(
      request("Text that will be removed.\n", "?filename=a.txt&process=1"), "notes"));
  const std::string hash = uploaded["data"]["content_hash"];

  crow::response removed = routes_->handle_remove_file(request(), "notes", hash);
  EXPECT_EQ(removed.code, 200);
  EXPECT_GT(body_of(removed)["data"]["chunks_removed"].get<size_t>(), 0u);
  EXPECT_EQ(routes_->handle_remove_file(request(), "notes", hash).code, 404);

  EXPECT_EQ(routes_->handle_delete_dataset(request(), "notes").code, 200);
  EXPECT_EQ(routes_->handle_get_dataset(request(), "notes").code, 404);
  EXPECT_EQ(routes_->handle_delete_dataset(request(), "notes").code, 404);
}

TEST_F(RoutesTest, DatabaseStatsFollowUploads) {
  create_notes();
  crow::response empty = routes_->handle_database_stats(request(), "docs_db");
  ASSERT_EQ(empty.code, 200);
  EXPECT_EQ(body_of(empty)["data"]["chunk_count"], 0);

  routes_->handle_upload_file(request("Lamps and desks.\n", "?filename=a.txt&process=1"), "notes");

  nlohmann::json stats = body_of(routes_->handle_database_stats(request(), "docs_db"))["data"];
  EXPECT_EQ(stats["database"], "docs_db");
  EXPECT_EQ(stats["store_type"], "MemoryStore");
  EXPECT_EQ(stats["document_count"], 1);
  EXPECT_GT(stats["chunk_count"].get<size_t>(), 0u);
  EXPECT_EQ(stats["default_retrieval_strategy"], "semantic");

  nlohmann::json documents =
      body_of(routes_->handle_database_documents(request(), "docs_db"))["data"];
  EXPECT_EQ(documents["count"], 1);
  EXPECT_EQ(documents["documents"][0]["chunk_count"], stats["chunk_count"]);
}

TEST_F(RoutesTest, DatabaseHealthReportsComponents) {
  crow::response response = routes_->handle_database_health(request(), "docs_db");

  EXPECT_EQ(response.code, 200);
  nlohmann::json health = body_of(response)["data"];
  EXPECT_EQ(health["status"], "healthy");
  ASSERT_EQ(health["components"].size(), 2u);
  EXPECT_EQ(health["components"][1]["name"], "hashing");
}

TEST_F(RoutesTest, UnknownDatabaseIs404) {
  EXPECT_EQ(routes_->handle_database_stats(request(), "nope").code, 404);
  EXPECT_EQ(routes_->handle_database_documents(request(), "nope").code, 404);
  EXPECT_EQ(routes_->handle_database_health(request(), "nope").code, 404);
  EXPECT_EQ(body_of(routes_->handle_list_databases(request()))["data"],
            nlohmann::json({"docs_db"}));
}

TEST_F(RoutesTest, ClearCompletedTasks) {
  long long done = task_repo_->create_task("INGEST_DATASET", "notes", "{}");
  task_repo_->update_task_status(done, TaskStatus::SUCCEEDED);

  crow::response response =
      routes_->handle_clear_completed_tasks(request(R"({"older_than_days":0})"));

  EXPECT_EQ(response.code, 200);
  EXPECT_EQ(body_of(response)["data"]["older_than_days"], 0);
  EXPECT_FALSE(task_repo_->get_task(done).has_value());
  EXPECT_EQ(routes_->handle_clear_completed_tasks(request(R"({"older_than_days":-1})")).code, 400);
}

}  // namespace rag_tests

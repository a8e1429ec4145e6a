#pragma once
#include <memory>
#include <nlohmann/json.hpp>

#include "server.hpp"

// Forward declarations
namespace rag_core {
class DatabaseService;
class DatasetService;
class QueryService;
class TaskService;
class StrategyResolver;
}  // namespace rag_core

namespace rag_api {

class Routes {
 public:
  Routes(std::shared_ptr<rag_core::DatasetService> dataset_service,
         std::shared_ptr<rag_core::QueryService> query_service,
         std::shared_ptr<rag_core::TaskService> task_service,
         std::shared_ptr<rag_core::StrategyResolver> resolver);
  ~Routes() = default;

  Routes(const Routes &) = delete;
  Routes &operator=(const Routes &) = delete;

  Routes(Routes &&) noexcept = default;
  Routes &operator=(Routes &&) noexcept = default;

  void register_routes(Server &server);

  // Route handlers. Public so tests can drive them without a listening socket.
  crow::response handle_health_check(const crow::request &req);
  crow::response handle_list_datasets(const crow::request &req);
  crow::response handle_create_dataset(const crow::request &req);
  crow::response handle_get_dataset(const crow::request &req, const std::string &name);
  crow::response handle_delete_dataset(const crow::request &req, const std::string &name);
  crow::response handle_upload_file(const crow::request &req, const std::string &name);
  crow::response handle_remove_file(const crow::request &req, const std::string &name,
                                    const std::string &content_hash);
  crow::response handle_process_dataset(const crow::request &req, const std::string &name);
  crow::response handle_query(const crow::request &req);

  crow::response handle_list_databases(const crow::request &req);
  crow::response handle_database_stats(const crow::request &req, const std::string &name);
  crow::response handle_database_documents(const crow::request &req, const std::string &name);
  crow::response handle_database_health(const crow::request &req, const std::string &name);

  crow::response handle_list_tasks(const crow::request &req);
  crow::response handle_get_task(const crow::request &req, const std::string &task_id);
  crow::response handle_cancel_task(const crow::request &req, const std::string &task_id);
  crow::response handle_clear_completed_tasks(const crow::request &req);

 private:
  std::shared_ptr<rag_core::DatasetService> dataset_service_;
  std::shared_ptr<rag_core::QueryService> query_service_;
  std::shared_ptr<rag_core::TaskService> task_service_;
  std::shared_ptr<rag_core::StrategyResolver> resolver_;
  std::shared_ptr<rag_core::DatabaseService> database_service_;

  // Helper methods
  nlohmann::json parse_json_body(const std::string &body);
  long long parse_task_id(const std::string &task_id);
  nlohmann::json create_success_response(const std::string &message,
                                         const nlohmann::json &data = nlohmann::json{});
  crow::response create_json_response(const nlohmann::json &json_data, int status_code = 200);
  crow::response create_error_response(const char *handler);
};

}  // namespace rag_api

#include "rag_api/routes.hpp"

#include <exception>
#include <iostream>
#include <nlohmann/json.hpp>
#include <stdexcept>

#include "rag_api/error_mapping.hpp"
#include "rag_api/json_views.hpp"
#include "rag_core/resolver/strategy_resolver.hpp"
#include "rag_core/services/database_service.hpp"
#include "rag_core/services/dataset_service.hpp"
#include "rag_core/services/query_service.hpp"
#include "rag_core/services/task_service.hpp"

namespace rag_api {

namespace {

bool flag_enabled(const char *value) {
  if (value == nullptr) {
    return false;
  }
  const std::string flag(value);
  return flag == "true" || flag == "1" || flag == "yes";
}

}  // namespace

Routes::Routes(std::shared_ptr<rag_core::DatasetService> dataset_service,
               std::shared_ptr<rag_core::QueryService> query_service,
               std::shared_ptr<rag_core::TaskService> task_service,
               std::shared_ptr<rag_core::StrategyResolver> resolver)
    : dataset_service_(std::move(dataset_service)),
      query_service_(std::move(query_service)),
      task_service_(std::move(task_service)),
      resolver_(std::move(resolver)),
      database_service_(std::make_shared<rag_core::DatabaseService>(resolver_)) {}

void Routes::register_routes(Server &server) {
  auto &app = server.app();

  // Health check endpoint
  CROW_ROUTE(app, "/")
  ([this](const crow::request &req) { return handle_health_check(req); });

  // Dataset endpoints
  CROW_ROUTE(app, "/datasets")
  ([this](const crow::request &req) { return handle_list_datasets(req); });

  CROW_ROUTE(app, "/datasets").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_create_dataset(req);
  });

  CROW_ROUTE(app, "/datasets/<string>")
  ([this](const crow::request &req, const std::string &name) {
    return handle_get_dataset(req, name);
  });

  CROW_ROUTE(app, "/datasets/<string>")
      .methods(crow::HTTPMethod::DELETE)([this](const crow::request &req, const std::string &name) {
        return handle_delete_dataset(req, name);
      });

  // Raw body upload: POST /datasets/<name>/files?filename=notes.md&process=true
  CROW_ROUTE(app, "/datasets/<string>/files")
      .methods(crow::HTTPMethod::POST)([this](const crow::request &req, const std::string &name) {
        return handle_upload_file(req, name);
      });

  CROW_ROUTE(app, "/datasets/<string>/files/<string>")
      .methods(crow::HTTPMethod::DELETE)([this](const crow::request &req, const std::string &name,
                                                const std::string &content_hash) {
        return handle_remove_file(req, name, content_hash);
      });

  CROW_ROUTE(app, "/datasets/<string>/process")
      .methods(crow::HTTPMethod::POST)([this](const crow::request &req, const std::string &name) {
        return handle_process_dataset(req, name);
      });

  // Query endpoint
  // Database endpoints
  CROW_ROUTE(app, "/databases")
  ([this](const crow::request &req) { return handle_list_databases(req); });

  CROW_ROUTE(app, "/databases/<string>/stats")
  ([this](const crow::request &req, const std::string &name) {
    return handle_database_stats(req, name);
  });

  CROW_ROUTE(app, "/databases/<string>/documents")
  ([this](const crow::request &req, const std::string &name) {
    return handle_database_documents(req, name);
  });

  CROW_ROUTE(app, "/databases/<string>/health")
  ([this](const crow::request &req, const std::string &name) {
    return handle_database_health(req, name);
  });

  CROW_ROUTE(app, "/query").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_query(req);
  });

  // Task management endpoints
  CROW_ROUTE(app, "/tasks")
  ([this](const crow::request &req) { return handle_list_tasks(req); });

  CROW_ROUTE(app, "/tasks/clear").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_clear_completed_tasks(req);
  });

  CROW_ROUTE(app, "/tasks/<string>")
  ([this](const crow::request &req, const std::string &task_id) {
    return handle_get_task(req, task_id);
  });

  CROW_ROUTE(app, "/tasks/<string>/cancel")
      .methods(crow::HTTPMethod::POST)([this](const crow::request &req, const std::string &task_id) {
        return handle_cancel_task(req, task_id);
      });

  std::cout << "All routes registered successfully" << std::endl;
}

crow::response Routes::handle_health_check(const crow::request &req) {
  nlohmann::json response = create_success_response("RAG server is running");
  response["version"] = "0.1.0";
  response["status"] = "healthy";

  const rag_core::RagConfig &config = resolver_->config();
  nlohmann::json databases = nlohmann::json::array();
  for (const auto &database : config.databases) {
    databases.push_back(database.name);
  }
  nlohmann::json strategies = nlohmann::json::array();
  for (const auto &strategy : config.data_processing_strategies) {
    strategies.push_back(strategy.name);
  }
  response["databases"] = databases;
  response["data_processing_strategies"] = strategies;
  response["cached_pipelines"] = resolver_->cached_pipelines();
  return create_json_response(response);
}

crow::response Routes::handle_list_datasets(const crow::request &req) {
  try {
    nlohmann::json results = nlohmann::json::array();
    for (const auto &dataset : dataset_service_->list_datasets()) {
      results.push_back(to_json(dataset));
    }
    nlohmann::json response = create_success_response("Datasets listed", results);
    return create_json_response(response);
  } catch (const std::exception &) {
    return create_error_response("handle_list_datasets");
  }
}

crow::response Routes::handle_create_dataset(const crow::request &req) {
  try {
    nlohmann::json body = parse_json_body(req.body);
    const std::string name = body.at("name").get<std::string>();
    const std::string strategy = body.at("data_processing_strategy").get<std::string>();
    const std::string database = body.at("database").get<std::string>();

    std::cout << "Creating dataset " << name << std::endl;
    rag_core::DatasetRecord dataset = dataset_service_->create_dataset(name, strategy, database);
    return create_json_response(create_success_response("Dataset created", to_json(dataset)), 201);
  } catch (const std::exception &) {
    return create_error_response("handle_create_dataset");
  }
}

crow::response Routes::handle_get_dataset(const crow::request &req, const std::string &name) {
  try {
    rag_core::DatasetInfo info = dataset_service_->get_dataset(name);
    return create_json_response(create_success_response("Dataset retrieved", to_json(info)));
  } catch (const std::exception &) {
    return create_error_response("handle_get_dataset");
  }
}

crow::response Routes::handle_delete_dataset(const crow::request &req, const std::string &name) {
  try {
    std::cout << "Deleting dataset " << name << std::endl;
    dataset_service_->delete_dataset(name);
    nlohmann::json response = create_success_response("Dataset deleted");
    response["data"]["name"] = name;
    return create_json_response(response);
  } catch (const std::exception &) {
    return create_error_response("handle_delete_dataset");
  }
}

crow::response Routes::handle_upload_file(const crow::request &req, const std::string &name) {
  try {
    const char *filename = req.url_params.get("filename");
    if (filename == nullptr) {
      throw std::invalid_argument("Missing 'filename' query parameter");
    }
    const bool process_now = flag_enabled(req.url_params.get("process"));

    std::cout << "Uploading " << filename << " (" << req.body.size() << " bytes) to dataset "
              << name << std::endl;
    rag_core::UploadResult result =
        dataset_service_->upload_file(name, filename, req.body, process_now);
    const std::string message = result.skipped ? "File already in dataset" : "File uploaded";
    return create_json_response(create_success_response(message, to_json(result)),
                                result.skipped ? 200 : 201);
  } catch (const std::exception &) {
    return create_error_response("handle_upload_file");
  }
}

crow::response Routes::handle_remove_file(const crow::request &req, const std::string &name,
                                          const std::string &content_hash) {
  try {
    const size_t removed = dataset_service_->remove_file(name, content_hash);
    nlohmann::json response = create_success_response("File removed");
    response["data"]["content_hash"] = content_hash;
    response["data"]["chunks_removed"] = removed;
    return create_json_response(response);
  } catch (const std::exception &) {
    return create_error_response("handle_remove_file");
  }
}

crow::response Routes::handle_process_dataset(const crow::request &req, const std::string &name) {
  try {
    int priority = 10;
    if (!req.body.empty()) {
      nlohmann::json body = parse_json_body(req.body);
      priority = body.value("priority", 10);
    }
    const long long task_id = dataset_service_->process_dataset(name, priority);
    nlohmann::json response = create_success_response("Ingestion task queued");
    response["data"]["task_id"] = task_id;
    response["data"]["dataset"] = name;
    return create_json_response(response, 202);
  } catch (const std::exception &) {
    return create_error_response("handle_process_dataset");
  }
}

crow::response Routes::handle_query(const crow::request &req) {
  try {
    rag_core::QueryRequest request = query_request_from_json(parse_json_body(req.body));
    std::cout << "Query on " << request.database << " with top_k: " << request.top_k << std::endl;

    rag_core::QueryResponse result = query_service_->query(request);
    std::cout << "Query results: " << result.results.size() << std::endl;
    return create_json_response(create_success_response("Query complete", to_json(result)));
  } catch (const std::exception &) {
    return create_error_response("handle_query");
  }
}

crow::response Routes::handle_list_databases(const crow::request &req) {
  nlohmann::json names = database_service_->list_databases();
  return create_json_response(create_success_response("Databases listed", names));
}

crow::response Routes::handle_database_stats(const crow::request &req, const std::string &name) {
  try {
    rag_core::DatabaseStats stats = database_service_->get_stats(name);
    return create_json_response(create_success_response("Database statistics", to_json(stats)));
  } catch (const std::exception &) {
    return create_error_response("handle_database_stats");
  }
}

crow::response Routes::handle_database_documents(const crow::request &req,
                                                 const std::string &name) {
  try {
    nlohmann::json documents = nlohmann::json::array();
    for (const auto &document : database_service_->list_documents(name)) {
      documents.push_back(to_json(document));
    }
    nlohmann::json response = create_success_response("Stored documents listed");
    response["data"]["database"] = name;
    response["data"]["documents"] = documents;
    response["data"]["count"] = documents.size();
    return create_json_response(response);
  } catch (const std::exception &) {
    return create_error_response("handle_database_documents");
  }
}

// 503 while any backend of the database is unhealthy.
crow::response Routes::handle_database_health(const crow::request &req, const std::string &name) {
  try {
    rag_core::DatabaseHealth health = database_service_->check_health(name);
    if (!health.healthy) {
      std::cerr << "Database " << name << " is degraded" << std::endl;
    }
    return create_json_response(create_success_response("Database health", to_json(health)),
                                health.healthy ? 200 : 503);
  } catch (const std::exception &) {
    return create_error_response("handle_database_health");
  }
}

crow::response Routes::handle_list_tasks(const crow::request &req) {
  try {
    std::optional<rag_core::TaskStatus> status;
    if (const char *status_param = req.url_params.get("status")) {
      status = rag_core::task_status_from_string(status_param);
    }
    int limit = 100;
    if (const char *limit_param = req.url_params.get("limit")) {
      limit = std::stoi(limit_param);
    }

    nlohmann::json tasks = nlohmann::json::array();
    for (const auto &task : task_service_->list_tasks(status, limit)) {
      tasks.push_back(to_json(task));
    }
    nlohmann::json response = create_success_response("Tasks retrieved successfully");
    response["data"]["tasks"] = tasks;
    response["data"]["count"] = tasks.size();
    return create_json_response(response);
  } catch (const std::exception &) {
    return create_error_response("handle_list_tasks");
  }
}

crow::response Routes::handle_get_task(const crow::request &req, const std::string &task_id) {
  try {
    rag_core::TaskReport report = task_service_->get_task(parse_task_id(task_id));
    return create_json_response(create_success_response("Task retrieved", to_json(report)));
  } catch (const std::exception &) {
    return create_error_response("handle_get_task");
  }
}

crow::response Routes::handle_cancel_task(const crow::request &req, const std::string &task_id) {
  try {
    rag_core::TaskReport report = task_service_->cancel_task(parse_task_id(task_id));
    return create_json_response(create_success_response("Cancellation requested", to_json(report)));
  } catch (const std::exception &) {
    return create_error_response("handle_cancel_task");
  }
}

crow::response Routes::handle_clear_completed_tasks(const crow::request &req) {
  try {
    int older_than_days = 7;
    if (!req.body.empty()) {
      older_than_days = parse_json_body(req.body).value("older_than_days", 7);
    }
    task_service_->clear_completed_tasks(older_than_days);

    nlohmann::json response = create_success_response("Completed tasks cleared successfully");
    response["data"]["older_than_days"] = older_than_days;
    return create_json_response(response);
  } catch (const std::exception &) {
    return create_error_response("handle_clear_completed_tasks");
  }
}

nlohmann::json Routes::parse_json_body(const std::string &body) {
  if (body.empty()) {
    throw std::invalid_argument("Request body is empty");
  }
  return nlohmann::json::parse(body);
}

long long Routes::parse_task_id(const std::string &task_id) {
  size_t consumed = 0;
  long long id = 0;
  try {
    id = std::stoll(task_id, &consumed);
  } catch (const std::logic_error &) {
    throw std::invalid_argument("Invalid task ID format: " + task_id);
  }
  if (consumed != task_id.size() || id <= 0) {
    throw std::invalid_argument("Invalid task ID format: " + task_id);
  }
  return id;
}

nlohmann::json Routes::create_success_response(const std::string &message,
                                               const nlohmann::json &data) {
  nlohmann::json response;
  response["success"] = true;
  response["message"] = message;
  if (!data.is_null()) {
    response["data"] = data;
  }
  return response;
}

crow::response Routes::create_json_response(const nlohmann::json &json_data, int status_code) {
  crow::response response(status_code, json_data.dump());
  response.set_header("Content-Type", "application/json");
  return response;
}

// Must be called from inside a catch block.
crow::response Routes::create_error_response(const char *handler) {
  ApiError error = map_exception(std::current_exception());
  if (error.status >= 500) {
    std::cerr << "Exception in " << handler << ": " << error.message << std::endl;
  }
  return create_json_response(error_body(error), error.status);
}

}  // namespace rag_api

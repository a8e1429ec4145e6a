#pragma once

#include <exception>
#include <nlohmann/json.hpp>
#include <string>

namespace rag_api {

struct ApiError {
  int status = 500;
  std::string error_type;
  std::string message;
};

// 400 for configuration and argument problems, 404 for unknown datasets and
// tasks, 503 when a backend is unreachable, 500 for everything else.
ApiError map_exception(std::exception_ptr error);

// {"success": false, "error": ..., "error_type": ...}
nlohmann::json error_body(const ApiError& error);

}  // namespace rag_api

#pragma once

#include <fstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace rag_api {

class ServerConfig {
 public:
  std::string api_base_url;
  std::string metadata_db_path;
  std::string rag_config_path;
  std::string data_dir;
  int num_workers = 1;
  int max_concurrent_files = 4;
  int worker_poll_ms = 500;
  int http_threads = 4;

  // Load configuration from a JSON file at the given path
  static ServerConfig from_file(const std::string& filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw std::runtime_error("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const nlohmann::json::exception& e) {
      throw std::runtime_error(std::string("Failed to parse JSON in config file '") + filename +
                               "': " + e.what());
    }

    return from_json(json_config);
  }

  // Construct configuration from a JSON object (useful for tests)
  static ServerConfig from_json(const nlohmann::json& json_config) {
    ServerConfig config;
    try {
      config.api_base_url = json_config.value("api_base_url", std::string("127.0.0.1:3030"));
      config.metadata_db_path = json_config.value("metadata_db_path", std::string("./data/rag.db"));
      config.rag_config_path = json_config.value("rag_config_path", std::string("./rag_config.json"));
      config.data_dir = json_config.value("data_dir", std::string("./data/files"));
      config.num_workers = json_config.value("num_workers", 1);
      config.max_concurrent_files = json_config.value("max_concurrent_files", 4);
      config.worker_poll_ms = json_config.value("worker_poll_ms", 500);
      config.http_threads = json_config.value("http_threads", 4);
    } catch (const nlohmann::json::exception& e) {
      throw std::runtime_error(std::string("Invalid server config value: ") + e.what());
    }

    config.validate();
    return config;
  }

  std::string host() const {
    return api_base_url.substr(0, api_base_url.find(':'));
  }
  int port() const {
    return std::stoi(api_base_url.substr(api_base_url.find(':') + 1));
  }

 private:
  void validate() const {
    if (api_base_url.empty()) {
      throw std::runtime_error("api_base_url cannot be empty");
    }
    const auto colon = api_base_url.find(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 >= api_base_url.size() ||
        api_base_url.find_first_not_of("0123456789", colon + 1) != std::string::npos) {
      throw std::runtime_error("api_base_url must look like host:port, got " + api_base_url);
    }
    if (metadata_db_path.empty()) {
      throw std::runtime_error("metadata_db_path cannot be empty");
    }
    if (rag_config_path.empty()) {
      throw std::runtime_error("rag_config_path cannot be empty");
    }
    if (data_dir.empty()) {
      throw std::runtime_error("data_dir cannot be empty");
    }
    if (num_workers <= 0) {
      throw std::runtime_error("num_workers must be greater than 0");
    }
    if (max_concurrent_files <= 0) {
      throw std::runtime_error("max_concurrent_files must be greater than 0");
    }
    if (worker_poll_ms < 10) {
      throw std::runtime_error("worker_poll_ms must be at least 10ms");
    }
    if (http_threads <= 0 || http_threads > 256) {
      throw std::runtime_error("http_threads must be between 1 and 256");
    }
  }
};

}  // namespace rag_api

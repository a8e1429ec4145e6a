#include "rag_api/server.hpp"

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <utility>

namespace rag_api {

Server::Server(ListenOptions options) : options_(std::move(options)) {
  if (options_.http_threads <= 0) {
    throw std::invalid_argument("http_threads must be greater than 0");
  }
  app_.loglevel(crow::LogLevel::Warning);
}

Server::~Server() {
  stop();
}

void Server::start() {
  if (running_.exchange(true)) {
    return;
  }
  app_.bindaddr(options_.host)
      .port(static_cast<std::uint16_t>(options_.port))
      .concurrency(static_cast<std::uint16_t>(options_.http_threads));
  listener_ = std::async(std::launch::async, [this] { app_.run(); });

  // Crow signals readiness through wait_for_server_start; a listener that dies
  // during bind finishes the future first.
  while (listener_.wait_for(std::chrono::milliseconds(0)) != std::future_status::ready) {
    if (app_.wait_for_server_start(std::chrono::milliseconds(100)) == std::cv_status::no_timeout) {
      return;
    }
  }
  running_ = false;
  listener_.get();
  throw std::runtime_error("HTTP listener on " + options_.host + ":" +
                           std::to_string(options_.port) + " exited during startup");
}

void Server::stop() {
  if (!running_.exchange(false)) {
    return;
  }
  app_.stop();
  if (listener_.valid()) {
    listener_.get();
  }
}

}  // namespace rag_api

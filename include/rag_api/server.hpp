#pragma once
#include <crow.h>

#include <atomic>
#include <future>
#include <string>

namespace rag_api {

struct ListenOptions {
  std::string host;
  int port = 0;
  int http_threads = 4;
};

// Owns the Crow application and runs it on a background thread so the caller
// can drive startup and shutdown ordering alongside the worker pool.
class Server {
 public:
  explicit Server(ListenOptions options);
  ~Server();

  Server(const Server &) = delete;
  Server &operator=(const Server &) = delete;

  crow::SimpleApp &app() {
    return app_;
  }
  const ListenOptions &options() const {
    return options_;
  }

  // Blocks until the listener is bound. Throws std::runtime_error if the
  // listener exits before it comes up (port in use, bad address).
  void start();
  void stop();

  bool is_running() const {
    return running_.load();
  }

 private:
  crow::SimpleApp app_;
  ListenOptions options_;
  std::future<void> listener_;
  std::atomic<bool> running_{false};
};

}  // namespace rag_api

#pragma once

#include <chrono>
#include <mutex>
#include <string>

namespace rag_core {

// Closed -> open after `failure_threshold` consecutive failures; open ->
// half-open once `reset_timeout` has passed, letting one trial call through.
// A successful trial closes the breaker, a failed one re-opens it.
class CircuitBreaker {
 public:
  enum class State { CLOSED, OPEN, HALF_OPEN };

  CircuitBreaker(int failure_threshold, std::chrono::milliseconds reset_timeout);

  bool allow_request();
  void record_success();
  void record_failure();

  State state() const;
  int consecutive_failures() const;

 private:
  using Clock = std::chrono::steady_clock;

  const int failure_threshold_;
  const std::chrono::milliseconds reset_timeout_;

  mutable std::mutex mutex_;
  State state_ = State::CLOSED;
  int consecutive_failures_ = 0;
  bool trial_in_flight_ = false;
  Clock::time_point opened_at_;
};

std::string to_string(CircuitBreaker::State state);

}  // namespace rag_core

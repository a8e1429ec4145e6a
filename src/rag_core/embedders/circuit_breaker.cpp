#include "rag_core/embedders/circuit_breaker.hpp"

#include <stdexcept>

namespace rag_core {

CircuitBreaker::CircuitBreaker(int failure_threshold, std::chrono::milliseconds reset_timeout)
    : failure_threshold_(failure_threshold), reset_timeout_(reset_timeout) {
  if (failure_threshold_ <= 0) {
    throw std::invalid_argument("CircuitBreaker failure_threshold must be greater than 0");
  }
}

bool CircuitBreaker::allow_request() {
  std::lock_guard<std::mutex> lock(mutex_);
  switch (state_) {
    case State::CLOSED:
      return true;
    case State::OPEN:
      if (Clock::now() - opened_at_ < reset_timeout_) {
        return false;
      }
      state_ = State::HALF_OPEN;
      trial_in_flight_ = true;
      return true;
    case State::HALF_OPEN:
      if (trial_in_flight_) {
        return false;
      }
      trial_in_flight_ = true;
      return true;
  }
  return false;
}

void CircuitBreaker::record_success() {
  std::lock_guard<std::mutex> lock(mutex_);
  state_ = State::CLOSED;
  consecutive_failures_ = 0;
  trial_in_flight_ = false;
}

void CircuitBreaker::record_failure() {
  std::lock_guard<std::mutex> lock(mutex_);
  ++consecutive_failures_;
  trial_in_flight_ = false;
  if (state_ == State::HALF_OPEN || consecutive_failures_ >= failure_threshold_) {
    state_ = State::OPEN;
    opened_at_ = Clock::now();
  }
}

CircuitBreaker::State CircuitBreaker::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

int CircuitBreaker::consecutive_failures() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return consecutive_failures_;
}

std::string to_string(CircuitBreaker::State state) {
  switch (state) {
    case CircuitBreaker::State::CLOSED: return "closed";
    case CircuitBreaker::State::OPEN: return "open";
    case CircuitBreaker::State::HALF_OPEN: return "half_open";
  }
  return "unknown";
}

}  // namespace rag_core

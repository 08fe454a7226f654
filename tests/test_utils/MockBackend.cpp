#include "MockBackend.hpp"
#include "instrument-sim/Errors.hpp"

#include <thread>

namespace instsim {
namespace test {

MockBackend::MockBackend(const std::string &name) : name_(name) {}

void MockBackend::set_response(const std::string &command,
                               const std::string &response) {
  std::lock_guard lock(mutex_);
  responses_[command] = response;
}

void MockBackend::set_delay(const std::string &command,
                            std::chrono::milliseconds delay) {
  std::lock_guard lock(mutex_);
  delays_[command] = delay;
}

void MockBackend::set_error(const std::string &command,
                            const std::string &error) {
  std::lock_guard lock(mutex_);
  errors_[command] = error;
}

std::vector<std::string> MockBackend::get_command_history() const {
  std::lock_guard lock(mutex_);
  return command_history_;
}

size_t MockBackend::command_count() const {
  std::lock_guard lock(mutex_);
  return command_history_.size();
}

void MockBackend::clear_history() {
  std::lock_guard lock(mutex_);
  command_history_.clear();
}

bool MockBackend::is_connected() const {
  std::lock_guard lock(mutex_);
  return connected_;
}

bool MockBackend::is_closed() const {
  std::lock_guard lock(mutex_);
  return closed_;
}

void MockBackend::connect() {
  std::lock_guard lock(mutex_);
  connected_ = true;
}

void MockBackend::disconnect() {
  std::lock_guard lock(mutex_);
  connected_ = false;
}

void MockBackend::close() {
  std::lock_guard lock(mutex_);
  connected_ = false;
  closed_ = true;
}

void MockBackend::set_timeout(int timeout_ms) {
  std::lock_guard lock(mutex_);
  timeout_ms_ = timeout_ms;
}

int MockBackend::get_timeout() const {
  std::lock_guard lock(mutex_);
  return timeout_ms_;
}

std::string MockBackend::handle(const std::string &command) {
  std::lock_guard lock(mutex_);
  command_history_.push_back(command);

  if (delays_.count(command)) {
    std::this_thread::sleep_for(delays_[command]);
  }

  if (errors_.count(command)) {
    throw SimulationError(name_ + ": " + errors_[command]);
  }

  auto it = responses_.find(command);
  if (it != responses_.end()) {
    return it->second;
  }
  return "OK";
}

void MockBackend::write(const std::string &command) { handle(command); }

std::string MockBackend::query(const std::string &command,
                               std::chrono::milliseconds) {
  return handle(command);
}

std::vector<uint8_t> MockBackend::query_raw(const std::string &command,
                                            std::chrono::milliseconds) {
  std::string response = handle(command);
  return std::vector<uint8_t>(response.begin(), response.end());
}

} // namespace test
} // namespace instsim

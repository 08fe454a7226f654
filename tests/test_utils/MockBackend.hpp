#pragma once
#include "instrument-sim/backend/InstrumentBackend.hpp"

#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace instsim {
namespace test {

/// Scripted backend for testing wrappers
class MockBackend : public InstrumentBackend {
public:
  explicit MockBackend(const std::string &name);

  void set_response(const std::string &command, const std::string &response);
  void set_delay(const std::string &command, std::chrono::milliseconds delay);
  void set_error(const std::string &command, const std::string &error);

  std::vector<std::string> get_command_history() const;
  size_t command_count() const;
  void clear_history();

  bool is_connected() const;
  bool is_closed() const;

  void connect() override;
  void disconnect() override;
  void write(const std::string &command) override;
  std::string
  query(const std::string &command,
        std::chrono::milliseconds delay = std::chrono::milliseconds(0)) override;
  std::vector<uint8_t> query_raw(
      const std::string &command,
      std::chrono::milliseconds delay = std::chrono::milliseconds(0)) override;
  void close() override;
  void set_timeout(int timeout_ms) override;
  int get_timeout() const override;
  std::string backend_type() const override { return "mock"; }

private:
  std::string handle(const std::string &command);

  std::string name_;
  mutable std::mutex mutex_;
  std::vector<std::string> command_history_;
  std::map<std::string, std::string> responses_;
  std::map<std::string, std::chrono::milliseconds> delays_;
  std::map<std::string, std::string> errors_;
  bool connected_{false};
  bool closed_{false};
  int timeout_ms_{5000};
};

} // namespace test
} // namespace instsim

#pragma once
#include "instrument-sim/backend/InstrumentBackend.hpp"
#include "instrument-sim/replay/SessionLog.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

namespace instsim {
namespace replay {

/// Wraps another backend and records every call into a session log that a
/// ReplayBackend can consume later.
class INSTRUMENT_SIM_API SessionRecordingBackend : public InstrumentBackend {
public:
  /// When `save_path` is set the log is written there on close()
  SessionRecordingBackend(
      InstrumentBackendPtr inner, std::string alias,
      std::string profile_key = "",
      std::optional<std::filesystem::path> save_path = std::nullopt);

  void connect() override { inner_->connect(); }
  void disconnect() override { inner_->disconnect(); }
  void write(const std::string &command) override;
  std::string
  query(const std::string &command,
        std::chrono::milliseconds delay = std::chrono::milliseconds(0)) override;
  std::vector<uint8_t> query_raw(
      const std::string &command,
      std::chrono::milliseconds delay = std::chrono::milliseconds(0)) override;
  void close() override;
  void set_timeout(int timeout_ms) override { inner_->set_timeout(timeout_ms); }
  int get_timeout() const override { return inner_->get_timeout(); }
  std::string backend_type() const override {
    return "record:" + inner_->backend_type();
  }

  /// Store the log under this recorder's alias, keeping any other aliases
  /// already present in the file
  void save(const std::filesystem::path &path) const;

  const SessionLogEntries &log() const { return log_; }
  const std::string &alias() const { return alias_; }
  InstrumentBackend &inner() { return *inner_; }

private:
  void record(CommandKind kind, const std::string &command,
              std::optional<std::string> response);

  InstrumentBackendPtr inner_;
  std::string alias_;
  std::string profile_key_;
  std::optional<std::filesystem::path> save_path_;
  SessionLogEntries log_;
  std::chrono::steady_clock::time_point started_;
};

} // namespace replay
} // namespace instsim

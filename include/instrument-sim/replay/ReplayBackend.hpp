#pragma once
#include "instrument-sim/backend/InstrumentBackend.hpp"
#include "instrument-sim/replay/SessionLog.hpp"

#include <filesystem>
#include <memory>
#include <string>

namespace instsim {
namespace replay {

/// Deterministic replay of a recorded session. Every call must match the
/// log entry at the cursor exactly (kind and trimmed command); responses
/// come from the log. Divergence throws ReplayMismatchError.
class INSTRUMENT_SIM_API ReplayBackend : public InstrumentBackend {
public:
  static constexpr int kDefaultTimeoutMs = 5000;

  explicit ReplayBackend(SessionLogEntries log, std::string profile_key = "",
                         std::string alias = "replay");

  /// Replay the session recorded for `alias` in a session file. Throws
  /// ProfileError when the file or the alias is missing.
  static std::unique_ptr<ReplayBackend>
  from_session_file(const std::filesystem::path &path,
                    const std::string &alias);

  void connect() override;
  void disconnect() override;
  void write(const std::string &command) override;

  /// The caller-supplied delay is not waited: replay runs at full speed
  std::string
  query(const std::string &command,
        std::chrono::milliseconds delay = std::chrono::milliseconds(0)) override;
  std::vector<uint8_t> query_raw(
      const std::string &command,
      std::chrono::milliseconds delay = std::chrono::milliseconds(0)) override;
  void close() override;
  void set_timeout(int timeout_ms) override { timeout_ms_ = timeout_ms; }
  int get_timeout() const override { return timeout_ms_; }
  std::string backend_type() const override { return "replay"; }

  std::size_t position() const { return cursor_.position(); }
  std::size_t log_size() const { return cursor_.size(); }
  bool finished() const { return cursor_.finished(); }
  const std::string &profile_key() const { return profile_key_; }
  const std::string &alias() const { return alias_; }

private:
  const SessionLogEntry &consume(CommandKind kind, const std::string &command,
                                 std::initializer_list<CommandKind> accepted);

  ReplayCursor cursor_;
  std::string profile_key_;
  std::string alias_;
  int timeout_ms_{kDefaultTimeoutMs};
};

} // namespace replay
} // namespace instsim

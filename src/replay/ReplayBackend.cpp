#include "instrument-sim/replay/ReplayBackend.hpp"
#include "instrument-sim/Errors.hpp"
#include "instrument-sim/Logger.hpp"

namespace instsim {
namespace replay {

ReplayBackend::ReplayBackend(SessionLogEntries log, std::string profile_key,
                             std::string alias)
    : cursor_(std::move(log)), profile_key_(std::move(profile_key)),
      alias_(std::move(alias)) {
  LOG_INFO(alias_, "INIT", "Replay backend ready ({} recorded entries)",
           cursor_.size());
}

std::unique_ptr<ReplayBackend>
ReplayBackend::from_session_file(const std::filesystem::path &path,
                                 const std::string &alias) {
  try {
    SessionFile file = SessionFile::load(path);
    const SessionRecord &record = file.get(alias);
    return std::make_unique<ReplayBackend>(record.log, record.profile, alias);
  } catch (const ProfileError &ex) {
    LOG_ERROR(alias, "INIT", "Failed to load session: {}", ex.what());
    throw;
  }
}

void ReplayBackend::connect() { LOG_INFO(alias_, "CONNECT", "Replay started"); }

void ReplayBackend::disconnect() {
  LOG_INFO(alias_, "DISCONNECT", "Replay stopped at entry {}/{}",
           cursor_.position(), cursor_.size());
}

void ReplayBackend::close() { disconnect(); }

const SessionLogEntry &
ReplayBackend::consume(CommandKind kind, const std::string &command,
                       std::initializer_list<CommandKind> accepted) {
  try {
    const SessionLogEntry &entry = cursor_.consume(kind, command, accepted);
    LOG_DEBUG(alias_, "REPLAY", "[{}/{}] {} {}", cursor_.position(),
              cursor_.size(), to_string(kind), entry.command);
    return entry;
  } catch (const ReplayMismatchError &ex) {
    LOG_ERROR(alias_, "REPLAY", "{}", ex.what());
    throw;
  }
}

void ReplayBackend::write(const std::string &command) {
  consume(CommandKind::Write, command, {CommandKind::Write});
}

std::string ReplayBackend::query(const std::string &command,
                                 std::chrono::milliseconds) {
  const auto &entry = consume(CommandKind::Query, command, {CommandKind::Query});
  return entry.response.value_or("");
}

std::vector<uint8_t> ReplayBackend::query_raw(const std::string &command,
                                              std::chrono::milliseconds) {
  const auto &entry = consume(CommandKind::QueryRaw, command,
                              {CommandKind::QueryRaw, CommandKind::Query});
  std::string response = entry.response.value_or("");
  return std::vector<uint8_t>(response.begin(), response.end());
}

} // namespace replay
} // namespace instsim

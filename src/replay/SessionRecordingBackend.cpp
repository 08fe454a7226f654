#include "instrument-sim/replay/SessionRecordingBackend.hpp"
#include "instrument-sim/Errors.hpp"
#include "instrument-sim/Logger.hpp"

namespace fs = std::filesystem;

namespace instsim {
namespace replay {

SessionRecordingBackend::SessionRecordingBackend(
    InstrumentBackendPtr inner, std::string alias, std::string profile_key,
    std::optional<fs::path> save_path)
    : inner_(std::move(inner)), alias_(std::move(alias)),
      profile_key_(std::move(profile_key)), save_path_(std::move(save_path)),
      started_(std::chrono::steady_clock::now()) {
  if (!inner_)
    throw SimulationError("recording backend needs a backend to wrap");
}

void SessionRecordingBackend::record(CommandKind kind,
                                     const std::string &command,
                                     std::optional<std::string> response) {
  SessionLogEntry entry;
  entry.kind = kind;
  entry.command = trim(command);
  entry.response = std::move(response);
  entry.timestamp = std::chrono::duration<double>(
                        std::chrono::steady_clock::now() - started_)
                        .count();
  LOG_TRACE(alias_, "RECORD", "#{} {} {}", log_.size(), to_string(kind),
            entry.command);
  log_.push_back(std::move(entry));
}

void SessionRecordingBackend::write(const std::string &command) {
  record(CommandKind::Write, command, std::nullopt);
  inner_->write(command);
}

std::string SessionRecordingBackend::query(const std::string &command,
                                           std::chrono::milliseconds delay) {
  std::string response = inner_->query(command, delay);
  record(CommandKind::Query, command, trim(response));
  return response;
}

std::vector<uint8_t>
SessionRecordingBackend::query_raw(const std::string &command,
                                   std::chrono::milliseconds delay) {
  std::vector<uint8_t> response = inner_->query_raw(command, delay);
  record(CommandKind::QueryRaw, command,
         std::string(response.begin(), response.end()));
  return response;
}

void SessionRecordingBackend::save(const fs::path &path) const {
  SessionFile file;
  if (fs::exists(path))
    file = SessionFile::load(path);
  file.put(alias_, SessionRecord{profile_key_, log_});
  file.save(path);
  LOG_INFO(alias_, "SAVE", "Recorded {} entries to {}", log_.size(),
           path.string());
}

void SessionRecordingBackend::close() {
  inner_->close();
  if (save_path_)
    save(*save_path_);
}

} // namespace replay
} // namespace instsim

#include "instrument-sim/replay/SessionLog.hpp"
#include "instrument-sim/Errors.hpp"
#include "instrument-sim/Logger.hpp"
#include "instrument-sim/profile/ProfileLoader.hpp"
#include "instrument-sim/sim/Expression.hpp"

#include <algorithm>
#include <fmt/format.h>
#include <fstream>
#include <yaml-cpp/yaml.h>

namespace fs = std::filesystem;

namespace instsim {
namespace replay {

using json = nlohmann::json;

SessionFile SessionFile::load(const fs::path &path) {
  std::string source = path.string();
  json document = profile::load_document(path);

  SessionFile file;
  file.source_ = source;
  if (document.is_null())
    return file;
  if (!document.is_object())
    throw ProfileError(source, "session file must map aliases to sessions");

  for (auto &[alias, node] : document.items()) {
    if (!node.is_object())
      throw ProfileError(source, "session '" + alias + "' must be a map");
    SessionRecord record;
    if (node.contains("profile") && node["profile"].is_string())
      record.profile = node["profile"].get<std::string>();
    if (node.contains("log"))
      record.log = parse_log(node["log"], source + ": " + alias);
    file.records_.emplace(alias, std::move(record));
  }

  LOG_DEBUG("SESSION", "LOAD", "{}: {} instrument session(s)", source,
            file.records_.size());
  return file;
}

SessionLogEntries SessionFile::parse_log(const json &node,
                                         const std::string &source) {
  SessionLogEntries entries;
  if (node.is_null())
    return entries;
  if (!node.is_array())
    throw ProfileError(source, "'log' must be a list");

  std::size_t index = 0;
  for (const auto &item : node) {
    std::string where = "log[" + std::to_string(index++) + "]";
    if (!item.is_object())
      throw ProfileError(source, where + " must be a map");

    const char *kind_key = item.contains("kind") ? "kind" : "type";
    if (!item.contains(kind_key) || !item[kind_key].is_string())
      throw ProfileError(source, where + ": missing 'kind'");
    auto kind = command_kind_from_string(item[kind_key].get<std::string>());
    if (!kind) {
      throw ProfileError(source, where + ": unknown kind '" +
                                     item[kind_key].get<std::string>() + "'");
    }

    if (!item.contains("command") || !item["command"].is_string())
      throw ProfileError(source, where + ": missing 'command'");

    SessionLogEntry entry;
    entry.kind = *kind;
    entry.command = item["command"].get<std::string>();
    if (item.contains("response") && item["response"].is_string())
      entry.response = item["response"].get<std::string>();
    if (entry.response && item.contains("encoding")) {
      if (item["encoding"] != "base64")
        throw ProfileError(source, where + ": unknown encoding " +
                                       item["encoding"].dump());
      std::vector<unsigned char> bytes = YAML::DecodeBase64(*entry.response);
      if (bytes.empty() && !entry.response->empty())
        throw ProfileError(source, where + ": invalid base64 response");
      entry.response = std::string(bytes.begin(), bytes.end());
    }
    if (item.contains("timestamp") && item["timestamp"].is_string()) {
      auto ts = sim::parse_number(item["timestamp"].get<std::string>());
      if (!ts)
        throw ProfileError(source, where + ": 'timestamp' must be a number");
      entry.timestamp = ts->get<double>();
    }
    entries.push_back(std::move(entry));
  }
  return entries;
}

void SessionFile::save(const fs::path &path) const {
  YAML::Emitter out;
  out << YAML::BeginMap;
  for (const auto &[alias, record] : records_) {
    out << YAML::Key << alias << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "profile" << YAML::Value << record.profile;
    out << YAML::Key << "log" << YAML::Value << YAML::BeginSeq;
    for (const auto &entry : record.log) {
      out << YAML::BeginMap;
      out << YAML::Key << "kind" << YAML::Value << to_string(entry.kind);
      out << YAML::Key << "command" << YAML::Value << YAML::DoubleQuoted
          << entry.command;
      if (entry.response && entry.kind == CommandKind::QueryRaw) {
        const auto *data =
            reinterpret_cast<const unsigned char *>(entry.response->data());
        out << YAML::Key << "response" << YAML::Value
            << YAML::Binary(data, entry.response->size());
        out << YAML::Key << "encoding" << YAML::Value << "base64";
      } else if (entry.response) {
        out << YAML::Key << "response" << YAML::Value << YAML::DoubleQuoted
            << *entry.response;
      }
      out << YAML::Key << "timestamp" << YAML::Value << entry.timestamp;
      out << YAML::EndMap;
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;
  }
  out << YAML::EndMap;

  if (!out.good())
    throw ProfileError(path.string(), std::string("YAML emit failed: ") +
                                          out.GetLastError());

  if (path.has_parent_path()) {
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec)
      throw ProfileError(path.string(), "cannot create directory: " +
                                            ec.message());
  }
  std::ofstream fout(path);
  if (!fout)
    throw ProfileError(path.string(), "cannot open for writing");
  fout << out.c_str() << "\n";
  if (!fout)
    throw ProfileError(path.string(), "write failed");

  LOG_INFO("SESSION", "SAVE", "Wrote {} session(s) to {}", records_.size(),
           path.string());
}

bool SessionFile::has(const std::string &alias) const {
  return records_.count(alias) > 0;
}

const SessionRecord &SessionFile::get(const std::string &alias) const {
  auto it = records_.find(alias);
  if (it == records_.end())
    throw ProfileError(source_, "no session recorded for '" + alias + "'");
  return it->second;
}

void SessionFile::put(const std::string &alias, SessionRecord record) {
  records_[alias] = std::move(record);
}

std::vector<std::string> SessionFile::aliases() const {
  std::vector<std::string> out;
  for (const auto &[alias, _] : records_)
    out.push_back(alias);
  return out;
}

ReplayCursor::ReplayCursor(SessionLogEntries log) : log_(std::move(log)) {}

const SessionLogEntry &
ReplayCursor::consume(CommandKind kind, const std::string &command,
                      std::initializer_list<CommandKind> accepted) {
  std::string actual = trim(command);

  if (finished()) {
    throw ReplayMismatchError(
        fmt::format("Replay log exhausted: received {} '{}' after all {} "
                    "recorded entries",
                    to_string(kind), actual, log_.size()),
        kind, actual, position_);
  }

  const SessionLogEntry &expected = log_[position_];
  std::string expected_cmd = trim(expected.command);
  bool kind_ok = std::find(accepted.begin(), accepted.end(), expected.kind) !=
                 accepted.end();
  if (!kind_ok || expected_cmd != actual) {
    throw ReplayMismatchError(
        fmt::format("Replay mismatch at entry {}: expected {} '{}', got {} '{}'",
                    position_, to_string(expected.kind), expected_cmd,
                    to_string(kind), actual),
        expected.kind, expected_cmd, kind, actual, position_);
  }

  ++position_;
  return expected;
}

} // namespace replay
} // namespace instsim

#include "instrument-sim/backend/BackendFactory.hpp"
#include "instrument-sim/Errors.hpp"
#include "instrument-sim/Logger.hpp"
#include "instrument-sim/profile/ProfileLoader.hpp"
#include "instrument-sim/replay/ReplayBackend.hpp"
#include "instrument-sim/replay/SessionRecordingBackend.hpp"
#include "instrument-sim/sim/Expression.hpp"
#include "instrument-sim/sim/SimulationBackend.hpp"
#include "instrument-sim/types.hpp"

namespace fs = std::filesystem;

namespace instsim {

using json = nlohmann::json;

namespace {

std::string string_field(const json &node, const char *key,
                         const std::string &fallback,
                         const std::string &source) {
  if (!node.contains(key) || node[key].is_null())
    return fallback;
  if (!node[key].is_string())
    throw ProfileError(source, std::string("'") + key + "' must be a scalar");
  return node[key].get<std::string>();
}

int64_t integer_field(const json &node, const char *key, int64_t fallback,
                      const std::string &source) {
  std::string text = string_field(node, key, "", source);
  if (text.empty())
    return fallback;
  auto value = sim::parse_number(text);
  if (!value || !value->is_number_integer())
    throw ProfileError(source, std::string("'") + key +
                                   "' must be an integer, got '" + text + "'");
  return value->get<int64_t>();
}

bool bool_field(const json &node, const char *key, bool fallback,
                const std::string &source) {
  std::string text = to_upper(string_field(node, key, "", source));
  if (text.empty())
    return fallback;
  if (text == "TRUE" || text == "YES" || text == "ON" || text == "1")
    return true;
  if (text == "FALSE" || text == "NO" || text == "OFF" || text == "0")
    return false;
  throw ProfileError(source, std::string("'") + key + "' must be a boolean");
}

std::string relative_to(const std::string &path, const fs::path &base_dir) {
  if (path.empty() || base_dir.empty() || fs::path(path).is_absolute())
    return path;
  return (base_dir / path).string();
}

} // namespace

std::string to_string(BackendMode mode) {
  return mode == BackendMode::Replay ? "replay" : "sim";
}

BackendConfig parse_backend_config(const json &node, const std::string &source,
                                   const fs::path &base_dir) {
  if (!node.is_object())
    throw ProfileError(source, "backend configuration must be a map");

  BackendConfig config;
  config.name = string_field(node, "name", config.name, source);

  std::string mode = string_field(node, "mode", "sim", source);
  if (mode == "sim" || mode == "simulation") {
    config.mode = BackendMode::Sim;
  } else if (mode == "replay") {
    config.mode = BackendMode::Replay;
  } else {
    throw ProfileError(source, "unknown mode '" + mode +
                                   "' (expected 'sim' or 'replay')");
  }

  config.profile = string_field(node, "profile", "", source);
  if (!config.profile.empty() && !base_dir.empty() &&
      fs::path(config.profile).is_relative() &&
      fs::exists(base_dir / config.profile)) {
    config.profile = (base_dir / config.profile).string();
  }
  config.session =
      relative_to(string_field(node, "session", "", source), base_dir);
  config.record_to =
      relative_to(string_field(node, "record_to", "", source), base_dir);
  config.profile_root =
      relative_to(string_field(node, "profile_root", "", source), base_dir);
  config.override_root = string_field(node, "override_root", "", source);

  int64_t timeout = integer_field(node, "timeout_ms", config.timeout_ms, source);
  if (timeout <= 0)
    throw ProfileError(source, "'timeout_ms' must be positive");
  config.timeout_ms = static_cast<int>(timeout);

  if (node.contains("seed") && !node["seed"].is_null())
    config.seed = static_cast<uint64_t>(integer_field(node, "seed", 0, source));

  config.apply_user_override = bool_field(
      node, "apply_user_override", config.apply_user_override, source);

  if (config.mode == BackendMode::Sim && config.profile.empty())
    throw ProfileError(source, "mode 'sim' requires a 'profile'");
  if (config.mode == BackendMode::Replay && config.session.empty())
    throw ProfileError(source, "mode 'replay' requires a 'session'");
  return config;
}

BackendConfig load_backend_config(const fs::path &path) {
  LOG_INFO("FACTORY", "CONFIG", "Loading backend configuration: {}",
           path.string());
  try {
    json document = profile::load_document(path);
    return parse_backend_config(document, path.string(), path.parent_path());
  } catch (const ProfileError &ex) {
    LOG_ERROR("FACTORY", "CONFIG", "Invalid backend configuration: {}",
              ex.what());
    throw;
  }
}

InstrumentBackendPtr create_backend(const BackendConfig &config) {
  InstrumentBackendPtr backend;

  switch (config.mode) {
  case BackendMode::Sim: {
    if (config.profile.empty())
      throw ProfileError(config.name, "no profile configured");
    sim::SimulationOptions options;
    options.timeout_ms = config.timeout_ms;
    options.seed = config.seed;
    options.packaged_root = config.profile_root;
    options.override_root = config.override_root;
    options.apply_user_override = config.apply_user_override;
    backend = std::make_unique<sim::SimulationBackend>(config.profile, options);
    break;
  }
  case BackendMode::Replay: {
    if (config.session.empty())
      throw ProfileError(config.name, "no session file configured");
    backend = replay::ReplayBackend::from_session_file(config.session,
                                                       config.name);
    backend->set_timeout(config.timeout_ms);
    break;
  }
  }

  if (!config.record_to.empty()) {
    LOG_INFO(config.name, "FACTORY", "Recording session to {}",
             config.record_to);
    backend = std::make_unique<replay::SessionRecordingBackend>(
        std::move(backend), config.name, config.profile,
        fs::path(config.record_to));
  }

  LOG_INFO(config.name, "FACTORY", "Created {} backend",
           backend->backend_type());
  return backend;
}

} // namespace instsim

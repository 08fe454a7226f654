#pragma once
#include "instrument-sim/backend/InstrumentBackend.hpp"
#include "instrument-sim/export.h"

#include <cstdint>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace instsim {

enum class BackendMode { Sim, Replay };

INSTRUMENT_SIM_API std::string to_string(BackendMode mode);

/// Backend selection for one instrument
///
/// ```yaml
/// name: psu
/// mode: sim              # or replay
/// profile: acme/psu      # sim: profile path or key
/// session: bench.yaml    # replay: session file
/// timeout_ms: 5000
/// seed: 42
/// record_to: run.yaml    # optional, wraps the backend in a recorder
/// apply_user_override: true
/// ```
struct BackendConfig {
  std::string name{"instrument"};
  BackendMode mode{BackendMode::Sim};
  std::string profile;
  std::string session;
  int timeout_ms{5000};
  std::optional<uint64_t> seed;
  std::string record_to;
  bool apply_user_override{true};
  std::string profile_root;
  std::string override_root;
};

/// Missing fields keep their defaults. Relative `session` and `record_to`
/// paths, and a relative `profile` that exists there, are taken relative to
/// `base_dir`. Throws ProfileError naming `source` on bad values.
INSTRUMENT_SIM_API BackendConfig
parse_backend_config(const nlohmann::json &node, const std::string &source,
                     const std::filesystem::path &base_dir = {});

/// Throws ProfileError when the file is missing or malformed
INSTRUMENT_SIM_API BackendConfig
load_backend_config(const std::filesystem::path &path);

/// SimulationBackend or ReplayBackend, wrapped in a SessionRecordingBackend
/// when `record_to` is set
INSTRUMENT_SIM_API InstrumentBackendPtr
create_backend(const BackendConfig &config);

} // namespace instsim

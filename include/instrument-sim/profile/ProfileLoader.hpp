#pragma once
#include "instrument-sim/export.h"
#include "instrument-sim/profile/Profile.hpp"

#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace YAML {
class Node;
}

namespace instsim {
namespace profile {

/// Environment variable naming the packaged profile root
inline constexpr const char *kProfileRootEnv = "INSTRUMENT_SIM_PROFILE_ROOT";
/// Environment variable naming the user override root
inline constexpr const char *kOverrideRootEnv = "INSTRUMENT_SIM_OVERRIDE_ROOT";

struct LoadOptions {
  std::filesystem::path packaged_root;
  std::filesystem::path override_root;
  bool apply_user_override{true};
};

/// Convert a YAML tree to JSON. Scalars stay strings so that response text
/// such as "+9.99749200E-01" is never reformatted; nulls stay null.
INSTRUMENT_SIM_API nlohmann::json yaml_to_json(const YAML::Node &node);

/// Parse a YAML file; throws ProfileError naming the path on failure
INSTRUMENT_SIM_API nlohmann::json
load_document(const std::filesystem::path &path);

/// Recursive merge: maps merge key by key, override wins on scalars, lists
/// are concatenated with the override entries first
INSTRUMENT_SIM_API nlohmann::json merge(const nlohmann::json &base,
                                        const nlohmann::json &override_doc);

/// `INSTRUMENT_SIM_PROFILE_ROOT`, else ./profiles
INSTRUMENT_SIM_API std::filesystem::path default_packaged_root();

/// `INSTRUMENT_SIM_OVERRIDE_ROOT`, else ~/.instrument-sim/sim_profiles
INSTRUMENT_SIM_API std::filesystem::path default_override_root();

/// Override location for a profile under the packaged root, nullopt when
/// the profile lives elsewhere
INSTRUMENT_SIM_API std::optional<std::filesystem::path>
user_override_path(const std::filesystem::path &profile_path,
                   const std::filesystem::path &packaged_root,
                   const std::filesystem::path &override_root);

/// An existing path is returned unchanged; a key such as
/// `keysight/EDU36311A` maps to `<root>/keysight/EDU36311A.yaml`
INSTRUMENT_SIM_API std::filesystem::path
resolve_profile_path(const std::string &key,
                     const std::filesystem::path &packaged_root);

/// Validate a profile document and resolve every entry. Throws ProfileError
/// naming `source` and the offending key.
INSTRUMENT_SIM_API Profile compile(const nlohmann::json &document,
                                   const std::string &source);

/// Load, merge the user override when one exists, compile
INSTRUMENT_SIM_API Profile load(const std::filesystem::path &path,
                                const LoadOptions &options);

} // namespace profile
} // namespace instsim

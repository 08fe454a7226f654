#pragma once
#include "instrument-sim/backend/InstrumentBackend.hpp"
#include "instrument-sim/profile/Profile.hpp"
#include "instrument-sim/sim/DispatchTable.hpp"
#include "instrument-sim/sim/ErrorQueue.hpp"
#include "instrument-sim/sim/StateStore.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace instsim {
namespace sim {

struct SimulationOptions {
  /// Overrides the profile's model name when set
  std::string model;
  int timeout_ms{5000};
  /// Seed for random.* expressions; a random device is used when empty
  std::optional<uint64_t> seed;
  /// Empty roots fall back to default_packaged_root()/default_override_root()
  std::filesystem::path packaged_root;
  std::filesystem::path override_root;
  bool apply_user_override{true};
};

/// Profile-driven instrument simulator.
///
/// Each command is resolved by an exact lookup, then the ordered pattern
/// rules, then the built-in commands (error query, *CLS, *IDN?). Matched
/// entries may mutate the instrument state and queue instrument errors.
class INSTRUMENT_SIM_API SimulationBackend : public InstrumentBackend {
public:
  static constexpr int kDefaultTimeoutMs = 5000;

  /// `profile_key` is a path or a key under the packaged profile root.
  /// Throws ProfileError when the profile cannot be loaded.
  explicit SimulationBackend(const std::string &profile_key,
                             SimulationOptions options = {});

  /// Use an already compiled profile
  explicit SimulationBackend(profile::Profile compiled,
                             SimulationOptions options = {});

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
  void set_timeout(int timeout_ms) override { timeout_ms_ = timeout_ms; }
  int get_timeout() const override { return timeout_ms_; }
  std::string backend_type() const override { return "sim"; }

  const std::string &model() const { return model_; }
  const profile::Profile &loaded_profile() const { return profile_; }
  const StateStore &state() const { return state_; }
  std::size_t pending_errors() const { return errors_.size(); }
  const DispatchTable &dispatch_table() const { return dispatch_; }

private:
  struct Outcome {
    std::string response;
    std::optional<double> delay_seconds;
  };

  void init();

  std::string resolve(const std::string &command, bool expect_response);
  Outcome execute(const profile::ResponseEntry &entry,
                  const std::vector<std::string> &captures);
  nlohmann::json evaluate(const profile::ScalarEntry &entry,
                          const StateStore &state,
                          const std::vector<std::string> &captures);
  nlohmann::json numeric_delta(const profile::ScalarEntry &entry,
                               const StateStore &state,
                               const std::vector<std::string> &captures,
                               const std::string &key);
  void evaluate_error_rules(const std::string &command,
                            const std::vector<std::string> &captures);
  std::string identification() const;

  SimulationOptions options_;
  profile::Profile profile_;
  std::string model_;
  int timeout_ms_{kDefaultTimeoutMs};
  DispatchTable dispatch_;
  StateStore state_;
  ErrorQueue errors_;
  std::mt19937_64 rng_;
};

} // namespace sim
} // namespace instsim

#pragma once
#include "instrument-sim/export.h"
#include "instrument-sim/types.hpp"

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace instsim {

/// Harness-level failure inside the simulation engine (expression
/// evaluation, action execution). Thrown at the point of use.
class INSTRUMENT_SIM_API SimulationError : public std::runtime_error {
public:
  explicit SimulationError(const std::string &message)
      : std::runtime_error(message) {}
};

/// Missing or malformed profile, session file or backend configuration.
/// Thrown at load time; the message names the offending path.
class INSTRUMENT_SIM_API ProfileError : public SimulationError {
public:
  ProfileError(const std::string &path, const std::string &reason)
      : SimulationError(path.empty() ? reason : path + ": " + reason),
        path_(path) {}

  const std::string &path() const { return path_; }

private:
  std::string path_;
};

/// A replayed call diverged from the recorded session log.
class INSTRUMENT_SIM_API ReplayMismatchError : public std::runtime_error {
public:
  /// Kind or command mismatch at a valid log position
  ReplayMismatchError(const std::string &message, CommandKind expected_kind,
                      std::string expected_command, CommandKind actual_kind,
                      std::string actual_command, std::size_t log_index)
      : std::runtime_error(message), expected_kind_(expected_kind),
        expected_command_(std::move(expected_command)),
        actual_kind_(actual_kind), actual_command_(std::move(actual_command)),
        log_index_(log_index) {}

  /// Call received after the log was fully consumed
  ReplayMismatchError(const std::string &message, CommandKind actual_kind,
                      std::string actual_command, std::size_t log_index)
      : std::runtime_error(message),
        actual_kind_(actual_kind), actual_command_(std::move(actual_command)),
        log_index_(log_index), log_exhausted_(true) {}

  /// Empty when the log was exhausted
  const std::optional<CommandKind> &expected_kind() const {
    return expected_kind_;
  }
  const std::string &expected_command() const { return expected_command_; }
  CommandKind actual_kind() const { return actual_kind_; }
  const std::string &actual_command() const { return actual_command_; }
  std::size_t log_index() const { return log_index_; }
  bool log_exhausted() const { return log_exhausted_; }

private:
  std::optional<CommandKind> expected_kind_;
  std::string expected_command_;
  CommandKind actual_kind_;
  std::string actual_command_;
  std::size_t log_index_;
  bool log_exhausted_{false};
};

} // namespace instsim

#pragma once
#include "instrument-sim/export.h"

#include <cstddef>
#include <deque>
#include <string>
#include <utility>

namespace instsim {
namespace sim {

/// Instrument error queue (SCPI style). Entries surface only when the
/// caller polls the error-status query.
class INSTRUMENT_SIM_API ErrorQueue {
public:
  /// Reply when the queue is empty
  static constexpr const char *kNoError = "+0,\"No error\"";

  void push(int code, std::string message);

  /// Remove the oldest entry and format it as `<code>,"<message>"`
  std::string pop_formatted();

  void clear() { entries_.clear(); }
  std::size_t size() const { return entries_.size(); }
  bool empty() const { return entries_.empty(); }

  const std::deque<std::pair<int, std::string>> &entries() const {
    return entries_;
  }

private:
  std::deque<std::pair<int, std::string>> entries_;
};

} // namespace sim
} // namespace instsim

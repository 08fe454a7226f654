#include "instrument-sim/sim/ErrorQueue.hpp"

#include <fmt/format.h>

namespace instsim {
namespace sim {

void ErrorQueue::push(int code, std::string message) {
  entries_.emplace_back(code, std::move(message));
}

std::string ErrorQueue::pop_formatted() {
  if (entries_.empty())
    return kNoError;
  auto [code, message] = std::move(entries_.front());
  entries_.pop_front();
  return fmt::format("{},\"{}\"", code, message);
}

} // namespace sim
} // namespace instsim

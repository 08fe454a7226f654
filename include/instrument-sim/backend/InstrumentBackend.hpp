#pragma once
#include "instrument-sim/export.h"

#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <string>
#include <vector>

namespace instsim {

/// InstrumentBackend: the message-level I/O contract every simulated,
/// replayed or recorded instrument session implements.
///
/// Calls run on the caller's thread. A backend instance holds unlocked
/// state (dispatch tables, instrument state, replay cursor), so at most one
/// call may be in flight per instance at any time. Callers sharing a
/// backend across threads must serialize access themselves.
class INSTRUMENT_SIM_API InstrumentBackend {
public:
  virtual ~InstrumentBackend() = default;

  virtual void connect() = 0;
  virtual void disconnect() = 0;

  /// Send a command that produces no response
  virtual void write(const std::string &command) = 0;

  /// Send a command and return its decoded response. A non-zero `delay` is
  /// waited before the command is handled.
  virtual std::string
  query(const std::string &command,
        std::chrono::milliseconds delay = std::chrono::milliseconds(0)) = 0;

  /// As query(), response as raw bytes
  virtual std::vector<uint8_t>
  query_raw(const std::string &command,
            std::chrono::milliseconds delay = std::chrono::milliseconds(0)) = 0;

  virtual void close() = 0;

  /// Timeout bookkeeping, in milliseconds. Never cancels a call.
  virtual void set_timeout(int timeout_ms) = 0;
  virtual int get_timeout() const = 0;

  /// Backend kind for logging ("sim", "replay", "record:<inner>")
  virtual std::string backend_type() const = 0;

  /// Deferred helpers: the call runs on the thread that calls get()
  std::future<void> write_async(std::string command) {
    return std::async(std::launch::deferred,
                      [this, cmd = std::move(command)] { write(cmd); });
  }

  std::future<std::string>
  query_async(std::string command,
              std::chrono::milliseconds delay = std::chrono::milliseconds(0)) {
    return std::async(std::launch::deferred,
                      [this, cmd = std::move(command), delay] {
                        return query(cmd, delay);
                      });
  }

  std::future<std::vector<uint8_t>> query_raw_async(
      std::string command,
      std::chrono::milliseconds delay = std::chrono::milliseconds(0)) {
    return std::async(std::launch::deferred,
                      [this, cmd = std::move(command), delay] {
                        return query_raw(cmd, delay);
                      });
  }
};

using InstrumentBackendPtr = std::unique_ptr<InstrumentBackend>;

} // namespace instsim

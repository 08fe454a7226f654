#pragma once
#include "instrument-sim/export.h"

#include <fmt/format.h>
#include <memory>
#include <mutex>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace instsim {

/// Centralized logging with instrument and operation context
class INSTRUMENT_SIM_API InstrumentLogger {
public:
  static InstrumentLogger &instance();

  // Initialize with file and console sinks
  void init(const std::string &log_file = "instrument_sim.log",
            spdlog::level::level_enum level = spdlog::level::debug) {
    std::lock_guard<std::mutex> lock(mutex_);

    // If already initialized, just update level
    if (logger_) {
      logger_->set_level(level);
      logger_->flush_on(level);
      return;
    }

    try {
      auto console_sink =
          std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
      console_sink->set_level(spdlog::level::info);

      auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
          log_file, 1024 * 1024 * 10, 3); // 10MB, 3 files
      file_sink->set_level(spdlog::level::trace);

      std::vector<spdlog::sink_ptr> sinks{console_sink, file_sink};
      logger_ = std::make_shared<spdlog::logger>("instrument-sim",
                                                 sinks.begin(), sinks.end());
      logger_->set_level(level);
      logger_->flush_on(level);

      if (!spdlog::get("instrument-sim")) {
        spdlog::register_logger(logger_);
      }
    } catch (const spdlog::spdlog_ex &ex) {
      fmt::print(stderr, "Log initialization failed: {}\n", ex.what());
    }
  }

  // Drop the logger from the spdlog registry so a later init() recreates
  // the sinks (used by tests).
  void shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    spdlog::drop("instrument-sim");
    logger_.reset();
  }

  bool is_initialized() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return logger_ != nullptr;
  }

  template <typename... Args>
  void trace(const std::string &instr_name, const std::string &operation,
             const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::trace, instr_name, operation, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void debug(const std::string &instr_name, const std::string &operation,
             const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::debug, instr_name, operation, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void info(const std::string &instr_name, const std::string &operation,
            const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::info, instr_name, operation, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void warn(const std::string &instr_name, const std::string &operation,
            const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::warn, instr_name, operation, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void error(const std::string &instr_name, const std::string &operation,
             const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::err, instr_name, operation, fmt_str,
        std::forward<Args>(args)...);
  }

private:
  InstrumentLogger() = default;

  template <typename... Args>
  void log(spdlog::level::level_enum level, const std::string &instr_name,
           const std::string &operation, const std::string &fmt_str,
           Args &&...args) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!logger_)
      return;

    // Format:  [instrument_name] [operation] message
    std::string prefix = fmt::format("[{}] [{}] ", instr_name, operation);
    std::string full_msg = prefix + fmt::format(fmt::runtime(fmt_str),
                                                std::forward<Args>(args)...);
    logger_->log(level, full_msg);
  }

  std::shared_ptr<spdlog::logger> logger_;
  mutable std::mutex mutex_;
};

// Convenience macros
#define LOG_TRACE(instr, op, ...)                                              \
  instsim::InstrumentLogger::instance().trace(instr, op, __VA_ARGS__)
#define LOG_DEBUG(instr, op, ...)                                              \
  instsim::InstrumentLogger::instance().debug(instr, op, __VA_ARGS__)
#define LOG_INFO(instr, op, ...)                                               \
  instsim::InstrumentLogger::instance().info(instr, op, __VA_ARGS__)
#define LOG_WARN(instr, op, ...)                                               \
  instsim::InstrumentLogger::instance().warn(instr, op, __VA_ARGS__)
#define LOG_ERROR(instr, op, ...)                                              \
  instsim::InstrumentLogger::instance().error(instr, op, __VA_ARGS__)

} // namespace instsim

#include "instrument-sim/sim/SimulationBackend.hpp"
#include "instrument-sim/Errors.hpp"
#include "instrument-sim/Logger.hpp"
#include "instrument-sim/profile/ProfileLoader.hpp"
#include "instrument-sim/types.hpp"

#include <thread>
#include <type_traits>

namespace instsim {
namespace sim {

using json = nlohmann::json;

namespace {

bool ends_with(const std::string &text, const std::string &suffix) {
  return text.size() >= suffix.size() &&
         text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool is_error_query(const std::string &upper) {
  return ends_with(upper, "SYST:ERR?") || ends_with(upper, "SYSTEM:ERROR?");
}

profile::LoadOptions load_options(const SimulationOptions &options) {
  profile::LoadOptions out;
  out.packaged_root = options.packaged_root.empty()
                          ? profile::default_packaged_root()
                          : options.packaged_root;
  out.override_root = options.override_root.empty()
                          ? profile::default_override_root()
                          : options.override_root;
  out.apply_user_override = options.apply_user_override;
  return out;
}

profile::Profile load_profile(const std::string &key,
                              const SimulationOptions &options) {
  auto load_opts = load_options(options);
  auto path = profile::resolve_profile_path(key, load_opts.packaged_root);
  return profile::load(path, load_opts);
}

} // namespace

SimulationBackend::SimulationBackend(const std::string &profile_key,
                                     SimulationOptions options)
    : options_(std::move(options)),
      profile_(load_profile(profile_key, options_)) {
  init();
}

SimulationBackend::SimulationBackend(profile::Profile compiled,
                                     SimulationOptions options)
    : options_(std::move(options)), profile_(std::move(compiled)) {
  init();
}

void SimulationBackend::init() {
  model_ = options_.model.empty() ? profile_.model : options_.model;
  timeout_ms_ = options_.timeout_ms;

  try {
    dispatch_ = DispatchTable(profile_.scpi, profile_.source_path);
    state_.seed(profile_.initial_state);
  } catch (const ProfileError &ex) {
    LOG_ERROR(model_, "INIT", "Failed to build simulator: {}", ex.what());
    throw;
  } catch (const SimulationError &ex) {
    LOG_ERROR(model_, "INIT", "Failed to build simulator: {}", ex.what());
    throw ProfileError(profile_.source_path, ex.what());
  }

  if (options_.seed) {
    rng_.seed(*options_.seed);
  } else {
    std::random_device rd;
    rng_.seed((static_cast<uint64_t>(rd()) << 32) | rd());
  }

  LOG_INFO(model_, "INIT",
           "Simulation backend ready ({} exact, {} pattern, {} error rules)",
           dispatch_.exact_count(), dispatch_.pattern_rules().size(),
           profile_.errors.size());
}

void SimulationBackend::connect() {
  LOG_INFO(model_, "CONNECT", "Connected (simulated)");
}

void SimulationBackend::disconnect() {
  LOG_INFO(model_, "DISCONNECT", "Disconnected (simulated)");
}

void SimulationBackend::close() { disconnect(); }

void SimulationBackend::write(const std::string &command) {
  LOG_DEBUG(model_, "WRITE", "{}", trim(command));
  resolve(command, false);
}

std::string SimulationBackend::query(const std::string &command,
                                     std::chrono::milliseconds delay) {
  if (delay.count() > 0)
    std::this_thread::sleep_for(delay);
  std::string response = resolve(command, true);
  LOG_DEBUG(model_, "QUERY", "{} -> {}", trim(command), response);
  return response;
}

std::vector<uint8_t> SimulationBackend::query_raw(
    const std::string &command, std::chrono::milliseconds delay) {
  std::string response = query(command, delay);
  return std::vector<uint8_t>(response.begin(), response.end());
}

std::string SimulationBackend::resolve(const std::string &command,
                                       bool expect_response) {
  std::string cmd = trim(command);
  std::string upper = to_upper(cmd);

  auto match = dispatch_.lookup(cmd);
  if (match) {
    LOG_TRACE(model_, "DISPATCH", "'{}' matched '{}'", cmd, match->key);
    Outcome outcome = execute(*match->entry, match->captures);
    evaluate_error_rules(cmd, match->captures);
    if (outcome.delay_seconds && *outcome.delay_seconds > 0.0) {
      LOG_DEBUG(model_, "DELAY", "Busy for {:.3f}s", *outcome.delay_seconds);
      std::this_thread::sleep_for(
          std::chrono::duration<double>(*outcome.delay_seconds));
    }
    return expect_response ? outcome.response : std::string();
  }

  if (is_error_query(upper))
    return errors_.pop_formatted();
  if (upper == "*CLS") {
    errors_.clear();
    return "";
  }
  if (upper == "*IDN?")
    return identification();

  LOG_WARN(model_, "DISPATCH", "No profile entry for '{}'", cmd);
  return "";
}

SimulationBackend::Outcome
SimulationBackend::execute(const profile::ResponseEntry &entry,
                           const std::vector<std::string> &captures) {
  return std::visit(
      [&](auto &&arg) -> Outcome {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, profile::ActionMap>) {
          // Stage every mutation so a failure leaves the state untouched
          StateStore staged = state_;
          for (const auto &[key, value] : arg.set) {
            staged.set(key, evaluate(value, staged, captures));
          }
          for (const auto &[key, value] : arg.inc) {
            staged.add(key, numeric_delta(value, staged, captures, key));
          }
          for (const auto &[key, value] : arg.dec) {
            json delta = numeric_delta(value, staged, captures, key);
            if (delta.is_number_integer())
              staged.add(key, checked_sub(0, delta.get<int64_t>()));
            else
              staged.add(key, -delta.get<double>());
          }

          Outcome outcome;
          if (arg.get) {
            outcome.response = staged.get_string(*arg.get);
          } else if (arg.response) {
            outcome.response =
                format_value(evaluate(*arg.response, staged, captures));
          }
          state_ = std::move(staged);
          outcome.delay_seconds = arg.delay_seconds;
          return outcome;
        } else {
          return Outcome{format_value(evaluate(arg, state_, captures)),
                         std::nullopt};
        }
      },
      entry);
}

json SimulationBackend::evaluate(const profile::ScalarEntry &entry,
                                 const StateStore &state,
                                 const std::vector<std::string> &captures) {
  return std::visit(
      [&](auto &&arg) -> json {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, profile::LiteralValue>) {
          return arg.value;
        } else if constexpr (std::is_same_v<T, profile::TemplateValue>) {
          return profile::substitute_captures(arg.text, captures);
        } else {
          EvalContext ctx{state, captures, rng_};
          return arg.expression->evaluate(ctx);
        }
      },
      entry);
}

json SimulationBackend::numeric_delta(const profile::ScalarEntry &entry,
                                      const StateStore &state,
                                      const std::vector<std::string> &captures,
                                      const std::string &key) {
  json value = evaluate(entry, state, captures);
  if (value.is_number())
    return value;
  if (value.is_string()) {
    auto parsed = parse_number(value.get<std::string>());
    if (parsed)
      return *parsed;
  }
  throw SimulationError("'" + key + "' step " + value.dump() +
                        " is not a number");
}

void SimulationBackend::evaluate_error_rules(
    const std::string &command, const std::vector<std::string> &captures) {
  for (const auto &rule : profile_.errors) {
    std::smatch m;
    if (!std::regex_match(command, m, rule.matcher))
      continue;

    std::vector<std::string> groups;
    if (rule.matcher.mark_count() > 0) {
      for (std::size_t i = 1; i < m.size(); ++i)
        groups.push_back(m[i].matched ? m[i].str() : std::string());
    } else {
      groups = captures;
    }

    EvalContext ctx{state_, groups, rng_};
    if (rule.condition->evaluate_condition(ctx)) {
      LOG_DEBUG(model_, "ERROR", "Queued {},\"{}\" for '{}'", rule.code,
                rule.message, command);
      errors_.push(rule.code, rule.message);
    }
  }
}

std::string SimulationBackend::identification() const {
  if (profile_.identification)
    return *profile_.identification;
  return "Simulated,instrument-sim," + model_ + "-SIM,1.0";
}

} // namespace sim
} // namespace instsim

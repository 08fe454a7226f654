#include "instrument-sim/profile/ProfileLoader.hpp"
#include "instrument-sim/Errors.hpp"
#include "instrument-sim/Logger.hpp"
#include "instrument-sim/types.hpp"

#include <cstdlib>
#include <yaml-cpp/yaml.h>

namespace fs = std::filesystem;

namespace instsim {
namespace profile {

using json = nlohmann::json;

namespace {

const std::string kDynamicPrefix = "expr:";

std::string describe(const json &value) {
  if (value.is_object())
    return "a map";
  if (value.is_array())
    return "a list";
  if (value.is_null())
    return "empty";
  if (value.is_string())
    return "'" + value.get<std::string>() + "'";
  return value.dump();
}

/// Literal, template or `expr:` value
ScalarEntry compile_scalar(const std::string &text, const std::string &source,
                           const std::string &where) {
  std::string trimmed = trim(text);
  if (trimmed.compare(0, kDynamicPrefix.size(), kDynamicPrefix) == 0) {
    try {
      return DynamicValue{
          sim::Expression::compile(trim(trimmed.substr(kDynamicPrefix.size())))};
    } catch (const SimulationError &ex) {
      throw ProfileError(source, where + ": " + ex.what());
    }
  }
  if (has_placeholders(text))
    return TemplateValue{text};
  return LiteralValue{text};
}

std::vector<std::pair<std::string, ScalarEntry>>
compile_assignments(const json &node, const std::string &field,
                    bool allow_structured, const std::string &source,
                    const std::string &where) {
  if (!node.is_object()) {
    throw ProfileError(source, where + ": '" + field + "' must be a map, got " +
                                   describe(node));
  }
  std::vector<std::pair<std::string, ScalarEntry>> out;
  for (auto &[key, value] : node.items()) {
    std::string target = where + "." + field + "." + key;
    if (value.is_string()) {
      out.emplace_back(key, compile_scalar(value.get<std::string>(), source,
                                           target));
    } else if (allow_structured) {
      out.emplace_back(key, LiteralValue{value});
    } else {
      throw ProfileError(source, target + ": expected a number or expression, got " +
                                     describe(value));
    }
  }
  return out;
}

ActionMap compile_action(const json &node, const std::string &source,
                         const std::string &where) {
  ActionMap action;
  for (auto &[field, value] : node.items()) {
    if (field == "delay") {
      auto seconds = value.is_string()
                         ? sim::parse_number(value.get<std::string>())
                         : std::optional<json>();
      if (!seconds || seconds->get<double>() < 0.0) {
        throw ProfileError(source, where + ": 'delay' must be a non-negative "
                                           "number of seconds, got " +
                                       describe(value));
      }
      action.delay_seconds = seconds->get<double>();
    } else if (field == "set") {
      action.set = compile_assignments(value, field, true, source, where);
    } else if (field == "inc") {
      action.inc = compile_assignments(value, field, false, source, where);
    } else if (field == "dec") {
      action.dec = compile_assignments(value, field, false, source, where);
    } else if (field == "get") {
      if (!value.is_string()) {
        throw ProfileError(source, where + ": 'get' must name a state key, got " +
                                       describe(value));
      }
      action.get = value.get<std::string>();
    } else if (field == "response") {
      if (value.is_null()) {
        action.response = LiteralValue{std::string()};
      } else if (value.is_string()) {
        action.response = compile_scalar(value.get<std::string>(), source,
                                         where + ".response");
      } else {
        throw ProfileError(source, where + ": 'response' must be text, got " +
                                       describe(value));
      }
    } else {
      LOG_WARN("PROFILE", "COMPILE", "{}: ignoring unknown field '{}' in {}",
               source, field, where);
    }
  }
  return action;
}

ResponseEntry compile_entry(const std::string &key, const json &value,
                            const std::string &source) {
  std::string where = "scpi '" + key + "'";
  if (value.is_null())
    return LiteralValue{std::string()};
  if (value.is_object())
    return compile_action(value, source, where);
  if (value.is_array())
    return LiteralValue{value};
  return std::visit(
      [](auto &&entry) -> ResponseEntry { return entry; },
      compile_scalar(value.get<std::string>(), source, where));
}

ErrorSpec compile_error(const json &node, std::size_t index,
                        const std::string &source) {
  std::string where = "errors[" + std::to_string(index) + "]";
  if (!node.is_object())
    throw ProfileError(source, where + " must be a map");

  ErrorSpec rule;
  const char *pattern_key = node.contains("pattern") ? "pattern" : "scpi";
  if (!node.contains(pattern_key) || !node[pattern_key].is_string())
    throw ProfileError(source, where + ": missing 'pattern'");
  rule.pattern = node[pattern_key].get<std::string>();
  try {
    rule.matcher = std::regex(rule.pattern, std::regex::ECMAScript |
                                                std::regex::icase);
  } catch (const std::regex_error &ex) {
    throw ProfileError(source, where + ": invalid pattern '" + rule.pattern +
                                   "': " + ex.what());
  }

  std::string condition = "false";
  if (node.contains("condition") && !node["condition"].is_null()) {
    if (!node["condition"].is_string())
      throw ProfileError(source, where + ": 'condition' must be an expression");
    condition = node["condition"].get<std::string>();
  }
  try {
    rule.condition = sim::Expression::compile(condition);
  } catch (const SimulationError &ex) {
    throw ProfileError(source, where + ": " + ex.what());
  }

  if (!node.contains("code") || !node["code"].is_string())
    throw ProfileError(source, where + ": missing 'code'");
  auto code = sim::parse_number(node["code"].get<std::string>());
  if (!code || !code->is_number_integer())
    throw ProfileError(source, where + ": 'code' must be an integer, got " +
                                   describe(node["code"]));
  rule.code = static_cast<int>(code->get<int64_t>());

  if (!node.contains("message") || !node["message"].is_string())
    throw ProfileError(source, where + ": missing 'message'");
  rule.message = node["message"].get<std::string>();
  return rule;
}

} // namespace

json yaml_to_json(const YAML::Node &node) {
  if (node.IsNull()) {
    return nullptr;
  } else if (node.IsScalar()) {
    return node.Scalar();
  } else if (node.IsSequence()) {
    json arr = json::array();
    for (const auto &item : node) {
      arr.push_back(yaml_to_json(item));
    }
    return arr;
  } else if (node.IsMap()) {
    json obj = json::object();
    for (const auto &kv : node) {
      obj[kv.first.as<std::string>()] = yaml_to_json(kv.second);
    }
    return obj;
  }
  return nullptr;
}

json load_document(const fs::path &path) {
  if (!fs::exists(path)) {
    throw ProfileError(path.string(), "file does not exist");
  }
  try {
    YAML::Node root = YAML::LoadFile(path.string());
    return yaml_to_json(root);
  } catch (const YAML::Exception &ex) {
    throw ProfileError(path.string(), std::string("invalid YAML: ") + ex.what());
  }
}

json merge(const json &base, const json &override_doc) {
  if (override_doc.is_null())
    return base;
  if (!base.is_object() || !override_doc.is_object())
    return override_doc;

  json out = base;
  for (auto &[key, value] : override_doc.items()) {
    auto it = out.find(key);
    if (it != out.end() && it->is_object() && value.is_object()) {
      *it = merge(*it, value);
    } else if (it != out.end() && it->is_array() && value.is_array()) {
      json combined = value;
      for (const auto &item : *it)
        combined.push_back(item);
      *it = std::move(combined);
    } else {
      out[key] = value;
    }
  }
  return out;
}

fs::path default_packaged_root() {
  const char *root = std::getenv(kProfileRootEnv);
  if (root && *root)
    return fs::path(root);
  return fs::path("profiles");
}

fs::path default_override_root() {
  const char *root = std::getenv(kOverrideRootEnv);
  if (root && *root)
    return fs::path(root);
#ifdef _WIN32
  const char *home = std::getenv("USERPROFILE");
#else
  const char *home = std::getenv("HOME");
#endif
  return fs::path(home ? home : ".") / ".instrument-sim" / "sim_profiles";
}

std::optional<fs::path> user_override_path(const fs::path &profile_path,
                                           const fs::path &packaged_root,
                                           const fs::path &override_root) {
  if (packaged_root.empty() || override_root.empty())
    return std::nullopt;

  std::error_code ec;
  fs::path profile_abs = fs::weakly_canonical(profile_path, ec);
  if (ec)
    return std::nullopt;
  fs::path root_abs = fs::weakly_canonical(packaged_root, ec);
  if (ec)
    return std::nullopt;

  fs::path rel = profile_abs.lexically_relative(root_abs);
  if (rel.empty() || *rel.begin() == "..")
    return std::nullopt;
  return override_root / rel;
}

fs::path resolve_profile_path(const std::string &key,
                              const fs::path &packaged_root) {
  fs::path direct(key);
  if (fs::exists(direct))
    return direct;
  fs::path keyed = packaged_root / key;
  if (keyed.extension() != ".yaml" && keyed.extension() != ".yml")
    keyed += ".yaml";
  return keyed;
}

Profile compile(const json &document, const std::string &source) {
  json doc = document.is_null() ? json::object() : document;
  if (!doc.is_object())
    throw ProfileError(source, "profile document must be a map");

  Profile profile;
  profile.source_path = source;
  if (doc.contains("model") && doc["model"].is_string())
    profile.model = doc["model"].get<std::string>();
  if (profile.model.empty())
    profile.model = fs::path(source).stem().string();
  if (doc.contains("identification") && doc["identification"].is_string())
    profile.identification = doc["identification"].get<std::string>();

  json sim = json::object();
  if (!doc.contains("simulation")) {
    LOG_WARN("PROFILE", "COMPILE",
             "{} has no 'simulation' section, treating it as empty", source);
  } else if (!doc["simulation"].is_null()) {
    sim = doc["simulation"];
    if (!sim.is_object())
      throw ProfileError(source, "'simulation' must be a map");
  }

  if (sim.contains("initial_state") && !sim["initial_state"].is_null()) {
    if (!sim["initial_state"].is_object())
      throw ProfileError(source, "'initial_state' must be a map");
    profile.initial_state = sim["initial_state"];
  }

  if (sim.contains("scpi") && !sim["scpi"].is_null()) {
    if (!sim["scpi"].is_object())
      throw ProfileError(source, "'scpi' must be a map");
    for (auto &[key, value] : sim["scpi"].items()) {
      profile.scpi.emplace(key, compile_entry(key, value, source));
    }
  }

  if (sim.contains("errors") && !sim["errors"].is_null()) {
    if (!sim["errors"].is_array())
      throw ProfileError(source, "'errors' must be a list");
    std::size_t index = 0;
    for (const auto &item : sim["errors"]) {
      profile.errors.push_back(compile_error(item, index++, source));
    }
  }

  LOG_DEBUG("PROFILE", "COMPILE", "{}: {} scpi entries, {} error rules",
            source, profile.scpi.size(), profile.errors.size());
  return profile;
}

Profile load(const fs::path &path, const LoadOptions &options) {
  LOG_INFO("PROFILE", "LOAD", "Loading profile: {}", path.string());

  try {
    json document = load_document(path);

    if (options.apply_user_override) {
      auto override_path = user_override_path(path, options.packaged_root,
                                              options.override_root);
      if (override_path && fs::exists(*override_path)) {
        document = merge(document, load_document(*override_path));
        LOG_INFO("PROFILE", "LOAD", "Merged user override {} into profile",
                 override_path->string());
      }
    }

    return compile(document, path.string());
  } catch (const ProfileError &ex) {
    LOG_ERROR("PROFILE", "LOAD", "Failed to load profile: {}", ex.what());
    throw;
  }
}

} // namespace profile
} // namespace instsim

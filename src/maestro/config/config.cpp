#include "maestro/config/config.hpp"

#include "maestro/config/yaml_utils.hpp"
#include "maestro/util/log.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <array>
#include <fstream>
#include <sstream>

namespace YAML {

template <>
struct convert<maestro::EngineConfig> {
  static bool decode(const Node& node, maestro::EngineConfig& e) {
    if (!node.IsMap()) {
      return false;
    }
    e.max_parallel = maestro::yaml_get_or(node, "max_parallel", 4);
    e.max_retries =
        maestro::yaml_get_or(node, "max_retries", maestro::kDefaultMaxRetries);
    e.default_priority = maestro::yaml_get_or(node, "default_priority",
                                              maestro::kDefaultPriority);
    e.default_assignee = maestro::yaml_get_or<std::string>(
        node, "default_assignee", std::string(maestro::kDefaultAssignee));
    e.result_preview_chars = maestro::yaml_get_or<std::size_t>(
        node, "result_preview_chars", maestro::kDefaultResultPreview);
    e.validate_plans = maestro::yaml_get_or(node, "validate_plans", true);
    return true;
  }
};

template <>
struct convert<maestro::ExecutorPoolConfig> {
  static bool decode(const Node& node, maestro::ExecutorPoolConfig& x) {
    if (!node.IsMap()) {
      return false;
    }
    x.threads = maestro::yaml_get_or(node, "threads", 4);
    return true;
  }
};

template <>
struct convert<maestro::LoggingConfig> {
  static bool decode(const Node& node, maestro::LoggingConfig& l) {
    if (!node.IsMap()) {
      return false;
    }
    l.level = maestro::yaml_get_or<std::string>(node, "level", "info");
    return true;
  }
};

template <>
struct convert<maestro::AgentProfile> {
  static bool decode(const Node& node, maestro::AgentProfile& a) {
    if (!node.IsMap() || !node["name"]) {
      return false;
    }
    a.name = node["name"].as<std::string>();
    a.role = maestro::yaml_get_or<std::string>(node, "role", "");
    a.description = maestro::yaml_get_or<std::string>(node, "description", "");
    for (const auto& name :
         maestro::yaml_get_list<std::string>(node, "capabilities")) {
      auto cap = maestro::parse_capability(name);
      if (!cap) {
        maestro::log::error("Agent '{}': unknown capability '{}'", a.name,
                            name);
        return false;
      }
      a.capabilities.push_back(*cap);
    }
    return true;
  }
};

template <>
struct convert<maestro::SystemConfig> {
  static bool decode(const Node& node, maestro::SystemConfig& c) {
    if (!node.IsMap()) {
      return false;
    }
    if (auto engine = node["engine"]) {
      c.engine = engine.as<maestro::EngineConfig>();
    }
    if (auto executor = node["executor"]) {
      c.executor = executor.as<maestro::ExecutorPoolConfig>();
    }
    if (auto logging = node["logging"]) {
      c.logging = logging.as<maestro::LoggingConfig>();
    }
    if (auto agents = node["agents"]) {
      if (!agents.IsSequence()) {
        return false;
      }
      for (const auto& agent : agents) {
        c.agents.push_back(agent.as<maestro::AgentProfile>());
      }
    }
    return true;
  }
};

}  // namespace YAML

namespace maestro {

namespace {

constexpr std::array<std::string_view, 6> kLogLevels{
    "trace", "debug", "info", "warn", "error", "off"};

auto validate(const SystemConfig& c) -> Result<void> {
  if (c.engine.max_parallel < 1) {
    log::error("engine.max_parallel must be at least 1, got {}",
               c.engine.max_parallel);
    return fail(Error::InvalidArgument);
  }
  if (c.engine.max_retries < 0) {
    log::error("engine.max_retries must not be negative, got {}",
               c.engine.max_retries);
    return fail(Error::InvalidArgument);
  }
  if (c.executor.threads < 1) {
    log::error("executor.threads must be at least 1, got {}",
               c.executor.threads);
    return fail(Error::InvalidArgument);
  }
  if (std::ranges::find(kLogLevels, c.logging.level) == kLogLevels.end()) {
    log::error("logging.level '{}' is not a known level", c.logging.level);
    return fail(Error::InvalidArgument);
  }
  return ok();
}

}  // namespace

auto ConfigLoader::load_from_file(std::string_view path)
    -> Result<SystemConfig> {
  std::string path_str{path};
  std::ifstream file(path_str);
  if (!file.is_open()) {
    log::error("Failed to open config file: {}", path);
    return fail(Error::FileNotFound);
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return load_from_string(buffer.str());
}

auto ConfigLoader::load_from_string(std::string_view yaml_str)
    -> Result<SystemConfig> {
  SystemConfig config;
  try {
    YAML::Node root = YAML::Load(std::string(yaml_str));
    if (!root.IsDefined() || root.IsNull()) {
      log::error("Failed to parse YAML: empty or invalid content");
      return fail(Error::ParseError);
    }
    config = root.as<SystemConfig>();
  } catch (const YAML::Exception& e) {
    log::error("YAML parse error: {}", e.what());
    return fail(Error::ParseError);
  }

  if (auto r = validate(config); !r) {
    return std::unexpected(r.error());
  }
  return ok(std::move(config));
}

auto to_engine_options(const EngineConfig& cfg) -> EngineOptions {
  return EngineOptions{
      .max_parallel = static_cast<std::size_t>(cfg.max_parallel),
      .max_retries = cfg.max_retries,
      .default_priority = cfg.default_priority,
      .default_assignee = cfg.default_assignee,
      .result_preview = cfg.result_preview_chars,
      .validate_plans = cfg.validate_plans,
  };
}

auto populate_registry(AgentRegistry& registry, const SystemConfig& cfg)
    -> void {
  if (cfg.agents.empty()) {
    register_default_profiles(registry);
    return;
  }
  for (const auto& profile : cfg.agents) {
    registry.register_agent(profile);
  }
}

}  // namespace maestro

#pragma once

#include "maestro/config/system_config.hpp"
#include "maestro/core/error.hpp"
#include "maestro/engine/engine.hpp"

#include <string_view>

namespace maestro {

using Config = SystemConfig;

class ConfigLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<SystemConfig>;
  [[nodiscard]] static auto load_from_string(std::string_view yaml_str)
      -> Result<SystemConfig>;
};

[[nodiscard]] auto to_engine_options(const EngineConfig& cfg) -> EngineOptions;

// Registers the configured agents, or the built-in roster when none are
// configured.
auto populate_registry(AgentRegistry& registry, const SystemConfig& cfg)
    -> void;

}  // namespace maestro

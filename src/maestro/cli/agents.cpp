#include "maestro/cli/commands.hpp"

#include "common.hpp"
#include "maestro/agent/registry.hpp"

#include <fmt/core.h>

#include <string>

namespace maestro::cli {

auto cmd_agents(const AgentsOptions& opts) -> int {
  auto config = load_config(opts.config_file);
  if (!config) {
    return 1;
  }

  AgentRegistry registry;
  populate_registry(registry, *config);

  fmt::print("{:<16} {:<14} {}\n", "NAME", "ROLE", "CAPABILITIES");
  for (const auto& agent : registry.all()) {
    std::string caps;
    for (auto cap : agent.capabilities) {
      if (!caps.empty()) {
        caps += ", ";
      }
      caps += to_string_view(cap);
    }
    fmt::print("{:<16} {:<14} {}\n", agent.name, agent.role,
               caps.empty() ? "-" : caps);
  }
  return 0;
}

auto cmd_route(const RouteOptions& opts) -> int {
  auto config = load_config(opts.config_file);
  if (!config) {
    return 1;
  }

  AgentRegistry registry;
  populate_registry(registry, *config);

  for (const auto& agent : registry.all()) {
    if (auto score = registry.score(agent.name, opts.text); score && *score > 0) {
      fmt::print("  {:<16} {:.1f}\n", agent.name, *score);
    }
  }

  if (auto best = registry.find_best(opts.text)) {
    fmt::print("{}\n", best->name);
  } else {
    fmt::print("{} (default)\n", config->engine.default_assignee);
  }
  return 0;
}

}  // namespace maestro::cli

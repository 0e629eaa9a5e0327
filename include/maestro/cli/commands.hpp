#pragma once

#include <string>
#include <vector>

namespace maestro::cli {

struct RunOptions {
  std::string plan_file;
  std::string config_file;
  // Task ids whose executions always fail.
  std::vector<std::string> fail_tasks;
};

struct ValidateOptions {
  std::string plan_file;
};

struct AgentsOptions {
  std::string config_file;
};

struct RouteOptions {
  std::string text;
  std::string config_file;
};

[[nodiscard]] auto cmd_run(const RunOptions& opts) -> int;
[[nodiscard]] auto cmd_validate(const ValidateOptions& opts) -> int;
[[nodiscard]] auto cmd_agents(const AgentsOptions& opts) -> int;
[[nodiscard]] auto cmd_route(const RouteOptions& opts) -> int;

}  // namespace maestro::cli

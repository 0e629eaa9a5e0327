#pragma once

#include "maestro/agent/agent.hpp"
#include "maestro/workflow/task.hpp"
#include "maestro/workflow/workflow.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace maestro {

struct EngineConfig {
  int max_parallel{4};
  int max_retries{kDefaultMaxRetries};
  int default_priority{kDefaultPriority};
  std::string default_assignee{kDefaultAssignee};
  std::size_t result_preview_chars{kDefaultResultPreview};
  bool validate_plans{true};
};

struct ExecutorPoolConfig {
  int threads{4};
};

struct LoggingConfig {
  std::string level{"info"};
};

struct SystemConfig {
  EngineConfig engine;
  ExecutorPoolConfig executor;
  LoggingConfig logging;
  // Empty means the built-in roster.
  std::vector<AgentProfile> agents;
};

}  // namespace maestro

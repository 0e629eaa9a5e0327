#include "maestro/cli/commands.hpp"

#include "maestro/workflow/plan.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace maestro::cli {

auto cmd_validate(const ValidateOptions& opts) -> int {
  auto plan = PlanLoader::load_from_file(opts.plan_file);
  if (!plan) {
    fmt::print(stderr, "Error: {}: {}\n", opts.plan_file,
               plan.error().message());
    return 1;
  }

  if (plan->steps.empty()) {
    fmt::print("✗ {} - No tasks defined\n", opts.plan_file);
    return 1;
  }

  auto problems = find_plan_problems(plan->steps);
  if (!problems.empty()) {
    fmt::print("✗ {}\n", opts.plan_file);
    for (const auto& problem : problems) {
      fmt::print("  - {}\n", problem);
    }
    return 1;
  }

  fmt::print("✓ {} - Valid ({} tasks)\n", opts.plan_file,
             plan->steps.size());
  if (auto order = plan_order(plan->steps)) {
    fmt::print("  order: {}\n", fmt::join(*order, " -> "));
  }
  return 0;
}

}  // namespace maestro::cli

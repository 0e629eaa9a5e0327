#include "maestro/workflow/plan.hpp"

#include "maestro/config/yaml_utils.hpp"
#include "maestro/util/log.hpp"
#include "maestro/workflow/dag.hpp"
#include "maestro/workflow/task.hpp"

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <fstream>
#include <sstream>

namespace maestro {

namespace {

auto parse_index(std::string_view s) -> std::optional<std::size_t> {
  if (s.empty()) {
    return std::nullopt;
  }
  std::size_t value = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
  if (ec != std::errc{} || ptr != s.data() + s.size()) {
    return std::nullopt;
  }
  return value;
}

auto trim(std::string_view s) -> std::string_view {
  auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
  while (!s.empty() && is_space(static_cast<unsigned char>(s.front()))) {
    s.remove_prefix(1);
  }
  while (!s.empty() && is_space(static_cast<unsigned char>(s.back()))) {
    s.remove_suffix(1);
  }
  return s;
}

// Content of the first fenced block, or the whole text when there is none.
auto strip_code_fence(std::string_view text) -> std::string_view {
  constexpr std::string_view kJsonFence = "```json";
  constexpr std::string_view kFence = "```";

  std::size_t begin = std::string_view::npos;
  if (auto pos = text.find(kJsonFence); pos != std::string_view::npos) {
    begin = pos + kJsonFence.size();
  } else if (auto pos = text.find(kFence); pos != std::string_view::npos) {
    begin = pos + kFence.size();
  }
  if (begin == std::string_view::npos) {
    return text;
  }

  auto body = text.substr(begin);
  auto end = body.find(kFence);
  return end == std::string_view::npos ? body : body.substr(0, end);
}

auto dependency_from_json(const nlohmann::json& j)
    -> std::optional<PlanDependency> {
  if (j.is_number_unsigned()) {
    return PlanDependency{j.get<std::size_t>()};
  }
  if (j.is_number_integer()) {
    auto v = j.get<long long>();
    if (v < 0) {
      return std::nullopt;
    }
    return PlanDependency{static_cast<std::size_t>(v)};
  }
  if (j.is_string()) {
    return PlanDependency{j.get<std::string>()};
  }
  return std::nullopt;
}

auto step_from_json(const nlohmann::json& j, std::string_view default_assignee)
    -> std::optional<PlanStep> {
  PlanStep step;
  if (j.is_string()) {
    step.task = j.get<std::string>();
    step.assignee = std::string(default_assignee);
    return step;
  }
  if (!j.is_object()) {
    return std::nullopt;
  }

  step.task = j.value("task", std::string{});
  step.assignee = j.value("assignee", std::string(default_assignee));
  if (auto it = j.find("priority"); it != j.end() && it->is_number_integer()) {
    step.priority = it->get<int>();
  }
  if (auto it = j.find("max_retries");
      it != j.end() && it->is_number_integer()) {
    step.max_retries = it->get<int>();
  }
  if (auto it = j.find("depends_on"); it != j.end() && it->is_array()) {
    for (const auto& dep : *it) {
      if (auto parsed = dependency_from_json(dep)) {
        step.depends_on.push_back(std::move(*parsed));
      }
    }
  }
  return step;
}

}  // namespace

}  // namespace maestro

namespace YAML {

template <>
struct convert<maestro::PlanStep> {
  static bool decode(const Node& node, maestro::PlanStep& s) {
    if (node.IsScalar()) {
      s.task = node.as<std::string>();
      return true;
    }
    if (!node.IsMap()) {
      return false;
    }
    s.task = maestro::yaml_get_or<std::string>(node, "task", "");
    s.assignee = maestro::yaml_get_or<std::string>(node, "assignee", "");
    if (auto v = node["priority"]) {
      s.priority = v.as<int>();
    }
    if (auto v = node["max_retries"]) {
      s.max_retries = v.as<int>();
    }
    if (auto deps = node["depends_on"]) {
      if (!deps.IsSequence()) {
        return false;
      }
      for (const auto& dep : deps) {
        auto text = dep.as<std::string>();
        if (auto idx = maestro::parse_index(text)) {
          s.depends_on.emplace_back(*idx);
        } else {
          s.depends_on.emplace_back(std::move(text));
        }
      }
    }
    return true;
  }
};

}  // namespace YAML

namespace maestro {

auto resolve_dependency(const PlanDependency& dep) -> TaskId {
  if (const auto* idx = std::get_if<std::size_t>(&dep)) {
    return make_task_id(*idx);
  }
  const auto& text = std::get<std::string>(dep);
  if (auto idx = parse_index(text)) {
    return make_task_id(*idx);
  }
  return TaskId{text};
}

namespace {

// Dependency graph of task_1..task_n; edges that cannot be added are
// reported instead.
auto build_plan_graph(std::span<const PlanStep> steps,
                      std::vector<std::string>& problems) -> DAG {
  DAG dag;
  for (std::size_t i = 0; i < steps.size(); ++i) {
    dag.add_node(make_task_id(i + 1));
  }

  for (std::size_t i = 0; i < steps.size(); ++i) {
    auto id = make_task_id(i + 1);
    for (const auto& dep : steps[i].depends_on) {
      auto dep_id = resolve_dependency(dep);
      if (!dag.has_node(dep_id)) {
        problems.push_back(
            fmt::format("{} depends on unknown task {}", id, dep_id));
        continue;
      }
      if (dep_id == id) {
        problems.push_back(fmt::format("{} depends on itself", id));
        continue;
      }
      if (auto r = dag.add_edge(dep_id, id); !r) {
        problems.push_back(fmt::format("{} -> {} closes a dependency cycle",
                                       dep_id, id));
      }
    }
  }
  return dag;
}

}  // namespace

auto find_plan_problems(std::span<const PlanStep> steps)
    -> std::vector<std::string> {
  std::vector<std::string> problems;
  (void)build_plan_graph(steps, problems);
  return problems;
}

auto plan_order(std::span<const PlanStep> steps)
    -> Result<std::vector<TaskId>> {
  std::vector<std::string> problems;
  auto dag = build_plan_graph(steps, problems);
  if (!problems.empty()) {
    return fail(Error::InvalidPlan);
  }
  return dag.get_topological_order();
}

auto validate_plan(std::span<const PlanStep> steps) -> Result<void> {
  auto problems = find_plan_problems(steps);
  if (problems.empty()) {
    return ok();
  }
  for (const auto& problem : problems) {
    log::warn("Invalid plan: {}", problem);
  }
  return fail(Error::InvalidPlan);
}

auto PlanLoader::load_from_file(std::string_view path) -> Result<Plan> {
  std::string path_str{path};
  std::ifstream file(path_str);
  if (!file.is_open()) {
    log::error("Failed to open plan file: {}", path);
    return fail(Error::FileNotFound);
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return load_from_string(buffer.str());
}

auto PlanLoader::load_from_string(std::string_view yaml_str) -> Result<Plan> {
  try {
    YAML::Node root = YAML::Load(std::string(yaml_str));
    if (!root.IsDefined() || !root.IsMap()) {
      log::error("Failed to parse plan: expected a mapping at top level");
      return fail(Error::ParseError);
    }

    Plan plan;
    plan.name = yaml_get_or<std::string>(root, "name", "");
    plan.objective = yaml_get_or<std::string>(root, "objective", "");
    if (auto tasks = root["tasks"]) {
      if (!tasks.IsSequence()) {
        log::error("Failed to parse plan: 'tasks' must be a sequence");
        return fail(Error::ParseError);
      }
      for (const auto& node : tasks) {
        plan.steps.push_back(node.as<PlanStep>());
      }
    }
    return ok(std::move(plan));
  } catch (const YAML::Exception& e) {
    log::error("YAML parse error: {}", e.what());
    return fail(Error::ParseError);
  }
}

auto PlanLoader::parse_planner_output(std::string_view text,
                                      std::string_view default_assignee)
    -> std::vector<PlanStep> {
  auto body = trim(strip_code_fence(text));
  auto parsed = nlohmann::json::parse(body, nullptr, false);

  std::vector<PlanStep> steps;
  if (!parsed.is_discarded() && parsed.is_array()) {
    for (const auto& item : parsed) {
      if (auto step = step_from_json(item, default_assignee)) {
        steps.push_back(std::move(*step));
      }
    }
    return steps;
  }

  log::debug("Planner output is not a JSON array, splitting into lines");
  std::size_t start = 0;
  while (start <= text.size()) {
    auto end = text.find('\n', start);
    if (end == std::string_view::npos) {
      end = text.size();
    }
    auto line = trim(text.substr(start, end - start));
    if (!line.empty()) {
      steps.push_back(PlanStep{.task = std::string(line),
                               .assignee = std::string(default_assignee),
                               .priority = kDefaultPriority,
                               .depends_on = {},
                               .max_retries = std::nullopt});
    }
    start = end + 1;
  }
  return steps;
}

}  // namespace maestro

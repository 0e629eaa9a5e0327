#pragma once

#include <fmt/format.h>

#include <compare>
#include <cstdint>
#include <functional>
#include <ostream>
#include <random>
#include <string>
#include <string_view>

namespace maestro {

struct WorkflowTag {};
struct TaskTag {};

// Phantom-typed string id. Keeps workflow and task ids from being mixed up.
template <typename Tag>
class TypedId {
public:
  explicit TypedId(std::string value) : value_(std::move(value)) {}

  TypedId() = default;

  [[nodiscard]] auto value() const -> std::string_view { return value_; }
  [[nodiscard]] auto str() const -> const std::string& { return value_; }

  [[nodiscard]] explicit operator std::string() const { return value_; }

  [[nodiscard]] auto empty() const -> bool { return value_.empty(); }

  [[nodiscard]] friend auto operator<=>(const TypedId& lhs,
                                        const TypedId& rhs) = default;
  [[nodiscard]] friend auto operator==(const TypedId& lhs, const TypedId& rhs)
      -> bool = default;

private:
  std::string value_;
};

using WorkflowId = TypedId<WorkflowTag>;
using TaskId = TypedId<TaskTag>;

namespace detail {
inline auto generate_short_uuid() -> std::string {
  thread_local std::random_device rd;
  thread_local std::mt19937_64 gen(rd());
  thread_local std::uniform_int_distribution<std::uint32_t> dis;
  return fmt::format("{:08x}", dis(gen));
}
}  // namespace detail

// Plan position is 1-based: the first step of a plan becomes "task_1".
inline auto make_task_id(std::size_t position) -> TaskId {
  return TaskId{fmt::format("task_{}", position)};
}

inline auto generate_workflow_id(std::string_view prefix = "wf") -> WorkflowId {
  return WorkflowId{fmt::format("{}_{}", prefix, detail::generate_short_uuid())};
}

template <typename Tag>
inline auto operator<<(std::ostream& os, const TypedId<Tag>& id)
    -> std::ostream& {
  return os << id.value();
}

}  // namespace maestro

template <typename Tag>
struct std::hash<maestro::TypedId<Tag>> {
  auto operator()(const maestro::TypedId<Tag>& id) const noexcept
      -> std::size_t {
    return std::hash<std::string_view>{}(id.value());
  }
};

template <typename Tag>
struct fmt::formatter<maestro::TypedId<Tag>>
    : fmt::formatter<std::string_view> {
  auto format(const maestro::TypedId<Tag>& id, fmt::format_context& ctx) const {
    return fmt::formatter<std::string_view>::format(id.value(), ctx);
  }
};

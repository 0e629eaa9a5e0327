#pragma once

#include "maestro/agent/capability.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace maestro {

// Declared skills of one executor. The registry keys profiles by name.
struct AgentProfile {
  std::string name;
  std::string role;
  std::string description;
  std::vector<Capability> capabilities;

  [[nodiscard]] auto has_capability(Capability cap) const noexcept -> bool;
};

enum class MessageType : std::uint8_t {
  Info,
  Request,
  Response,
  Error,
};

[[nodiscard]] auto to_string_view(MessageType type) noexcept
    -> std::string_view;
[[nodiscard]] auto parse_message_type(std::string_view name) noexcept
    -> MessageType;

struct AgentMessage {
  std::string from;
  std::string to;
  std::string content;
  MessageType type{MessageType::Info};
  std::map<std::string, std::string> metadata;
};

// Builds a message from `sender` to `recipient`.
[[nodiscard]] auto make_message(const AgentProfile& sender,
                                std::string recipient, std::string content,
                                MessageType type = MessageType::Info)
    -> AgentMessage;

// Stock roster: Orchestrator, Developer, UI/UX Designer, QA Tester, Research,
// Security, Documentation, Refiner.
[[nodiscard]] auto default_profiles() -> std::vector<AgentProfile>;

inline constexpr std::string_view kDefaultAssignee = "Developer";

}  // namespace maestro

#include "maestro/agent/agent.hpp"

#include <algorithm>
#include <array>
#include <utility>

namespace maestro {

namespace {

constexpr std::array<std::string_view, 4> kMessageTypeNames = {
    "info",
    "request",
    "response",
    "error",
};

}  // namespace

auto AgentProfile::has_capability(Capability cap) const noexcept -> bool {
  return std::ranges::find(capabilities, cap) != capabilities.end();
}

auto to_string_view(MessageType type) noexcept -> std::string_view {
  auto idx = std::to_underlying(type);
  return idx < kMessageTypeNames.size() ? kMessageTypeNames[idx] : "info";
}

auto parse_message_type(std::string_view name) noexcept -> MessageType {
  auto it = std::ranges::find(kMessageTypeNames, name);
  if (it != kMessageTypeNames.end()) {
    return static_cast<MessageType>(
        std::ranges::distance(kMessageTypeNames.begin(), it));
  }
  return MessageType::Info;
}

auto make_message(const AgentProfile& sender, std::string recipient,
                  std::string content, MessageType type) -> AgentMessage {
  return AgentMessage{.from = sender.name,
                      .to = std::move(recipient),
                      .content = std::move(content),
                      .type = type,
                      .metadata = {}};
}

auto default_profiles() -> std::vector<AgentProfile> {
  using enum Capability;
  return {
      {"Orchestrator", "orchestrator",
       "Plans and coordinates work, breaks down objectives into tasks",
       {Research}},
      {"Developer", "developer",
       "Implements robust and efficient code with clean architecture",
       {CodeGeneration, CodeReview, Optimization}},
      {"UI/UX Designer", "ui_ux",
       "Designs beautiful, intuitive interfaces with great UX",
       {Design}},
      {"QA Tester", "qa",
       "Verifies functionality, finds bugs, ensures quality",
       {Testing, CodeReview}},
      {"Research", "research",
       "Researches information, best practices, and documentation",
       {Research, WebSearch}},
      {"Security", "security",
       "Analyzes code for security vulnerabilities and best practices",
       {Security, CodeReview}},
      {"Documentation", "documentation",
       "Generates documentation, READMEs, and API docs",
       {Documentation}},
      {"Refiner", "refiner",
       "Synthesizes outputs from all agents into polished deliverables",
       {}},
  };
}

}  // namespace maestro

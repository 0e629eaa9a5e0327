#pragma once

#include "maestro/agent/agent.hpp"
#include "maestro/agent/capability.hpp"
#include "maestro/core/error.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace maestro {

// Catalog of agent profiles shared by every workflow driver in the process.
// Owned by the composition root and passed by reference; all members are
// safe to call concurrently.
class AgentRegistry {
public:
  AgentRegistry();
  explicit AgentRegistry(std::unique_ptr<ICapabilityScorer> scorer);
  ~AgentRegistry();

  AgentRegistry(const AgentRegistry&) = delete;
  auto operator=(const AgentRegistry&) -> AgentRegistry& = delete;

  // Inserts, or replaces the profile with the same name. A replaced profile
  // keeps its registration position and starts with an empty inbox.
  auto register_agent(AgentProfile profile) -> void;

  [[nodiscard]] auto get(std::string_view name) const
      -> std::optional<AgentProfile>;
  [[nodiscard]] auto contains(std::string_view name) const -> bool;
  [[nodiscard]] auto all() const -> std::vector<AgentProfile>;
  [[nodiscard]] auto size() const -> std::size_t;

  [[nodiscard]] auto score(std::string_view name,
                           std::string_view task_text) const
      -> std::optional<double>;

  // Highest scorer for the text. Exact ties go to the earliest registered
  // profile; nullopt when the registry is empty or every score is zero.
  [[nodiscard]] auto find_best(std::string_view task_text) const
      -> std::optional<AgentProfile>;

  // Best-effort delivery. Unknown recipients are ignored.
  auto send(AgentMessage message) -> void;
  // Delivers to every registered agent except the sender.
  auto broadcast(const AgentMessage& message) -> void;

  [[nodiscard]] auto take_messages(std::string_view name)
      -> std::vector<AgentMessage>;
  [[nodiscard]] auto pending_messages(std::string_view name) const
      -> std::size_t;

  auto clear() -> void;

private:
  struct Entry {
    AgentProfile profile;
    std::vector<AgentMessage> inbox;
  };

  [[nodiscard]] auto find_entry(std::string_view name) const -> const Entry*;
  [[nodiscard]] auto find_entry(std::string_view name) -> Entry*;

  std::unique_ptr<ICapabilityScorer> scorer_;
  std::vector<Entry> entries_;
  std::unordered_map<std::string, std::size_t, StringHash, StringEqual> index_;
  mutable std::shared_mutex mu_;
};

auto register_default_profiles(AgentRegistry& registry) -> void;

}  // namespace maestro

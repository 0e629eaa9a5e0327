#include "maestro/agent/registry.hpp"

#include "maestro/util/log.hpp"

#include <mutex>

namespace maestro {

AgentRegistry::AgentRegistry()
    : AgentRegistry(std::make_unique<KeywordScorer>()) {}

AgentRegistry::AgentRegistry(std::unique_ptr<ICapabilityScorer> scorer)
    : scorer_(std::move(scorer)) {
  if (!scorer_) {
    scorer_ = std::make_unique<KeywordScorer>();
  }
}

AgentRegistry::~AgentRegistry() = default;

auto AgentRegistry::find_entry(std::string_view name) const -> const Entry* {
  auto it = index_.find(name);
  return it != index_.end() ? &entries_[it->second] : nullptr;
}

auto AgentRegistry::find_entry(std::string_view name) -> Entry* {
  auto it = index_.find(name);
  return it != index_.end() ? &entries_[it->second] : nullptr;
}

auto AgentRegistry::register_agent(AgentProfile profile) -> void {
  std::unique_lock lock(mu_);
  if (auto* entry = find_entry(profile.name)) {
    log::debug("Replacing agent profile '{}'", profile.name);
    entry->profile = std::move(profile);
    entry->inbox.clear();
    return;
  }
  index_.emplace(profile.name, entries_.size());
  entries_.push_back(Entry{std::move(profile), {}});
}

auto AgentRegistry::get(std::string_view name) const
    -> std::optional<AgentProfile> {
  std::shared_lock lock(mu_);
  if (const auto* entry = find_entry(name)) {
    return entry->profile;
  }
  return std::nullopt;
}

auto AgentRegistry::contains(std::string_view name) const -> bool {
  std::shared_lock lock(mu_);
  return index_.contains(name);
}

auto AgentRegistry::all() const -> std::vector<AgentProfile> {
  std::shared_lock lock(mu_);
  std::vector<AgentProfile> out;
  out.reserve(entries_.size());
  for (const auto& entry : entries_) {
    out.push_back(entry.profile);
  }
  return out;
}

auto AgentRegistry::size() const -> std::size_t {
  std::shared_lock lock(mu_);
  return entries_.size();
}

auto AgentRegistry::score(std::string_view name,
                          std::string_view task_text) const
    -> std::optional<double> {
  std::shared_lock lock(mu_);
  const auto* entry = find_entry(name);
  if (!entry) {
    return std::nullopt;
  }
  return scorer_->score(entry->profile.capabilities, task_text);
}

auto AgentRegistry::find_best(std::string_view task_text) const
    -> std::optional<AgentProfile> {
  std::shared_lock lock(mu_);
  const Entry* best = nullptr;
  double best_score = 0.0;

  for (const auto& entry : entries_) {
    double s = scorer_->score(entry.profile.capabilities, task_text);
    if (s > best_score) {
      best_score = s;
      best = &entry;
    }
  }

  if (!best) {
    return std::nullopt;
  }
  return best->profile;
}

auto AgentRegistry::send(AgentMessage message) -> void {
  std::unique_lock lock(mu_);
  auto* entry = find_entry(message.to);
  if (!entry) {
    log::debug("Dropping message from '{}' to unknown agent '{}'",
               message.from, message.to);
    return;
  }
  entry->inbox.push_back(std::move(message));
}

auto AgentRegistry::broadcast(const AgentMessage& message) -> void {
  std::unique_lock lock(mu_);
  for (auto& entry : entries_) {
    if (entry.profile.name != message.from) {
      entry.inbox.push_back(message);
    }
  }
}

auto AgentRegistry::take_messages(std::string_view name)
    -> std::vector<AgentMessage> {
  std::unique_lock lock(mu_);
  auto* entry = find_entry(name);
  if (!entry) {
    return {};
  }
  return std::exchange(entry->inbox, {});
}

auto AgentRegistry::pending_messages(std::string_view name) const
    -> std::size_t {
  std::shared_lock lock(mu_);
  const auto* entry = find_entry(name);
  return entry ? entry->inbox.size() : 0;
}

auto AgentRegistry::clear() -> void {
  std::unique_lock lock(mu_);
  entries_.clear();
  index_.clear();
}

auto register_default_profiles(AgentRegistry& registry) -> void {
  for (auto& profile : default_profiles()) {
    registry.register_agent(std::move(profile));
  }
}

}  // namespace maestro

#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

namespace maestro {

enum class Capability : std::uint8_t {
  CodeGeneration,
  CodeReview,
  Design,
  Testing,
  Research,
  Security,
  Documentation,
  Optimization,
  WebSearch,
  FileOperations,
};

inline constexpr std::size_t kCapabilityCount = 10;

[[nodiscard]] auto to_string_view(Capability cap) noexcept -> std::string_view;
[[nodiscard]] auto parse_capability(std::string_view name) noexcept
    -> std::optional<Capability>;

// Keyword stems that signal a capability in free task text. Tags with no
// stems never contribute to a score.
[[nodiscard]] auto capability_keywords(Capability cap) noexcept
    -> std::span<const std::string_view>;

// Strategy used by the registry to rate a capability set against task text.
// Implementations must be pure and return a value in [0, 1].
class ICapabilityScorer {
public:
  virtual ~ICapabilityScorer() = default;

  [[nodiscard]] virtual auto score(std::span<const Capability> capabilities,
                                   std::string_view task_text) const
      -> double = 0;
};

// Substring match on the lowercased text: each matching stem of each declared
// capability adds kKeywordWeight, clamped to 1.0.
class KeywordScorer final : public ICapabilityScorer {
public:
  static constexpr double kKeywordWeight = 0.2;

  [[nodiscard]] auto score(std::span<const Capability> capabilities,
                           std::string_view task_text) const
      -> double override;
};

}  // namespace maestro

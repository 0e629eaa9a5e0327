#include "maestro/agent/capability.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <string>
#include <utility>

namespace maestro {

namespace {

constexpr std::array<std::string_view, kCapabilityCount> kCapabilityNames = {
    "code_generation", "code_review",   "design",       "testing",
    "research",        "security",      "documentation", "optimization",
    "web_search",      "file_operations",
};

constexpr std::string_view kCodeGenerationKeywords[] = {
    "implement", "create", "build", "code", "develop", "function", "class"};
constexpr std::string_view kCodeReviewKeywords[] = {
    "review", "check", "analyze", "inspect", "evaluate"};
constexpr std::string_view kDesignKeywords[] = {
    "design", "ui", "ux", "layout", "interface", "style", "css", "visual"};
constexpr std::string_view kTestingKeywords[] = {
    "test", "verify", "validate", "qa", "bug", "fix", "debug"};
constexpr std::string_view kResearchKeywords[] = {
    "research", "find", "search", "look up", "investigate", "explore"};
constexpr std::string_view kSecurityKeywords[] = {
    "security", "vulnerability", "secure", "protect", "authentication",
    "authorization"};
constexpr std::string_view kDocumentationKeywords[] = {
    "document", "readme", "docs", "explain", "comment", "describe"};
constexpr std::string_view kOptimizationKeywords[] = {
    "optimize", "performance", "speed", "efficiency", "improve", "refactor"};

auto to_lower(std::string_view text) -> std::string {
  std::string out(text);
  std::ranges::transform(out, out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

}  // namespace

auto to_string_view(Capability cap) noexcept -> std::string_view {
  auto idx = std::to_underlying(cap);
  return idx < kCapabilityNames.size() ? kCapabilityNames[idx] : "unknown";
}

auto parse_capability(std::string_view name) noexcept
    -> std::optional<Capability> {
  auto it = std::ranges::find(kCapabilityNames, name);
  if (it == kCapabilityNames.end()) {
    return std::nullopt;
  }
  return static_cast<Capability>(
      std::ranges::distance(kCapabilityNames.begin(), it));
}

auto capability_keywords(Capability cap) noexcept
    -> std::span<const std::string_view> {
  switch (cap) {
    case Capability::CodeGeneration: return kCodeGenerationKeywords;
    case Capability::CodeReview: return kCodeReviewKeywords;
    case Capability::Design: return kDesignKeywords;
    case Capability::Testing: return kTestingKeywords;
    case Capability::Research: return kResearchKeywords;
    case Capability::Security: return kSecurityKeywords;
    case Capability::Documentation: return kDocumentationKeywords;
    case Capability::Optimization: return kOptimizationKeywords;
    case Capability::WebSearch:
    case Capability::FileOperations:
      return {};
  }
  return {};
}

auto KeywordScorer::score(std::span<const Capability> capabilities,
                          std::string_view task_text) const -> double {
  auto text = to_lower(task_text);
  double total = 0.0;

  // Every declared entry counts, repeats included.
  for (Capability cap : capabilities) {
    for (std::string_view keyword : capability_keywords(cap)) {
      if (text.find(keyword) != std::string::npos) {
        total += kKeywordWeight;
      }
    }
  }
  return std::min(total, 1.0);
}

}  // namespace maestro

#pragma once

#include "maestro/config/config.hpp"

#include <fmt/core.h>

#include <optional>
#include <string>
#include <utility>

namespace maestro::cli {

// Built-in configuration when no file is given.
[[nodiscard]] inline auto load_config(const std::string& path)
    -> std::optional<SystemConfig> {
  if (path.empty()) {
    return SystemConfig{};
  }
  auto result = ConfigLoader::load_from_file(path);
  if (!result) {
    fmt::print(stderr, "Error: {}: {}\n", path, result.error().message());
    return std::nullopt;
  }
  return std::move(*result);
}

}  // namespace maestro::cli

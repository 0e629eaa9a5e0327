#pragma once

#include <yaml-cpp/yaml.h>

#include <string>
#include <string_view>
#include <vector>

namespace maestro {

template <typename T>
concept YamlParsable = requires(const YAML::Node& n) { { n.as<T>() }; };

template <YamlParsable T>
[[nodiscard]] auto yaml_get_or(const YAML::Node& node, std::string_view key,
                               T default_val) -> T {
  auto field = node[std::string(key)];
  if (!field || field.IsNull()) {
    return default_val;
  }
  return field.as<T>();
}

// A scalar is accepted as a one-element list.
template <YamlParsable T>
[[nodiscard]] auto yaml_get_list(const YAML::Node& node, std::string_view key)
    -> std::vector<T> {
  std::vector<T> out;
  auto field = node[std::string(key)];
  if (!field || field.IsNull()) {
    return out;
  }
  if (field.IsScalar()) {
    out.push_back(field.as<T>());
    return out;
  }
  for (const auto& item : field) {
    out.push_back(item.as<T>());
  }
  return out;
}

}  // namespace maestro

#pragma once

#include "jobmaster/util/id.hpp"

#include <yaml-cpp/yaml.h>

#include <chrono>
#include <string>
#include <string_view>

namespace YAML {

template <typename Tag>
struct convert<jobmaster::TypedId<Tag>> {
  static auto encode(const jobmaster::TypedId<Tag>& id) -> Node {
    return Node(std::string(id.value()));
  }
  static auto decode(const Node& node, jobmaster::TypedId<Tag>& id) -> bool {
    if (!node.IsScalar()) return false;
    id = jobmaster::TypedId<Tag>{node.as<std::string>()};
    return true;
  }
};

}  // namespace YAML

namespace jobmaster {

template <typename T>
concept YamlParsable = requires(const YAML::Node& n) { { n.as<T>() }; };

template <YamlParsable T>
[[nodiscard]] auto yaml_get_or(const YAML::Node& node, std::string_view key,
                               T default_val) -> T {
  auto field = node[std::string(key)];
  if (!field || (!field.IsScalar() && !field.IsSequence() && !field.IsMap())) {
    return default_val;
  }
  return field.as<T>();
}

// Reads an integral count of `Unit`s stored under `key`.
template <typename Unit, typename Duration>
[[nodiscard]] auto yaml_get_duration_or(const YAML::Node& node,
                                        std::string_view key,
                                        Duration default_val) -> Duration {
  auto field = node[std::string(key)];
  if (!field || !field.IsScalar()) {
    return default_val;
  }
  return std::chrono::duration_cast<Duration>(Unit(field.as<long long>()));
}

}  // namespace jobmaster

#pragma once

#include <string>
#include <string_view>
#include <vector>

// Structured event emitted once per executed message and consumed by
// relayers and indexers.
namespace ibc::core {

struct event_attribute_t final {
  std::string key;
  std::string value;
  bool index{true};

  bool operator==(const event_attribute_t&) const = default;
};

struct event_t final {
  std::string type;
  std::vector<event_attribute_t> attributes;

  bool operator==(const event_t&) const = default;

  /// Value of the first attribute named `key`, or empty.
  std::string_view attribute(std::string_view key) const {
    for (const auto& attr : attributes) {
      if (attr.key == key) {
        return attr.value;
      }
    }
    return {};
  }
};

}  // namespace ibc::core

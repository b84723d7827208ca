#pragma once

#include <ibc/common/error.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace ibc::connection {

inline constexpr auto kDefaultVersionIdentifier = std::string_view{"1"};
inline constexpr auto kOrderOrdered = std::string_view{"ORDER_ORDERED"};
inline constexpr auto kOrderUnordered = std::string_view{"ORDER_UNORDERED"};

/// Connection version: an identifier plus the channel orderings it allows.
struct version_t final {
  std::string identifier;
  std::vector<std::string> features;

  bool operator==(const version_t&) const = default;
};

/// `{"1", ["ORDER_ORDERED", "ORDER_UNORDERED"]}`
version_t default_version();
std::vector<version_t> compatible_versions();

ibc::common::status_t validate_version(const version_t& version);

/// `proposed` must match a supported version by identifier, and each of its
/// features must be supported by that version.
ibc::common::status_t verify_proposed_version(
    const version_t& proposed,
    const std::vector<version_t>& supported);

/// Intersect by identifier and features, sort by identifier and take the
/// first.
ibc::common::result_t<version_t> pick_version(
    const std::vector<version_t>& supported,
    const std::vector<version_t>& counterparty);

bool verify_supported_feature(const version_t& version,
                              std::string_view feature);

bool is_supported_version(const version_t& version,
                          const std::vector<version_t>& supported);

}  // namespace ibc::connection

#pragma once

#include <ibc/common/error.hpp>
#include <ibc/core/timestamp.hpp>
#include <ibc/schema/primitives.hpp>

#include <string_view>

namespace ibc::client {

/// Root placed in the consensus state created by an upgrade. Nothing can be
/// proven against it until the next update.
inline constexpr auto kSentinelRoot = std::string_view{"sentinel_root"};

struct consensus_state_t final {
  ibc::schema::bytes_t root;
  ibc::core::timestamp_t timestamp;
  ibc::schema::hash32_t next_validators_hash{};

  bool operator==(const consensus_state_t&) const = default;
};

ibc::common::status_t validate(const consensus_state_t& state);

}  // namespace ibc::client

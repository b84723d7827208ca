#pragma once

#include <ibc/commitment/ics23.hpp>
#include <ibc/common/error.hpp>
#include <ibc/core/height.hpp>
#include <ibc/schema/primitives.hpp>

#include <optional>
#include <string>
#include <vector>

namespace ibc::client {

/// Fraction of the trusted validator set's voting power that must sign a
/// non-adjacent header. Valid range is [1/3, 1].
struct trust_level_t final {
  uint64_t numerator{1};
  uint64_t denominator{3};

  bool operator==(const trust_level_t&) const = default;
};

/// Which non-active states a recovery may lift.
struct allow_update_t final {
  bool after_expiry{};
  bool after_misbehaviour{};

  bool operator==(const allow_update_t&) const = default;
};

struct client_state_t final {
  std::string chain_id;
  trust_level_t trust_level;
  ibc::schema::duration_nanoseconds_t trusting_period{};
  ibc::schema::duration_nanoseconds_t unbonding_period{};
  ibc::schema::duration_nanoseconds_t max_clock_drift{};
  ibc::core::height_t latest_height;
  std::optional<ibc::core::height_t> frozen_height;
  std::vector<ibc::commitment::ics23::proof_spec_t> proof_specs;
  std::vector<std::string> upgrade_path;
  allow_update_t allow_update;

  bool operator==(const client_state_t&) const = default;
};

ibc::common::status_t validate_trust_level(const trust_level_t& level);

/// Structural validation shared by create, upgrade and the self-client check.
ibc::common::status_t validate(const client_state_t& state);

bool is_frozen(const client_state_t& state);

/// Copy with the client-chosen fields cleared. This is the form a chain
/// commits to in its upgrade store.
client_state_t zero_custom_fields(const client_state_t& state);

}  // namespace ibc::client

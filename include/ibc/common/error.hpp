#pragma once

#include <boost/outcome/policy/terminate.hpp>
#include <boost/outcome/result.hpp>
#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>
#include <cstdint>
#include <string>
#include <string_view>

namespace ibc {
namespace outcome = boost::outcome_v2;
}  // namespace ibc

namespace ibc::common {

/// Error codes, banded by the module that raises them.
///
/// 1xx client, 2xx connection, 3xx channel, 4xx commitment, 5xx decoding,
/// 6xx host, 7xx router, 8xx identifier. Values are stable and exposed to
/// callers through `error_t::code`.
enum class error_code : uint32_t {
  invalid_client_state = 101,
  invalid_consensus_state = 102,
  client_not_found = 103,
  consensus_state_not_found = 104,
  client_frozen = 105,
  client_expired = 106,
  client_not_active = 107,
  invalid_header = 108,
  chain_id_mismatch = 109,
  revision_mismatch = 110,
  header_not_within_trusting_period = 111,
  header_from_future = 112,
  header_not_monotonic = 113,
  validator_set_mismatch = 114,
  insufficient_voting_power = 115,
  invalid_commit = 116,
  misbehaviour_not_detected = 117,
  invalid_misbehaviour = 118,
  invalid_proof_height = 119,
  invalid_upgrade_path = 120,
  low_upgrade_height = 121,
  upgrade_verification_failed = 122,
  invalid_recovery = 123,
  update_not_allowed = 124,
  invalid_trust_level = 125,
  invalid_height = 126,
  client_verification_failed = 127,

  connection_not_found = 201,
  invalid_connection_state = 202,
  no_common_version = 203,
  version_not_supported = 204,
  invalid_version = 205,
  connection_verification_failed = 206,
  invalid_consensus_height = 207,
  invalid_self_client_state = 208,
  missing_counterparty_connection_id = 209,
  not_enough_time_elapsed = 210,
  not_enough_blocks_elapsed = 211,
  missing_update_metadata = 212,

  channel_not_found = 301,
  invalid_channel_state = 302,
  channel_closed = 303,
  invalid_connection_hops = 304,
  ordering_not_supported = 305,
  invalid_counterparty = 306,
  channel_verification_failed = 307,
  invalid_packet_sequence = 308,
  packet_commitment_not_found = 309,
  incorrect_packet_commitment = 310,
  packet_already_received = 311,
  acknowledgement_exists = 312,
  packet_timeout_height_elapsed = 313,
  packet_timeout_timestamp_elapsed = 314,
  timeout_not_reached = 315,
  missing_timeout = 316,
  packet_expired = 317,
  invalid_acknowledgement = 318,
  missing_sequence = 319,
  invalid_packet = 320,

  empty_proof = 401,
  empty_root = 402,
  mismatched_number_of_proofs = 403,
  empty_value = 404,
  invalid_proof_spec = 405,
  invalid_merkle_proof = 406,
  membership_verification_failed = 407,
  non_membership_verification_failed = 408,
  unsupported_hash_op = 409,
  empty_prefix = 410,

  decoding_failed = 501,

  storage_read_failed = 601,
  storage_write_failed = 602,
  missing_host_consensus_state = 603,

  module_not_found = 701,
  module_callback_failed = 702,
  route_exists = 703,

  invalid_identifier_length = 801,
  invalid_identifier_character = 802,
  invalid_identifier_prefix = 803,
};

/// Two tagged families: protocol errors are raised by the core itself, host
/// errors are reported by the storage or host context.
enum class error_family : uint8_t { protocol = 0, host = 1 };

struct error_t final {
  error_code code{};
  std::string log;

  error_family family() const;

  /// Module namespace of the code, e.g. "ibc.client" or "ibc.channel".
  std::string_view codespace() const;

  bool operator==(const error_t& other) const = default;
};

template <typename T>
using result_t = outcome::result<T, error_t, outcome::policy::terminate>;
using status_t = result_t<void>;

std::string_view to_string(error_code code);

error_t make_error(error_code code, std::string log);

/// Re-raise `inner` under `code`, keeping the inner description.
error_t wrap_error(error_code code, const error_t& inner);

std::string describe(const error_t& error);

}  // namespace ibc::common

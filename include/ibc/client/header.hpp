#pragma once

#include <ibc/client/consensus_state.hpp>
#include <ibc/common/error.hpp>
#include <ibc/core/height.hpp>
#include <ibc/core/timestamp.hpp>
#include <ibc/host/identifiers.hpp>
#include <ibc/schema/primitives.hpp>

#include <boost/multiprecision/cpp_int.hpp>
#include <scale/enum_traits.hpp>
#include <string>
#include <vector>

namespace ibc::client {

struct validator_t final {
  ibc::schema::bytes_t address;
  ibc::schema::public_key_t public_key;
  uint64_t voting_power{};

  bool operator==(const validator_t&) const = default;
};

struct validator_set_t final {
  std::vector<validator_t> validators;

  bool operator==(const validator_set_t&) const = default;
};

/// First 20 bytes of sha256 over the raw public key.
ibc::schema::bytes_t derive_address(const ibc::schema::public_key_t& key);

/// Simple-tree root over the SCALE-encoded validators, in set order.
ibc::schema::hash32_t hash(const validator_set_t& set);

/// Sum of the voting powers. Never wraps.
boost::multiprecision::uint128_t total_voting_power(
    const validator_set_t& set);

const validator_t* find_validator(const validator_set_t& set,
                                  const ibc::schema::bytes_view_t& address);

struct block_header_t final {
  std::string chain_id;
  ibc::core::height_t height;
  ibc::core::timestamp_t time;
  ibc::schema::hash32_t validators_hash{};
  ibc::schema::hash32_t next_validators_hash{};
  ibc::schema::bytes_t app_hash;

  bool operator==(const block_header_t&) const = default;
};

ibc::schema::hash32_t hash(const block_header_t& header);

enum class block_id_flag : uint8_t { absent = 1, commit = 2, nil = 3 };

struct commit_sig_t final {
  block_id_flag flag{block_id_flag::absent};
  ibc::schema::bytes_t validator_address;
  ibc::core::timestamp_t timestamp;
  ibc::schema::bytes_t signature;

  bool operator==(const commit_sig_t&) const = default;
};

struct commit_t final {
  ibc::core::height_t height;
  uint32_t round{};
  ibc::schema::hash32_t block_hash{};
  std::vector<commit_sig_t> signatures;

  bool operator==(const commit_t&) const = default;
};

/// Canonical bytes a validator signs for its precommit.
struct canonical_vote_t final {
  std::string chain_id;
  ibc::core::height_t height;
  uint32_t round{};
  ibc::schema::hash32_t block_hash{};
  ibc::core::timestamp_t timestamp;
};

ibc::schema::bytes_t vote_sign_bytes(const std::string& chain_id,
                                     const commit_t& commit,
                                     const commit_sig_t& signature);

struct signed_header_t final {
  block_header_t header;
  commit_t commit;

  bool operator==(const signed_header_t&) const = default;
};

/// Light-client update: a signed header, its validator set, and the trusted
/// height plus the validator set that height committed to as next.
struct header_t final {
  signed_header_t signed_header;
  validator_set_t validator_set;
  ibc::core::height_t trusted_height;
  validator_set_t trusted_next_validator_set;

  bool operator==(const header_t&) const = default;
};

const ibc::core::height_t& height(const header_t& header);
const ibc::core::timestamp_t& time(const header_t& header);
consensus_state_t to_consensus_state(const header_t& header);

/// Self-consistency of a header: heights, hashes and a non-empty validator
/// set. Does not look at signatures.
ibc::common::status_t validate_basic(const header_t& header);

struct misbehaviour_t final {
  ibc::host::client_id_t client_id;
  header_t header1;
  header_t header2;

  bool operator==(const misbehaviour_t&) const = default;
};

ibc::common::status_t validate_basic(const misbehaviour_t& misbehaviour);

}  // namespace ibc::client

SCALE_DEFINE_ENUM_VALUE_RANGE(ibc::client,
                              block_id_flag,
                              ibc::client::block_id_flag::absent,
                              ibc::client::block_id_flag::nil);

#pragma once

#include <ibc/schema/primitives.hpp>

#include <cstdint>
#include <optional>
#include <scale/enum_traits.hpp>
#include <variant>
#include <vector>

// ICS23 commitment proof data model. Field numbering of the enums follows the
// ICS23 protobuf definitions so proofs produced by other implementations map
// one to one.
namespace ibc::commitment::ics23 {

enum class hash_op : uint8_t {
  no_hash = 0,
  sha256 = 1,
  sha512 = 2,
  keccak256 = 3,
  ripemd160 = 4,
  bitcoin = 5,
  sha512_256 = 6,
  blake2b_512 = 7,
  blake2s_256 = 8,
  blake3 = 9,
};

enum class length_op : uint8_t {
  no_prefix = 0,
  var_proto = 1,
  var_rlp = 2,
  fixed32_big = 3,
  fixed32_little = 4,
  fixed64_big = 5,
  fixed64_little = 6,
  require_32_bytes = 7,
  require_64_bytes = 8,
};

/// Leaf hashing: hash(prefix || length(prehash_key(key)) ||
/// length(prehash_value(value))).
struct leaf_op_t final {
  hash_op hash{hash_op::no_hash};
  hash_op prehash_key{hash_op::no_hash};
  hash_op prehash_value{hash_op::no_hash};
  length_op length{length_op::no_prefix};
  ibc::schema::bytes_t prefix;

  bool operator==(const leaf_op_t&) const = default;
};

/// Inner node hashing: hash(prefix || child || suffix).
struct inner_op_t final {
  hash_op hash{hash_op::no_hash};
  ibc::schema::bytes_t prefix;
  ibc::schema::bytes_t suffix;

  bool operator==(const inner_op_t&) const = default;
};

struct existence_proof_t final {
  ibc::schema::bytes_t key;
  ibc::schema::bytes_t value;
  leaf_op_t leaf;
  std::vector<inner_op_t> path;

  bool operator==(const existence_proof_t&) const = default;
};

/// Proves absence of `key` with the existence of its immediate neighbours.
struct non_existence_proof_t final {
  ibc::schema::bytes_t key;
  std::optional<existence_proof_t> left;
  std::optional<existence_proof_t> right;

  bool operator==(const non_existence_proof_t&) const = default;
};

using commitment_proof_t =
    std::variant<existence_proof_t, non_existence_proof_t>;

struct inner_spec_t final {
  std::vector<int32_t> child_order;
  int32_t child_size{};
  int32_t min_prefix_length{};
  int32_t max_prefix_length{};
  ibc::schema::bytes_t empty_child;
  hash_op hash{hash_op::no_hash};

  bool operator==(const inner_spec_t&) const = default;
};

struct proof_spec_t final {
  leaf_op_t leaf_spec;
  inner_spec_t inner_spec;
  int32_t max_depth{};
  int32_t min_depth{};
  bool prehash_key_before_comparison{};

  bool operator==(const proof_spec_t&) const = default;
};

/// CometBFT simple Merkle tree (crypto/merkle).
proof_spec_t tendermint_spec();

/// IAVL+ tree used by Cosmos SDK module stores.
proof_spec_t iavl_spec();

}  // namespace ibc::commitment::ics23

SCALE_DEFINE_ENUM_VALUE_RANGE(ibc::commitment::ics23,
                              hash_op,
                              ibc::commitment::ics23::hash_op::no_hash,
                              ibc::commitment::ics23::hash_op::blake3);
SCALE_DEFINE_ENUM_VALUE_RANGE(
    ibc::commitment::ics23,
    length_op,
    ibc::commitment::ics23::length_op::no_prefix,
    ibc::commitment::ics23::length_op::require_64_bytes);

#include <ibc/client/header.hpp>
#include <ibc/commitment/tree.hpp>
#include <ibc/crypto/hash.hpp>
#include <ibc/schema/encoding/scale/encoder.hpp>
#include <spdlog/fmt/fmt.h>

#include <algorithm>

namespace ibc::client {

namespace {

using ibc::common::error_code;
using ibc::common::make_error;

inline constexpr auto kAddressSize = size_t{20};

ibc::schema::bytes_view_t raw_key(const ibc::schema::public_key_t& key) {
  return std::visit(
      [](const auto& k) {
        return ibc::schema::bytes_view_t{k.public_key.data(),
                                         k.public_key.size()};
      },
      key);
}

}  // namespace

ibc::schema::bytes_t derive_address(const ibc::schema::public_key_t& key) {
  auto digest = ibc::crypto::sha256(raw_key(key));
  return ibc::schema::bytes_t(std::begin(digest),
                              std::begin(digest) + kAddressSize);
}

ibc::schema::hash32_t hash(const validator_set_t& set) {
  auto encoder = ibc::schema::encoding::scale_encoder_t{};
  auto items = std::vector<ibc::schema::bytes_t>{};
  items.reserve(set.validators.size());
  for (const auto& validator : set.validators) {
    items.push_back(encoder.encode(validator));
  }
  return ibc::commitment::hash_from_byte_slices(items);
}

boost::multiprecision::uint128_t total_voting_power(
    const validator_set_t& set) {
  auto total = boost::multiprecision::uint128_t{0};
  for (const auto& validator : set.validators) {
    total += validator.voting_power;
  }
  return total;
}

const validator_t* find_validator(const validator_set_t& set,
                                  const ibc::schema::bytes_view_t& address) {
  auto it = std::find_if(std::begin(set.validators), std::end(set.validators),
                         [&](const validator_t& v) {
                           return std::equal(std::begin(v.address),
                                             std::end(v.address),
                                             std::begin(address),
                                             std::end(address));
                         });
  return it == std::end(set.validators) ? nullptr : &*it;
}

ibc::schema::hash32_t hash(const block_header_t& header) {
  auto encoder = ibc::schema::encoding::scale_encoder_t{};
  return ibc::crypto::sha256(encoder.encode(header));
}

ibc::schema::bytes_t vote_sign_bytes(const std::string& chain_id,
                                     const commit_t& commit,
                                     const commit_sig_t& signature) {
  auto encoder = ibc::schema::encoding::scale_encoder_t{};
  return encoder.encode(canonical_vote_t{.chain_id = chain_id,
                                         .height = commit.height,
                                         .round = commit.round,
                                         .block_hash = commit.block_hash,
                                         .timestamp = signature.timestamp});
}

const ibc::core::height_t& height(const header_t& header) {
  return header.signed_header.header.height;
}

const ibc::core::timestamp_t& time(const header_t& header) {
  return header.signed_header.header.time;
}

consensus_state_t to_consensus_state(const header_t& header) {
  const auto& block = header.signed_header.header;
  return consensus_state_t{.root = block.app_hash,
                           .timestamp = block.time,
                           .next_validators_hash = block.next_validators_hash};
}

ibc::common::status_t validate_basic(const header_t& header) {
  const auto& block = header.signed_header.header;
  const auto& commit = header.signed_header.commit;
  if (block.chain_id.empty()) {
    return make_error(error_code::invalid_header, "chain id is empty");
  }
  if (block.height.revision_height == 0) {
    return make_error(error_code::invalid_header,
                      "header height must be positive");
  }
  if (header.trusted_height.revision_height == 0) {
    return make_error(error_code::invalid_header,
                      "trusted height must be positive");
  }
  if (block.height.revision_number != header.trusted_height.revision_number) {
    return make_error(error_code::invalid_header,
                      fmt::format("header revision {} differs from trusted "
                                  "revision {}",
                                  block.height.revision_number,
                                  header.trusted_height.revision_number));
  }
  if (block.height <= header.trusted_height) {
    return make_error(
        error_code::invalid_header,
        fmt::format("header height {} must be above trusted height {}",
                    ibc::core::to_string(block.height),
                    ibc::core::to_string(header.trusted_height)));
  }
  if (!ibc::core::is_set(block.time)) {
    return make_error(error_code::invalid_header, "header time is unset");
  }
  if (block.app_hash.empty()) {
    return make_error(error_code::invalid_header, "app hash is empty");
  }
  if (header.validator_set.validators.empty()) {
    return make_error(error_code::invalid_header, "validator set is empty");
  }
  if (hash(header.validator_set) != block.validators_hash) {
    return make_error(error_code::validator_set_mismatch,
                      "validator set does not hash to header validators_hash");
  }
  if (commit.height != block.height) {
    return make_error(error_code::invalid_commit,
                      fmt::format("commit height {} differs from header {}",
                                  ibc::core::to_string(commit.height),
                                  ibc::core::to_string(block.height)));
  }
  if (commit.block_hash != hash(block)) {
    return make_error(error_code::invalid_commit,
                      "commit does not sign this header");
  }
  return outcome::success();
}

ibc::common::status_t validate_basic(const misbehaviour_t& misbehaviour) {
  auto first = validate_basic(misbehaviour.header1);
  if (!first) {
    return ibc::common::wrap_error(error_code::invalid_misbehaviour,
                                   first.error());
  }
  auto second = validate_basic(misbehaviour.header2);
  if (!second) {
    return ibc::common::wrap_error(error_code::invalid_misbehaviour,
                                   second.error());
  }
  if (misbehaviour.header1.signed_header.header.chain_id !=
      misbehaviour.header2.signed_header.header.chain_id) {
    return make_error(error_code::invalid_misbehaviour,
                      "headers are from different chains");
  }
  if (height(misbehaviour.header1) < height(misbehaviour.header2)) {
    return make_error(error_code::invalid_misbehaviour,
                      "header1 must be at least as high as header2");
  }
  return outcome::success();
}

}  // namespace ibc::client

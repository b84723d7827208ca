#include <ibc/client/verifier.hpp>
#include <ibc/crypto/verify.hpp>
#include <boost/multiprecision/cpp_int.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <set>

namespace ibc::client {

namespace {

using boost::multiprecision::uint128_t;
using ibc::common::error_code;
using ibc::common::make_error;

inline constexpr auto kTwoThirds = trust_level_t{2, 3};

bool is_adjacent(const header_t& header) {
  return height(header).revision_height ==
         header.trusted_height.revision_height + 1;
}

}  // namespace

signature_verifier_t default_signature_verifier() {
  return [](const ibc::schema::bytes_view_t& message,
            const ibc::schema::public_key_t& key,
            const ibc::schema::bytes_view_t& signature) {
    return ibc::crypto::verify_signature(message, key, signature);
  };
}

ibc::common::status_t verify_commit(const std::string& chain_id,
                                    const validator_set_t& set,
                                    const signed_header_t& signed_header,
                                    const trust_level_t& level,
                                    const signature_verifier_t& verifier) {
  const auto& commit = signed_header.commit;
  auto seen = std::set<ibc::schema::bytes_t>{};
  auto tallied = uint128_t{0};
  for (const auto& signature : commit.signatures) {
    if (signature.flag != block_id_flag::commit) {
      continue;
    }
    const auto* validator = find_validator(set, signature.validator_address);
    if (validator == nullptr) {
      continue;
    }
    if (!seen.insert(signature.validator_address).second) {
      return make_error(error_code::invalid_commit,
                        fmt::format("double vote from validator {}",
                                    ibc::schema::to_hex(
                                        signature.validator_address)));
    }
    auto message = vote_sign_bytes(chain_id, commit, signature);
    if (!verifier(message, validator->public_key, signature.signature)) {
      return make_error(error_code::invalid_commit,
                        fmt::format("invalid signature from validator {}",
                                    ibc::schema::to_hex(
                                        signature.validator_address)));
    }
    tallied += validator->voting_power;
  }
  auto total = total_voting_power(set);
  if (tallied * level.denominator <= total * level.numerator) {
    return make_error(
        error_code::insufficient_voting_power,
        fmt::format("signed power {} of {} does not exceed {}/{}",
                    tallied.str(), total.str(), level.numerator,
                    level.denominator));
  }
  return outcome::success();
}

ibc::common::status_t verify_header(const client_state_t& client_state,
                                    const consensus_state_t& trusted,
                                    const header_t& header,
                                    const ibc::core::timestamp_t now,
                                    const signature_verifier_t& verifier) {
  BOOST_OUTCOME_TRYV(validate_basic(header));
  const auto& block = header.signed_header.header;
  if (block.chain_id != client_state.chain_id) {
    return make_error(error_code::chain_id_mismatch,
                      fmt::format("header chain id {} is not {}",
                                  block.chain_id, client_state.chain_id));
  }
  if (block.height.revision_number !=
      client_state.latest_height.revision_number) {
    return make_error(error_code::revision_mismatch,
                      fmt::format("header revision {} is not {}",
                                  block.height.revision_number,
                                  client_state.latest_height.revision_number));
  }
  if (hash(header.trusted_next_validator_set) !=
      trusted.next_validators_hash) {
    return make_error(error_code::validator_set_mismatch,
                      "trusted validator set does not match the trusted "
                      "consensus state");
  }
  auto trusted_until =
      ibc::core::add(trusted.timestamp, client_state.trusting_period);
  if (trusted_until <= now) {
    return make_error(error_code::header_not_within_trusting_period,
                      fmt::format("trusted state at {} expired at {}",
                                  ibc::core::to_string(trusted.timestamp),
                                  ibc::core::to_string(trusted_until)));
  }
  auto drift_limit = ibc::core::add(now, client_state.max_clock_drift);
  if (block.time >= drift_limit) {
    return make_error(error_code::header_from_future,
                      fmt::format("header time {} is beyond {}",
                                  ibc::core::to_string(block.time),
                                  ibc::core::to_string(drift_limit)));
  }
  if (block.time <= trusted.timestamp) {
    return make_error(error_code::header_not_monotonic,
                      fmt::format("header time {} is not after trusted {}",
                                  ibc::core::to_string(block.time),
                                  ibc::core::to_string(trusted.timestamp)));
  }

  if (is_adjacent(header)) {
    if (block.validators_hash != trusted.next_validators_hash) {
      return make_error(error_code::validator_set_mismatch,
                        "adjacent header validators differ from trusted "
                        "next validators");
    }
  } else {
    BOOST_OUTCOME_TRYV(verify_commit(client_state.chain_id,
                                     header.trusted_next_validator_set,
                                     header.signed_header,
                                     client_state.trust_level, verifier));
  }
  return verify_commit(client_state.chain_id, header.validator_set,
                       header.signed_header, kTwoThirds, verifier);
}

}  // namespace ibc::client

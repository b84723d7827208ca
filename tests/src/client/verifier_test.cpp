#include <ibc/client/verifier.hpp>
#include <ibc/testing/common.hpp>
#include <gtest/gtest.h>

#include <limits>

using ibc::common::error_code;
using ibc::testing::error_of;

namespace {

ibc::client::validator_t make_validator(const uint8_t seed,
                                        const uint64_t power) {
  auto key = ibc::schema::ed25519_public_key{};
  key.public_key = ibc::testing::make_hash(seed);
  return ibc::client::validator_t{
      .address = ibc::client::derive_address(key),
      .public_key = key,
      .voting_power = power};
}

ibc::client::signed_header_t signed_by(
    const std::vector<ibc::client::validator_t>& signers) {
  auto header = ibc::client::signed_header_t{};
  header.header.chain_id = "chain-b-1";
  header.header.height = ibc::core::height_t{1, 10};
  header.commit.height = header.header.height;
  header.commit.block_hash = ibc::testing::make_hash(0x40);
  for (const auto& signer : signers) {
    header.commit.signatures.push_back(ibc::client::commit_sig_t{
        .flag = ibc::client::block_id_flag::commit,
        .validator_address = signer.address,
        .signature = ibc::testing::make_bytes("sig")});
  }
  return header;
}

bool accept_all(const ibc::schema::bytes_view_t&,
                const ibc::schema::public_key_t&,
                const ibc::schema::bytes_view_t&) {
  return true;
}

}  // namespace

TEST(voting_power, total_does_not_wrap_past_64_bits) {
  auto set = ibc::client::validator_set_t{
      .validators = {make_validator(1, std::numeric_limits<uint64_t>::max()),
                     make_validator(2, 2)}};
  auto expected = boost::multiprecision::uint128_t{
                      std::numeric_limits<uint64_t>::max()} +
                  2;
  EXPECT_EQ(ibc::client::total_voting_power(set), expected);
}

TEST(verify_commit, small_signer_cannot_reach_quorum_of_a_huge_set) {
  auto heavy = make_validator(1, std::numeric_limits<uint64_t>::max());
  auto light = make_validator(2, 2);
  auto set = ibc::client::validator_set_t{.validators = {heavy, light}};

  EXPECT_EQ(error_of(ibc::client::verify_commit("chain-b-1", set,
                                                signed_by({light}),
                                                {2, 3}, accept_all)),
            error_code::insufficient_voting_power);
  EXPECT_TRUE(ibc::client::verify_commit("chain-b-1", set,
                                         signed_by({heavy, light}), {2, 3},
                                         accept_all));
}

TEST(verify_commit, quorum_must_exceed_the_trust_level) {
  auto set = ibc::client::validator_set_t{
      .validators = {make_validator(1, 10), make_validator(2, 10),
                     make_validator(3, 10)}};
  auto two = signed_by({set.validators[0], set.validators[1]});

  EXPECT_EQ(error_of(ibc::client::verify_commit("chain-b-1", set, two, {2, 3},
                                                accept_all)),
            error_code::insufficient_voting_power);
  EXPECT_TRUE(
      ibc::client::verify_commit("chain-b-1", set, two, {1, 3}, accept_all));
}

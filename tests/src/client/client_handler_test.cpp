#include <ibc/client/handler.hpp>
#include <ibc/client/proof.hpp>
#include <ibc/client/status.hpp>
#include <ibc/client/store.hpp>
#include <ibc/host/path.hpp>
#include <ibc/testing/relayer.hpp>
#include <gtest/gtest.h>

using ibc::common::error_code;
using ibc::testing::error_of;

namespace {

class client_handler_test : public ::testing::Test {
 protected:
  void SetUp() override {
    a.commit();
    b.commit();
    client_id = ibc::testing::create_client(a, b);
    a.commit();
  }

  ibc::client::client_state_t state() const {
    return ibc::testing::client_state(a, client_id);
  }

  // Header for `at` that commits to a different app hash, still signed by
  // every validator of the tracked chain.
  ibc::client::header_t conflicting_header(const uint64_t at,
                                           const ibc::core::height_t& trusted) {
    auto header = b.header(at, trusted);
    auto block = header.signed_header.header;
    block.app_hash = ibc::testing::make_bytes("forked app hash");
    header.signed_header = b.sign(block);
    return header;
  }

  ibc::testing::mock_clock clock;
  ibc::testing::mock_chain a{"chain-a-1", clock};
  ibc::testing::mock_chain b{"chain-b-1", clock};
  ibc::host::client_id_t client_id;
};

}  // namespace

TEST_F(client_handler_test, create_client_allocates_id_and_stores_states) {
  EXPECT_EQ(client_id.value, "07-tendermint-0");
  auto current = state();
  EXPECT_EQ(current.chain_id, "chain-b-1");
  EXPECT_EQ(current.latest_height, b.height(1));

  auto consensus =
      ibc::client::get_consensus_state(a.store(), client_id, b.height(1));
  ASSERT_TRUE(consensus);
  EXPECT_EQ(consensus.value().root, b.block(1).app_hash);

  auto status = ibc::client::status(a.store(), client_id, current);
  ASSERT_TRUE(status);
  EXPECT_EQ(status.value(), ibc::client::client_status::active);

  auto second = ibc::testing::create_client(a, b);
  EXPECT_EQ(second.value, "07-tendermint-1");
}

TEST_F(client_handler_test, create_client_rejects_invalid_states) {
  auto msg = b.create_client_msg();
  msg.client_state.trusting_period = msg.client_state.unbonding_period;
  EXPECT_EQ(error_of(a.dispatch(msg)), error_code::invalid_client_state);

  msg = b.create_client_msg();
  msg.client_state.latest_height.revision_number = 7;
  EXPECT_EQ(error_of(a.dispatch(msg)), error_code::revision_mismatch);

  msg = b.create_client_msg();
  msg.consensus_state.root.clear();
  EXPECT_EQ(error_of(a.dispatch(msg)), error_code::invalid_consensus_state);
}

TEST_F(client_handler_test, update_client_advances_latest_height) {
  b.advance(3);
  auto events = ibc::testing::require(
      a.dispatch(ibc::testing::update_client_msg(a, client_id, b,
                                                 b.committed_height())),
      "update");
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(events[0].type, "update_client");
  EXPECT_EQ(events[0].attribute("consensus_height"),
            ibc::core::to_string(b.latest_height()));
  EXPECT_EQ(state().latest_height, b.latest_height());

  auto metadata = ibc::client::get_update_metadata(a.store(), client_id,
                                                   b.latest_height());
  ASSERT_TRUE(metadata);
  EXPECT_EQ(metadata.value().height, a.store().host_height());
}

TEST_F(client_handler_test, filling_an_older_height_keeps_latest_height) {
  b.advance(4);
  const auto newest = b.committed_height();
  ibc::testing::require(
      a.dispatch(ibc::testing::update_client_msg(a, client_id, b, newest)),
      "update newest");
  ibc::testing::require(
      a.dispatch(ibc::client::msg_update_client{
          .client_id = client_id, .header = b.header(newest - 2, b.height(1))}),
      "update older");
  EXPECT_EQ(state().latest_height, b.height(newest));
  auto heights = ibc::client::consensus_heights(a.store(), client_id);
  ASSERT_TRUE(heights);
  EXPECT_EQ(heights.value().size(), 3u);
}

TEST_F(client_handler_test, repeated_update_is_idempotent) {
  b.advance(2);
  auto msg = ibc::testing::update_client_msg(a, client_id, b,
                                             b.committed_height());
  ibc::testing::require(a.dispatch(msg), "first update");
  ibc::testing::require(a.dispatch(msg), "second update");
  EXPECT_FALSE(ibc::client::is_frozen(state()));
}

TEST_F(client_handler_test, header_validation_failures_leave_state_untouched) {
  b.advance(2);
  const auto before = state();

  auto wrong_trust = ibc::client::msg_update_client{
      .client_id = client_id,
      .header = b.header(b.committed_height(), b.height(2))};
  EXPECT_EQ(error_of(a.dispatch(wrong_trust)),
            error_code::consensus_state_not_found);

  auto backwards = ibc::client::msg_update_client{
      .client_id = client_id, .header = b.header(1, b.height(1))};
  EXPECT_EQ(error_of(a.dispatch(backwards)), error_code::invalid_header);

  auto unsigned_header = ibc::testing::update_client_msg(a, client_id, b,
                                                         b.committed_height());
  for (auto& signature : unsigned_header.header.signed_header.commit.signatures) {
    signature.signature[0] ^= 0xff;
  }
  EXPECT_FALSE(a.dispatch(unsigned_header));

  auto unknown = ibc::testing::update_client_msg(a, client_id, b,
                                                 b.committed_height());
  unknown.client_id = ibc::host::client_id_t{"07-tendermint-9"};
  EXPECT_EQ(error_of(a.dispatch(unknown)), error_code::client_not_found);

  EXPECT_EQ(state(), before);
}

TEST_F(client_handler_test, conflicting_header_freezes_the_client) {
  b.advance(2);
  const auto at = b.committed_height();
  ibc::testing::require(
      a.dispatch(ibc::testing::update_client_msg(a, client_id, b, at)),
      "honest update");

  auto events = ibc::testing::require(
      a.dispatch(ibc::client::msg_update_client{
          .client_id = client_id,
          .header = conflicting_header(at, b.height(1))}),
      "conflicting update");
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(events[0].type, "client_misbehaviour");
  ASSERT_TRUE(state().frozen_height.has_value());
  EXPECT_EQ(*state().frozen_height, b.height(at));

  b.commit();
  EXPECT_EQ(error_of(a.dispatch(ibc::testing::update_client_msg(
                a, client_id, b, b.committed_height()))),
            error_code::client_frozen);

  // A frozen client can no longer prove anything.
  auto current = state();
  EXPECT_EQ(error_of(ibc::client::verify_membership(
                a.store(), client_id, current, b.height(at),
                ibc::testing::make_bytes("ibc"),
                b.prove(ibc::host::path::client_state(client_id)),
                ibc::host::path::client_state(client_id),
                ibc::testing::make_bytes("anything"))),
            error_code::client_frozen);
}

TEST_F(client_handler_test, submitted_misbehaviour_freezes_the_client) {
  b.advance(2);
  const auto at = b.committed_height();
  auto misbehaviour = ibc::client::misbehaviour_t{
      .client_id = client_id,
      .header1 = b.header(at, b.height(1)),
      .header2 = conflicting_header(at, b.height(1))};
  auto msg = ibc::client::msg_submit_misbehaviour{
      .client_id = client_id, .misbehaviour = misbehaviour};
  auto events = ibc::testing::require(a.dispatch(msg), "misbehaviour");
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(events[0].type, "client_misbehaviour");
  EXPECT_TRUE(ibc::client::is_frozen(state()));
}

TEST_F(client_handler_test, consistent_headers_are_not_misbehaviour) {
  b.advance(2);
  const auto at = b.committed_height();
  auto msg = ibc::client::msg_submit_misbehaviour{
      .client_id = client_id,
      .misbehaviour = {.client_id = client_id,
                       .header1 = b.header(at, b.height(1)),
                       .header2 = b.header(at, b.height(1))}};
  EXPECT_EQ(error_of(a.dispatch(msg)), error_code::misbehaviour_not_detected);
  EXPECT_FALSE(ibc::client::is_frozen(state()));
}

TEST_F(client_handler_test, proofs_verify_against_stored_roots) {
  // Something provable on b, then a client update to the block holding it.
  auto b_client = ibc::testing::create_client(b, a);
  b.commit();
  ibc::testing::update_client(a, client_id, b);

  auto path = ibc::host::path::client_state(b_client);
  auto stored = b.store().get(path);
  ASSERT_TRUE(stored);
  ASSERT_TRUE(stored.value().has_value());
  auto proof = b.prove(path);
  auto current = state();
  auto prefix = ibc::testing::make_bytes("ibc");

  EXPECT_TRUE(ibc::client::verify_membership(
      a.store(), client_id, current, b.latest_height(), prefix, proof, path,
      *stored.value()));
  EXPECT_EQ(error_of(ibc::client::verify_membership(
                a.store(), client_id, current, b.latest_height(), prefix,
                proof, path, ibc::testing::make_bytes("tampered"))),
            error_code::membership_verification_failed);
  EXPECT_EQ(error_of(ibc::client::verify_membership(
                a.store(), client_id, current, b.height(b.committed_height() + 1),
                prefix, proof, path, *stored.value())),
            error_code::invalid_proof_height);
  EXPECT_EQ(error_of(ibc::client::verify_membership(
                a.store(), client_id, current, b.latest_height(),
                ibc::schema::bytes_t{}, proof, path, *stored.value())),
            error_code::empty_prefix);

  auto absent = ibc::host::path::client_state(
      ibc::host::client_id_t{"07-tendermint-42"});
  EXPECT_TRUE(ibc::client::verify_non_membership(
      a.store(), client_id, current, b.latest_height(), prefix,
      b.prove(absent), absent));
  EXPECT_EQ(error_of(ibc::client::verify_non_membership(
                a.store(), client_id, current, b.latest_height(), prefix,
                proof, path)),
            error_code::invalid_merkle_proof);
}

TEST(client_status, expiry_follows_trusting_period) {
  auto chain = ibc::testing::memory_chain_t{
      ibc::storage::make_storage<ibc::storage::memory_storage_tag>(""),
      ibc::host::make_chain_info("host-1")};
  const auto created = ibc::core::from_seconds(1'000'000);
  auto client_id = ibc::host::client_id_t{"07-tendermint-0"};
  auto state = ibc::client::client_state_t{
      .chain_id = "tracked-1",
      .trust_level = {1, 3},
      .trusting_period = ibc::core::seconds(1000),
      .unbonding_period = ibc::core::seconds(2000),
      .max_clock_drift = ibc::core::seconds(10),
      .latest_height = {.revision_number = 1, .revision_height = 5},
      .frozen_height = std::nullopt,
      .proof_specs = {},
      .upgrade_path = {},
      .allow_update = {}};

  chain.begin_block(1, created, {});
  auto tx = ibc::host::transaction{chain};
  ibc::client::set_client_state(tx, client_id, state);
  ASSERT_TRUE(ibc::client::set_consensus_state(
      tx, client_id, state.latest_height,
      ibc::client::consensus_state_t{.root = ibc::testing::make_bytes("root"),
                                     .timestamp = created,
                                     .next_validators_hash = {}}));
  ASSERT_TRUE(chain.apply(tx.changes()));

  chain.begin_block(2, ibc::core::add(created, ibc::core::seconds(999)), {});
  auto status = ibc::client::status(chain, client_id, state);
  ASSERT_TRUE(status);
  EXPECT_EQ(status.value(), ibc::client::client_status::active);

  chain.begin_block(3, ibc::core::add(created, ibc::core::seconds(1001)), {});
  status = ibc::client::status(chain, client_id, state);
  ASSERT_TRUE(status);
  EXPECT_EQ(status.value(), ibc::client::client_status::expired);
  EXPECT_EQ(error_of(ibc::client::require_active(chain, client_id, state)),
            error_code::client_expired);

  state.frozen_height = state.latest_height;
  status = ibc::client::status(chain, client_id, state);
  ASSERT_TRUE(status);
  EXPECT_EQ(status.value(), ibc::client::client_status::frozen);
}

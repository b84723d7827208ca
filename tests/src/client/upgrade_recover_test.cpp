#include <ibc/client/handler.hpp>
#include <ibc/client/status.hpp>
#include <ibc/client/store.hpp>
#include <ibc/host/path.hpp>
#include <ibc/schema/encoding/scale/encoder.hpp>
#include <ibc/testing/relayer.hpp>
#include <gtest/gtest.h>

using ibc::common::error_code;
using ibc::testing::error_of;

namespace {

class upgrade_client_test : public ::testing::Test {
 protected:
  void SetUp() override {
    a.commit();
    b.commit();
    client_id = ibc::testing::create_client(a, b);
    a.commit();

    // b schedules its upgrade in the block it is about to commit.
    plan_height = b.store().host_height().revision_height;
    upgraded_client = ibc::client::zero_custom_fields(b.client_state(1));
    upgraded_client.chain_id = "chain-b-2";
    upgraded_client.latest_height = {.revision_number = 2, .revision_height = 1};
    upgraded_consensus = ibc::client::consensus_state_t{
        .root = ibc::testing::make_bytes("next revision root"),
        .timestamp = b.store().host_timestamp(),
        .next_validators_hash = ibc::client::hash(b.validators())};

    auto encoder = ibc::schema::encoding::scale_encoder_t{};
    ASSERT_TRUE(b.store().set(ibc::host::kUpgradeStore, client_key(),
                              encoder.encode(upgraded_client)));
    ASSERT_TRUE(b.store().set(ibc::host::kUpgradeStore, consensus_key(),
                              encoder.encode(upgraded_consensus)));
    b.commit();
    ibc::testing::update_client(a, client_id, b);
  }

  std::string client_key() const {
    return ibc::host::path::upgraded_client_state("upgradedIBCState",
                                                  plan_height);
  }
  std::string consensus_key() const {
    return ibc::host::path::upgraded_consensus_state("upgradedIBCState",
                                                     plan_height);
  }

  ibc::client::msg_upgrade_client upgrade_msg() const {
    return ibc::client::msg_upgrade_client{
        .client_id = client_id,
        .client_state = upgraded_client,
        .consensus_state = upgraded_consensus,
        .proof_upgrade_client =
            b.prove_in(ibc::host::kUpgradeStore, client_key()),
        .proof_upgrade_consensus_state =
            b.prove_in(ibc::host::kUpgradeStore, consensus_key())};
  }

  ibc::testing::mock_clock clock;
  ibc::testing::mock_chain a{"chain-a-1", clock};
  ibc::testing::mock_chain b{"chain-b-1", clock};
  ibc::host::client_id_t client_id;
  uint64_t plan_height{};
  ibc::client::client_state_t upgraded_client;
  ibc::client::consensus_state_t upgraded_consensus;
};

}  // namespace

TEST_F(upgrade_client_test, proven_upgrade_moves_client_to_new_revision) {
  auto before = ibc::testing::client_state(a, client_id);
  auto events = ibc::testing::require(a.dispatch(upgrade_msg()), "upgrade");
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(events[0].type, "upgrade_client");

  auto after = ibc::testing::client_state(a, client_id);
  EXPECT_EQ(after.chain_id, "chain-b-2");
  EXPECT_EQ(after.latest_height, upgraded_client.latest_height);
  EXPECT_EQ(after.trusting_period, before.trusting_period);
  EXPECT_EQ(after.trust_level, before.trust_level);
  EXPECT_EQ(after.max_clock_drift, before.max_clock_drift);

  auto consensus = ibc::client::get_consensus_state(a.store(), client_id,
                                                    after.latest_height);
  ASSERT_TRUE(consensus);
  EXPECT_EQ(consensus.value().root,
            ibc::schema::make_bytes(ibc::client::kSentinelRoot));
  EXPECT_EQ(consensus.value().timestamp, upgraded_consensus.timestamp);
}

TEST_F(upgrade_client_test, upgrade_must_raise_the_height) {
  auto msg = upgrade_msg();
  msg.client_state.latest_height = ibc::testing::client_state(a, client_id)
                                       .latest_height;
  msg.client_state.chain_id = "chain-b-1";
  EXPECT_EQ(error_of(a.dispatch(msg)), error_code::low_upgrade_height);
}

TEST_F(upgrade_client_test, unproven_upgrade_is_rejected) {
  auto msg = upgrade_msg();
  msg.client_state.unbonding_period += ibc::core::seconds(1);
  EXPECT_EQ(error_of(a.dispatch(msg)), error_code::upgrade_verification_failed);

  msg = upgrade_msg();
  msg.consensus_state.timestamp = {};
  EXPECT_EQ(error_of(a.dispatch(msg)), error_code::invalid_consensus_state);

  msg = upgrade_msg();
  std::swap(msg.proof_upgrade_client, msg.proof_upgrade_consensus_state);
  EXPECT_EQ(error_of(a.dispatch(msg)), error_code::upgrade_verification_failed);
  EXPECT_EQ(ibc::testing::client_state(a, client_id).chain_id, "chain-b-1");
}

namespace {

class recover_client_test : public ::testing::Test {
 protected:
  void SetUp() override {
    a.commit();
    b.commit();
    subject = create(true);
    locked = create(false);
    a.commit();

    // Let both clients run out of trust.
    clock.now_ms += 200'000;
    b.advance(2);
    a.commit();
    substitute = create(true);
    a.commit();
  }

  ibc::host::client_id_t create(const bool after_expiry) {
    auto msg = b.create_client_msg();
    msg.client_state.trusting_period = ibc::core::seconds(100);
    msg.client_state.allow_update.after_expiry = after_expiry;
    auto events = ibc::testing::require(a.dispatch(msg), "create_client");
    return ibc::host::client_id_t{
        ibc::testing::attribute_of(events, "create_client", "client_id")};
  }

  ibc::client::client_status status_of(const ibc::host::client_id_t& id) {
    auto state = ibc::testing::client_state(a, id);
    auto status = ibc::client::status(a.store(), id, state);
    if (!status) {
      throw std::runtime_error{ibc::common::describe(status.error())};
    }
    return status.value();
  }

  ibc::testing::mock_clock clock;
  ibc::testing::mock_chain a{"chain-a-1", clock};
  ibc::testing::mock_chain b{"chain-b-1", clock};
  ibc::host::client_id_t subject;
  ibc::host::client_id_t locked;
  ibc::host::client_id_t substitute;
};

}  // namespace

TEST_F(recover_client_test, expired_subject_takes_over_substitute_state) {
  ASSERT_EQ(status_of(subject), ibc::client::client_status::expired);
  ASSERT_EQ(status_of(substitute), ibc::client::client_status::active);

  auto events = ibc::testing::require(
      a.dispatch(ibc::client::msg_recover_client{
          .subject_client_id = subject, .substitute_client_id = substitute}),
      "recover");
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(events[0].type, "recover_client");
  EXPECT_EQ(events[0].attribute("substitute_client_id"), substitute.value);

  EXPECT_EQ(status_of(subject), ibc::client::client_status::active);
  EXPECT_EQ(ibc::testing::client_state(a, subject).latest_height,
            ibc::testing::client_state(a, substitute).latest_height);
}

TEST_F(recover_client_test, recovery_needs_permission_and_distinct_clients) {
  EXPECT_EQ(error_of(a.dispatch(ibc::client::msg_recover_client{
                .subject_client_id = locked,
                .substitute_client_id = substitute})),
            error_code::update_not_allowed);
  EXPECT_EQ(error_of(a.dispatch(ibc::client::msg_recover_client{
                .subject_client_id = substitute,
                .substitute_client_id = substitute})),
            error_code::invalid_recovery);
  EXPECT_EQ(error_of(a.dispatch(ibc::client::msg_recover_client{
                .subject_client_id = substitute,
                .substitute_client_id = subject})),
            error_code::invalid_recovery);
  EXPECT_EQ(status_of(locked), ibc::client::client_status::expired);
}

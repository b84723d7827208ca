#include <ibc/channel/handler.hpp>
#include <ibc/channel/store.hpp>
#include <ibc/host/path.hpp>
#include <ibc/testing/relayer.hpp>
#include <gtest/gtest.h>

using ibc::channel::channel_state;
using ibc::channel::ordering;
using ibc::common::error_code;
using ibc::testing::error_of;

namespace {

class packet_flow_test : public ::testing::Test {
 protected:
  packet_flow_test(const ordering order = ordering::unordered)
      : chains{order} {}

  // Height on b far enough ahead that nothing in the test reaches it.
  ibc::core::height_t far_timeout() const {
    return chains.b.height(chains.b.committed_height() + 100);
  }

  ibc::channel::packet_t send(const uint64_t sequence,
                              const ibc::core::height_t& timeout) {
    auto packet = ibc::testing::make_packet(chains.path, sequence, timeout);
    ibc::testing::require(chains.a.engine().send_packet(packet), "send");
    return packet;
  }

  // Commit a, bring b's client up to date, and deliver `packet`.
  ibc::common::result_t<ibc::handler::events_t> relay(
      const ibc::channel::packet_t& packet) {
    chains.a.commit();
    ibc::testing::update_client(chains.b, chains.path.b.client_id, chains.a);
    return chains.b.dispatch(ibc::testing::recv_packet_msg(chains.path, packet));
  }

  ibc::common::result_t<ibc::handler::events_t> acknowledge(
      const ibc::channel::packet_t& packet) {
    chains.b.commit();
    ibc::testing::update_client(chains.a, chains.path.a.client_id, chains.b);
    return chains.a.dispatch(ibc::testing::acknowledgement_msg(
        chains.path, packet, chains.module_b->acknowledgement));
  }

  // Let b pass the packet's timeout height, then prove it unreceived.
  ibc::common::result_t<ibc::handler::events_t> time_out(
      const ibc::channel::packet_t& packet) {
    chains.b.advance(3);
    ibc::testing::update_client(chains.a, chains.path.a.client_id, chains.b);
    return chains.a.dispatch(ibc::testing::timeout_msg(
        chains.path, packet,
        ibc::testing::channel_end(chains.path.a).ordering));
  }

  std::optional<ibc::schema::bytes_t> commitment_of(
      const ibc::channel::packet_t& packet) const {
    auto stored = ibc::channel::get_packet_commitment(
        chains.a.store(), packet.source_port, packet.source_channel,
        packet.sequence);
    EXPECT_TRUE(stored);
    return stored ? stored.value() : std::nullopt;
  }

  ibc::testing::linked_chains chains;
};

class ordered_packet_flow_test : public packet_flow_test {
 protected:
  ordered_packet_flow_test() : packet_flow_test{ordering::ordered} {}
};

}  // namespace

TEST_F(packet_flow_test, send_commits_the_packet) {
  auto packet = ibc::testing::make_packet(chains.path, 1, far_timeout());
  auto events = chains.a.engine().send_packet(packet);
  ASSERT_TRUE(events);
  ASSERT_EQ(events.value().size(), 1u);
  const auto& event = events.value().front();
  EXPECT_EQ(event.type, "send_packet");
  EXPECT_EQ(event.attribute("packet_sequence"), "1");
  EXPECT_EQ(event.attribute("packet_data_hex"), "7061636b65742d31");
  EXPECT_EQ(event.attribute("packet_src_channel"),
            chains.path.a.channel_id.value);
  EXPECT_EQ(event.attribute("packet_dst_channel"),
            chains.path.b.channel_id.value);
  EXPECT_EQ(event.attribute("packet_channel_ordering"), "ORDER_UNORDERED");

  EXPECT_EQ(commitment_of(packet),
            ibc::schema::make_bytes(ibc::channel::commit_packet(packet)));
  auto next = ibc::channel::get_next_sequence(
      chains.a.store(), ibc::channel::sequence_kind::send,
      chains.path.a.port_id, chains.path.a.channel_id);
  ASSERT_TRUE(next);
  EXPECT_EQ(next.value(), 2u);

  EXPECT_EQ(error_of(chains.a.engine().send_packet(packet)),
            error_code::invalid_packet_sequence);
}

TEST_F(packet_flow_test, send_needs_a_live_timeout) {
  auto packet = ibc::testing::make_packet(chains.path, 1, {});
  EXPECT_EQ(error_of(chains.a.engine().send_packet(packet)),
            error_code::missing_timeout);

  auto tracked = ibc::testing::client_state(chains.a, chains.path.a.client_id);
  packet.timeout_height = tracked.latest_height;
  EXPECT_EQ(error_of(chains.a.engine().send_packet(packet)),
            error_code::packet_expired);

  packet.timeout_height = {};
  packet.timeout_timestamp = ibc::core::timestamp_t{1};
  EXPECT_EQ(error_of(chains.a.engine().send_packet(packet)),
            error_code::packet_expired);

  packet.timeout_timestamp = {};
  packet.timeout_height = far_timeout();
  packet.destination_channel = ibc::host::channel_id_t{"channel-9"};
  EXPECT_EQ(error_of(chains.a.engine().send_packet(packet)),
            error_code::invalid_counterparty);
}

TEST_F(packet_flow_test, receive_and_acknowledge) {
  auto packet = send(1, far_timeout());

  auto received = relay(packet);
  ASSERT_TRUE(received);
  ASSERT_EQ(received.value().size(), 2u);
  EXPECT_EQ(received.value()[0].type, "recv_packet");
  EXPECT_EQ(received.value()[1].type, "write_acknowledgement");
  EXPECT_EQ(received.value()[1].attribute("packet_ack_hex"), "01");
  ASSERT_EQ(chains.module_b->received.size(), 1u);
  EXPECT_EQ(chains.module_b->received.front(), packet);

  const auto& b_end = chains.path.b;
  auto receipt = ibc::channel::has_packet_receipt(
      chains.b.store(), b_end.port_id, b_end.channel_id, 1);
  ASSERT_TRUE(receipt);
  EXPECT_TRUE(receipt.value());
  auto ack = ibc::channel::get_ack_commitment(chains.b.store(), b_end.port_id,
                                              b_end.channel_id, 1);
  ASSERT_TRUE(ack);
  EXPECT_EQ(ack.value(), ibc::schema::make_bytes(
                             ibc::channel::commit_acknowledgement(
                                 chains.module_b->acknowledgement)));

  auto acked = acknowledge(packet);
  ASSERT_TRUE(acked);
  ASSERT_EQ(acked.value().size(), 1u);
  EXPECT_EQ(acked.value()[0].type, "acknowledge_packet");
  EXPECT_FALSE(commitment_of(packet).has_value());
  ASSERT_EQ(chains.module_a->acknowledged.size(), 1u);

  EXPECT_EQ(error_of(chains.a.dispatch(ibc::testing::acknowledgement_msg(
                chains.path, packet, chains.module_b->acknowledgement))),
            error_code::packet_commitment_not_found);
}

TEST_F(packet_flow_test, duplicate_receive_is_rejected) {
  auto packet = send(1, far_timeout());
  ASSERT_TRUE(relay(packet));
  EXPECT_EQ(error_of(chains.b.dispatch(
                ibc::testing::recv_packet_msg(chains.path, packet))),
            error_code::packet_already_received);
  EXPECT_EQ(chains.module_b->received.size(), 1u);
}

TEST_F(packet_flow_test, tampered_packet_fails_verification) {
  auto packet = send(1, far_timeout());
  chains.a.commit();
  ibc::testing::update_client(chains.b, chains.path.b.client_id, chains.a);
  auto msg = ibc::testing::recv_packet_msg(chains.path, packet);
  msg.packet.data = ibc::testing::make_bytes("forged");
  EXPECT_EQ(error_of(chains.b.dispatch(msg)),
            error_code::channel_verification_failed);
}

TEST_F(packet_flow_test, receive_after_timeout_height_is_rejected) {
  auto packet =
      send(1, chains.b.height(chains.b.committed_height() + 2));
  chains.b.advance(2);
  EXPECT_EQ(error_of(relay(packet)),
            error_code::packet_timeout_height_elapsed);
}

TEST_F(packet_flow_test, refused_receive_writes_nothing) {
  auto packet = send(1, far_timeout());
  chains.module_b->fail_recv = true;
  EXPECT_EQ(error_of(relay(packet)), error_code::module_callback_failed);

  const auto& b_end = chains.path.b;
  auto receipt = ibc::channel::has_packet_receipt(
      chains.b.store(), b_end.port_id, b_end.channel_id, 1);
  ASSERT_TRUE(receipt);
  EXPECT_FALSE(receipt.value());

  chains.module_b->fail_recv = false;
  EXPECT_TRUE(chains.b.dispatch(
      ibc::testing::recv_packet_msg(chains.path, packet)));
}

TEST_F(packet_flow_test, refused_acknowledgement_keeps_the_commitment) {
  auto packet = send(1, far_timeout());
  ASSERT_TRUE(relay(packet));
  chains.module_a->fail_ack_validate = true;
  EXPECT_EQ(error_of(acknowledge(packet)), error_code::module_callback_failed);
  EXPECT_TRUE(commitment_of(packet).has_value());
  EXPECT_TRUE(chains.module_a->acknowledged.empty());
}

TEST_F(packet_flow_test, unordered_timeout_removes_the_commitment) {
  auto packet =
      send(1, chains.b.height(chains.b.committed_height() + 1));
  chains.a.commit();

  auto events = time_out(packet);
  ASSERT_TRUE(events);
  ASSERT_EQ(events.value().size(), 1u);
  EXPECT_EQ(events.value()[0].type, "timeout_packet");
  EXPECT_FALSE(commitment_of(packet).has_value());
  ASSERT_EQ(chains.module_a->timed_out.size(), 1u);
  EXPECT_EQ(ibc::testing::channel_end(chains.path.a).state,
            channel_state::open);

  EXPECT_EQ(error_of(chains.a.dispatch(ibc::testing::timeout_msg(
                chains.path, packet, ordering::unordered))),
            error_code::packet_commitment_not_found);
}

TEST_F(packet_flow_test, acknowledged_packet_cannot_time_out) {
  auto packet =
      send(1, chains.b.height(chains.b.committed_height() + 3));
  ASSERT_TRUE(relay(packet));
  ASSERT_TRUE(acknowledge(packet));

  EXPECT_EQ(error_of(time_out(packet)),
            error_code::packet_commitment_not_found);
  EXPECT_TRUE(chains.module_a->timed_out.empty());
  EXPECT_EQ(chains.module_a->acknowledged.size(), 1u);
}

TEST_F(packet_flow_test, timed_out_packet_cannot_be_acknowledged) {
  auto packet =
      send(1, chains.b.height(chains.b.committed_height() + 1));
  chains.a.commit();
  ASSERT_TRUE(time_out(packet));

  EXPECT_EQ(error_of(acknowledge(packet)),
            error_code::packet_commitment_not_found);
  EXPECT_TRUE(chains.module_a->acknowledged.empty());
  EXPECT_EQ(chains.module_a->timed_out.size(), 1u);
}

TEST_F(packet_flow_test, timeout_before_the_deadline_is_rejected) {
  auto packet = send(1, far_timeout());
  chains.a.commit();
  EXPECT_EQ(error_of(time_out(packet)), error_code::timeout_not_reached);
  EXPECT_TRUE(commitment_of(packet).has_value());
}

TEST_F(packet_flow_test, received_packet_cannot_time_out) {
  auto packet =
      send(1, chains.b.height(chains.b.committed_height() + 3));
  ASSERT_TRUE(relay(packet));

  EXPECT_EQ(error_of(time_out(packet)),
            error_code::channel_verification_failed);
  EXPECT_TRUE(chains.module_a->timed_out.empty());

  EXPECT_TRUE(chains.a.dispatch(ibc::testing::acknowledgement_msg(
      chains.path, packet, chains.module_b->acknowledgement)));
  EXPECT_FALSE(commitment_of(packet).has_value());
}

TEST_F(packet_flow_test, timeout_on_close_uses_the_closed_counterparty) {
  auto packet = send(1, far_timeout());
  chains.a.commit();

  const auto& path = chains.path;
  ibc::testing::require(
      chains.b.dispatch(ibc::channel::msg_chan_close_init{
          .port_id = path.b.port_id, .channel_id = path.b.channel_id}),
      "close_init");
  chains.b.commit();
  ibc::testing::update_client(chains.a, path.a.client_id, chains.b);

  auto msg = ibc::channel::msg_timeout_on_close{
      .packet = packet,
      .next_sequence_recv = 0,
      .proof_unreceived = chains.b.prove(ibc::host::path::receipt(
          path.b.port_id, path.b.channel_id, packet.sequence)),
      .proof_close = chains.b.prove(
          ibc::host::path::channel_end(path.b.port_id, path.b.channel_id)),
      .proof_height = chains.b.latest_height()};
  auto bad = msg;
  bad.proof_close = bad.proof_unreceived;
  EXPECT_EQ(error_of(chains.a.dispatch(bad)),
            error_code::channel_verification_failed);

  auto events = chains.a.dispatch(msg);
  ASSERT_TRUE(events);
  ASSERT_EQ(events.value().size(), 1u);
  EXPECT_EQ(events.value()[0].type, "timeout_packet");
  EXPECT_FALSE(commitment_of(packet).has_value());
}

TEST_F(ordered_packet_flow_test, packets_arrive_in_sequence) {
  auto first = send(1, far_timeout());
  auto second = send(2, far_timeout());

  EXPECT_EQ(error_of(relay(second)), error_code::invalid_packet_sequence);
  ASSERT_TRUE(chains.b.dispatch(
      ibc::testing::recv_packet_msg(chains.path, first)));
  ASSERT_TRUE(chains.b.dispatch(
      ibc::testing::recv_packet_msg(chains.path, second)));

  auto next = ibc::channel::get_next_sequence(
      chains.b.store(), ibc::channel::sequence_kind::recv,
      chains.path.b.port_id, chains.path.b.channel_id);
  ASSERT_TRUE(next);
  EXPECT_EQ(next.value(), 3u);

  EXPECT_EQ(error_of(acknowledge(second)), error_code::invalid_packet_sequence);
  ASSERT_TRUE(chains.a.dispatch(ibc::testing::acknowledgement_msg(
      chains.path, first, chains.module_b->acknowledgement)));
  ASSERT_TRUE(chains.a.dispatch(ibc::testing::acknowledgement_msg(
      chains.path, second, chains.module_b->acknowledgement)));
}

TEST_F(ordered_packet_flow_test, timeout_closes_the_channel) {
  auto packet =
      send(1, chains.b.height(chains.b.committed_height() + 1));
  chains.a.commit();

  auto events = time_out(packet);
  ASSERT_TRUE(events);
  ASSERT_EQ(events.value().size(), 2u);
  EXPECT_EQ(events.value()[0].type, "timeout_packet");
  EXPECT_EQ(events.value()[1].type, "channel_close");
  EXPECT_EQ(ibc::testing::channel_end(chains.path.a).state,
            channel_state::closed);

  auto next = ibc::testing::make_packet(chains.path, 2, far_timeout());
  EXPECT_EQ(error_of(chains.a.engine().send_packet(next)),
            error_code::channel_closed);
}

namespace {

// Connection with a delay period, channel init committed on a and b's
// client updated; the open try on b is subject to the delay.
class delayed_channel_test : public ::testing::Test {
 protected:
  void open(const ibc::schema::duration_nanoseconds_t delay) {
    path = ibc::testing::make_path(a, b);
    ASSERT_TRUE(a.modules().add_route(
        path.a.port_id, std::make_shared<ibc::testing::mock_module>()));
    ASSERT_TRUE(b.modules().add_route(
        path.b.port_id, std::make_shared<ibc::testing::mock_module>()));
    ibc::testing::open_connection(path, delay);

    ibc::testing::require(
        a.dispatch(ibc::channel::msg_chan_open_init{
            .port_id = path.a.port_id,
            .connection_hops = {path.a.connection_id},
            .counterparty_port_id = path.b.port_id,
            .ordering = ordering::unordered,
            .version = ""}),
        "init");
    path.a.channel_id = ibc::host::channel_id_t{"channel-0"};
    a.commit();
    ibc::testing::update_client(b, path.b.client_id, a);
  }

  ibc::channel::msg_chan_open_try try_msg() const {
    return ibc::channel::msg_chan_open_try{
        .port_id = path.b.port_id,
        .connection_hops = {path.b.connection_id},
        .counterparty_port_id = path.a.port_id,
        .counterparty_channel_id = path.a.channel_id,
        .ordering = ordering::unordered,
        .counterparty_version = "mock-1",
        .proof_init = a.prove(
            ibc::host::path::channel_end(path.a.port_id, path.a.channel_id)),
        .proof_height = a.latest_height()};
  }

  ibc::testing::mock_clock clock;
  ibc::testing::mock_chain a{"chain-a-1", clock};
  ibc::testing::mock_chain b{"chain-b-1", clock};
  ibc::testing::path_t path;
};

}  // namespace

TEST_F(delayed_channel_test, proofs_wait_for_the_delay_time) {
  open(ibc::core::seconds(10));
  EXPECT_EQ(error_of(b.dispatch(try_msg())),
            error_code::not_enough_time_elapsed);
  b.advance(2);
  EXPECT_TRUE(b.dispatch(try_msg()));
}

TEST_F(delayed_channel_test, proofs_wait_for_the_delay_blocks) {
  // 60 s over a 30 s expected block time is two blocks.
  open(ibc::core::seconds(60));
  clock.now_ms += 60'000;
  b.commit();
  EXPECT_EQ(error_of(b.dispatch(try_msg())),
            error_code::not_enough_blocks_elapsed);
  b.commit();
  EXPECT_TRUE(b.dispatch(try_msg()));
}

#pragma once

#include <ibc/channel/store.hpp>
#include <ibc/client/store.hpp>
#include <ibc/connection/store.hpp>
#include <ibc/host/path.hpp>
#include <ibc/testing/mock_chain.hpp>
#include <ibc/testing/common.hpp>
#include <ibc/testing/mock_module.hpp>

#include <fmt/format.h>

#include <memory>
#include <stdexcept>
#include <string>

// Relayer steps between two mock chains. Every step that must succeed
// throws on failure so that a broken precondition fails the calling test
// at the step that broke.
namespace ibc::testing {

inline ibc::handler::events_t require(
    ibc::common::result_t<ibc::handler::events_t> result,
    const std::string_view step) {
  if (!result) {
    throw std::runtime_error{fmt::format(
        "{} failed: {}", step, ibc::common::describe(result.error()))};
  }
  return std::move(result.value());
}

inline std::string attribute_of(const ibc::handler::events_t& events,
                                const std::string_view type,
                                const std::string_view key) {
  for (const auto& event : events) {
    if (event.type == type) {
      return std::string{event.attribute(key)};
    }
  }
  throw std::runtime_error{fmt::format("no {} event", type)};
}

/// Create on `host` a client tracking `tracked`'s last committed block.
inline ibc::host::client_id_t create_client(mock_chain& host,
                                           const mock_chain& tracked) {
  auto events =
      require(host.dispatch(tracked.create_client_msg()), "create_client");
  return ibc::host::client_id_t{
      attribute_of(events, "create_client", "client_id")};
}

inline ibc::client::client_state_t client_state(
    const mock_chain& host,
    const ibc::host::client_id_t& client_id) {
  auto state = ibc::client::get_client_state(host.store(), client_id);
  if (!state) {
    throw std::runtime_error{ibc::common::describe(state.error())};
  }
  return state.value();
}

inline ibc::client::msg_update_client update_client_msg(
    const mock_chain& host,
    const ibc::host::client_id_t& client_id,
    const mock_chain& tracked,
    const uint64_t at) {
  return ibc::client::msg_update_client{
      .client_id = client_id,
      .header =
          tracked.header(at, client_state(host, client_id).latest_height)};
}

/// Bring `host`'s client of `tracked` to `tracked`'s last committed block.
inline void update_client(mock_chain& host,
                          const ibc::host::client_id_t& client_id,
                          const mock_chain& tracked) {
  if (client_state(host, client_id).latest_height >= tracked.latest_height()) {
    return;
  }
  require(host.dispatch(update_client_msg(host, client_id, tracked,
                                          tracked.committed_height())),
          "update_client");
}

struct endpoint_t final {
  mock_chain* chain{};
  ibc::host::client_id_t client_id;
  ibc::host::connection_id_t connection_id;
  ibc::host::port_id_t port_id{"transfer"};
  ibc::host::channel_id_t channel_id;
};

/// Two chains with a client of each other on each side.
struct path_t final {
  endpoint_t a;
  endpoint_t b;
};

inline path_t make_path(mock_chain& a, mock_chain& b) {
  a.commit();
  b.commit();
  auto path = path_t{};
  path.a.chain = &a;
  path.b.chain = &b;
  path.a.client_id = create_client(a, b);
  path.b.client_id = create_client(b, a);
  a.commit();
  b.commit();
  return path;
}

inline ibc::connection::counterparty_t connection_counterparty(
    const endpoint_t& remote,
    const bool with_connection_id) {
  auto counterparty = ibc::connection::counterparty_t{
      .client_id = remote.client_id,
      .connection_id = std::nullopt,
      .prefix = remote.chain->store().chain_info().commitment_prefix};
  if (with_connection_id) {
    counterparty.connection_id = remote.connection_id;
  }
  return counterparty;
}

inline ibc::connection::msg_conn_open_init conn_open_init_msg(
    const endpoint_t& local,
    const endpoint_t& remote,
    const ibc::schema::duration_nanoseconds_t delay_period = 0) {
  return ibc::connection::msg_conn_open_init{
      .client_id = local.client_id,
      .counterparty = connection_counterparty(remote, false),
      .version = std::nullopt,
      .delay_period = delay_period};
}

/// Try on `local` for the connection `remote` initialised. Proofs are from
/// `remote`'s last committed block.
inline ibc::connection::msg_conn_open_try conn_open_try_msg(
    const endpoint_t& local,
    const endpoint_t& remote) {
  const auto& chain = *remote.chain;
  auto remote_client = client_state(chain, remote.client_id);
  auto end = ibc::connection::get_connection(chain.store(),
                                             remote.connection_id);
  if (!end) {
    throw std::runtime_error{ibc::common::describe(end.error())};
  }
  return ibc::connection::msg_conn_open_try{
      .client_id = local.client_id,
      .client_state = remote_client,
      .counterparty = connection_counterparty(remote, true),
      .delay_period = end.value().delay_period,
      .counterparty_versions = end.value().versions,
      .proof_height = chain.latest_height(),
      .proof_init =
          chain.prove(ibc::host::path::connection(remote.connection_id)),
      .proof_client =
          chain.prove(ibc::host::path::client_state(remote.client_id)),
      .proof_consensus = chain.prove(ibc::host::path::consensus_state(
          remote.client_id, remote_client.latest_height)),
      .consensus_height = remote_client.latest_height};
}

inline ibc::connection::msg_conn_open_ack conn_open_ack_msg(
    const endpoint_t& local,
    const endpoint_t& remote) {
  const auto& chain = *remote.chain;
  auto remote_client = client_state(chain, remote.client_id);
  auto end = ibc::connection::get_connection(chain.store(),
                                             remote.connection_id);
  if (!end) {
    throw std::runtime_error{ibc::common::describe(end.error())};
  }
  return ibc::connection::msg_conn_open_ack{
      .connection_id = local.connection_id,
      .counterparty_connection_id = remote.connection_id,
      .version = end.value().versions.front(),
      .client_state = remote_client,
      .proof_height = chain.latest_height(),
      .proof_try =
          chain.prove(ibc::host::path::connection(remote.connection_id)),
      .proof_client =
          chain.prove(ibc::host::path::client_state(remote.client_id)),
      .proof_consensus = chain.prove(ibc::host::path::consensus_state(
          remote.client_id, remote_client.latest_height)),
      .consensus_height = remote_client.latest_height};
}

inline ibc::connection::msg_conn_open_confirm conn_open_confirm_msg(
    const endpoint_t& local,
    const endpoint_t& remote) {
  const auto& chain = *remote.chain;
  return ibc::connection::msg_conn_open_confirm{
      .connection_id = local.connection_id,
      .proof_ack =
          chain.prove(ibc::host::path::connection(remote.connection_id)),
      .proof_height = chain.latest_height()};
}

/// Commit enough empty blocks on `chain` for a proof checked against a
/// `delay` period to pass, in both time and height.
inline void wait_out_delay(mock_chain& chain,
                           const ibc::schema::duration_nanoseconds_t delay) {
  const auto block_time = kBlockTimeMs * 1'000'000ull;
  chain.advance((delay + block_time - 1) / block_time);
}

/// Run the four connection steps, committing after each one. Each proof is
/// submitted only once `delay` has passed since the client update.
inline void open_connection(path_t& path,
                            const ibc::schema::duration_nanoseconds_t delay =
                                0) {
  auto& a = *path.a.chain;
  auto& b = *path.b.chain;
  auto events =
      require(a.dispatch(conn_open_init_msg(path.a, path.b, delay)),
              "conn_open_init");
  path.a.connection_id = ibc::host::connection_id_t{
      attribute_of(events, "connection_open_init", "connection_id")};
  a.commit();

  update_client(b, path.b.client_id, a);
  wait_out_delay(b, delay);
  events = require(b.dispatch(conn_open_try_msg(path.b, path.a)),
                   "conn_open_try");
  path.b.connection_id = ibc::host::connection_id_t{
      attribute_of(events, "connection_open_try", "connection_id")};
  b.commit();

  update_client(a, path.a.client_id, b);
  wait_out_delay(a, delay);
  require(a.dispatch(conn_open_ack_msg(path.a, path.b)), "conn_open_ack");
  a.commit();

  update_client(b, path.b.client_id, a);
  wait_out_delay(b, delay);
  require(b.dispatch(conn_open_confirm_msg(path.b, path.a)),
          "conn_open_confirm");
  b.commit();
}

inline ibc::channel::channel_end_t channel_end(const endpoint_t& endpoint) {
  auto end = ibc::channel::get_channel(endpoint.chain->store(),
                                       endpoint.port_id, endpoint.channel_id);
  if (!end) {
    throw std::runtime_error{ibc::common::describe(end.error())};
  }
  return end.value();
}

/// Run the four channel steps over an open connection.
inline void open_channel(path_t& path, const ibc::channel::ordering order) {
  auto& a = *path.a.chain;
  auto& b = *path.b.chain;
  auto events = require(
      a.dispatch(ibc::channel::msg_chan_open_init{
          .port_id = path.a.port_id,
          .connection_hops = {path.a.connection_id},
          .counterparty_port_id = path.b.port_id,
          .ordering = order,
          .version = ""}),
      "chan_open_init");
  path.a.channel_id = ibc::host::channel_id_t{
      attribute_of(events, "channel_open_init", "channel_id")};
  a.commit();

  update_client(b, path.b.client_id, a);
  events = require(
      b.dispatch(ibc::channel::msg_chan_open_try{
          .port_id = path.b.port_id,
          .connection_hops = {path.b.connection_id},
          .counterparty_port_id = path.a.port_id,
          .counterparty_channel_id = path.a.channel_id,
          .ordering = order,
          .counterparty_version = channel_end(path.a).version,
          .proof_init = a.prove(ibc::host::path::channel_end(
              path.a.port_id, path.a.channel_id)),
          .proof_height = a.latest_height()}),
      "chan_open_try");
  path.b.channel_id = ibc::host::channel_id_t{
      attribute_of(events, "channel_open_try", "channel_id")};
  b.commit();

  update_client(a, path.a.client_id, b);
  require(a.dispatch(ibc::channel::msg_chan_open_ack{
              .port_id = path.a.port_id,
              .channel_id = path.a.channel_id,
              .counterparty_channel_id = path.b.channel_id,
              .counterparty_version = channel_end(path.b).version,
              .proof_try = b.prove(ibc::host::path::channel_end(
                  path.b.port_id, path.b.channel_id)),
              .proof_height = b.latest_height()}),
          "chan_open_ack");
  a.commit();

  update_client(b, path.b.client_id, a);
  require(b.dispatch(ibc::channel::msg_chan_open_confirm{
              .port_id = path.b.port_id,
              .channel_id = path.b.channel_id,
              .proof_ack = a.prove(ibc::host::path::channel_end(
                  path.a.port_id, path.a.channel_id)),
              .proof_height = a.latest_height()}),
          "chan_open_confirm");
  b.commit();
}

/// Packet from `a` to `b` on the path's channel.
inline ibc::channel::packet_t make_packet(const path_t& path,
                                          const uint64_t sequence,
                                          const ibc::core::height_t& timeout,
                                          const ibc::core::timestamp_t
                                              timeout_timestamp = {}) {
  return ibc::channel::packet_t{
      .sequence = sequence,
      .source_port = path.a.port_id,
      .source_channel = path.a.channel_id,
      .destination_port = path.b.port_id,
      .destination_channel = path.b.channel_id,
      .data = make_bytes(fmt::format("packet-{}", sequence)),
      .timeout_height = timeout,
      .timeout_timestamp = timeout_timestamp};
}

inline ibc::channel::msg_recv_packet recv_packet_msg(
    const path_t& path,
    const ibc::channel::packet_t& packet) {
  const auto& a = *path.a.chain;
  return ibc::channel::msg_recv_packet{
      .packet = packet,
      .proof_commitment = a.prove(ibc::host::path::commitment(
          packet.source_port, packet.source_channel, packet.sequence)),
      .proof_height = a.latest_height()};
}

inline ibc::channel::msg_acknowledgement acknowledgement_msg(
    const path_t& path,
    const ibc::channel::packet_t& packet,
    const ibc::schema::bytes_t& acknowledgement) {
  const auto& b = *path.b.chain;
  return ibc::channel::msg_acknowledgement{
      .packet = packet,
      .acknowledgement = acknowledgement,
      .proof_acked = b.prove(ibc::host::path::ack(packet.destination_port,
                                                  packet.destination_channel,
                                                  packet.sequence)),
      .proof_height = b.latest_height()};
}

/// Timeout for `packet` proven against `b`'s last committed block.
inline ibc::channel::msg_timeout timeout_msg(
    const path_t& path,
    const ibc::channel::packet_t& packet,
    const ibc::channel::ordering order) {
  const auto& b = *path.b.chain;
  auto next_recv = uint64_t{0};
  auto proof_path = ibc::host::path::receipt(
      packet.destination_port, packet.destination_channel, packet.sequence);
  if (order == ibc::channel::ordering::ordered) {
    auto next = ibc::channel::get_next_sequence(
        b.store(), ibc::channel::sequence_kind::recv, packet.destination_port,
        packet.destination_channel);
    if (!next) {
      throw std::runtime_error{ibc::common::describe(next.error())};
    }
    next_recv = next.value();
    proof_path = ibc::host::path::next_sequence_recv(
        packet.destination_port, packet.destination_channel);
  }
  return ibc::channel::msg_timeout{.packet = packet,
                                   .next_sequence_recv = next_recv,
                                   .proof_unreceived = b.prove(proof_path),
                                   .proof_height = b.latest_height()};
}

/// Two chains joined by an open connection and an open channel, with a
/// mock module bound to the path's port on both sides.
struct linked_chains final {
  mock_clock clock;
  mock_chain a{"chain-a-1", clock};
  mock_chain b{"chain-b-1", clock};
  std::shared_ptr<mock_module> module_a = std::make_shared<mock_module>();
  std::shared_ptr<mock_module> module_b = std::make_shared<mock_module>();
  path_t path;

  explicit linked_chains(
      const ibc::channel::ordering order = ibc::channel::ordering::unordered,
      const ibc::schema::duration_nanoseconds_t delay = 0) {
    path = make_path(a, b);
    if (!a.modules().add_route(path.a.port_id, module_a) ||
        !b.modules().add_route(path.b.port_id, module_b)) {
      throw std::runtime_error{"cannot bind mock modules"};
    }
    open_connection(path, delay);
    open_channel(path, order);
  }
};

}  // namespace ibc::testing

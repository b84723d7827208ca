#include <ibc/channel/packet_handler.hpp>
#include <ibc/channel/store.hpp>
#include <ibc/channel/verify.hpp>
#include <ibc/client/status.hpp>
#include <ibc/client/store.hpp>
#include <ibc/host/path.hpp>
#include <ibc/host/store.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace ibc::channel {

namespace {

using ibc::common::error_code;
using ibc::common::make_error;
using ibc::connection::connection_end_t;

std::vector<ibc::core::event_attribute_t> packet_attributes(
    const packet_t& packet,
    const channel_end_t& channel) {
  auto connection_id = channel.connection_hops.empty()
                           ? std::string{}
                           : channel.connection_hops.front().value;
  return {
      {"packet_data_hex", ibc::schema::to_hex(packet.data)},
      {"packet_timeout_height", ibc::core::to_string(packet.timeout_height)},
      {"packet_timeout_timestamp",
       std::to_string(packet.timeout_timestamp.nanoseconds)},
      {"packet_sequence", std::to_string(packet.sequence)},
      {"packet_src_port", packet.source_port.value},
      {"packet_src_channel", packet.source_channel.value},
      {"packet_dst_port", packet.destination_port.value},
      {"packet_dst_channel", packet.destination_channel.value},
      {"packet_channel_ordering", std::string{to_string(channel.ordering)}},
      {"packet_connection", std::move(connection_id)}};
}

ibc::core::event_t packet_event(std::string type,
                                const packet_t& packet,
                                const channel_end_t& channel) {
  return ibc::core::event_t{.type = std::move(type),
                            .attributes = packet_attributes(packet, channel)};
}

ibc::common::status_t require_open(const channel_end_t& channel) {
  if (channel.state != channel_state::open) {
    return make_error(error_code::invalid_channel_state,
                      fmt::format("channel is {}, expected {}",
                                  to_string(channel.state),
                                  to_string(channel_state::open)));
  }
  return outcome::success();
}

// `port`/`channel` name the remote end of the packet, which must be the
// counterparty of the local channel.
ibc::common::status_t require_counterparty(
    const channel_end_t& channel,
    const ibc::host::port_id_t& port_id,
    const ibc::host::channel_id_t& channel_id) {
  if (channel.counterparty.port_id != port_id ||
      channel.counterparty.channel_id != channel_id) {
    return make_error(
        error_code::invalid_counterparty,
        fmt::format("packet counterparty {}/{} does not match the channel",
                    port_id.value, channel_id.value));
  }
  return outcome::success();
}

ibc::common::status_t require_commitment(const ibc::host::reader& store,
                                         const packet_t& packet) {
  auto stored = get_packet_commitment(store, packet.source_port,
                                      packet.source_channel, packet.sequence);
  if (!stored) {
    return stored.as_failure();
  }
  if (!stored.value()) {
    return make_error(
        error_code::packet_commitment_not_found,
        fmt::format("no commitment for packet {} on {}/{}", packet.sequence,
                    packet.source_port.value, packet.source_channel.value));
  }
  if (*stored.value() != ibc::schema::make_bytes(commit_packet(packet))) {
    return make_error(
        error_code::incorrect_packet_commitment,
        fmt::format("packet {} does not match its commitment",
                    packet.sequence));
  }
  return outcome::success();
}

ibc::common::status_t callback_status(const ibc::common::status_t& status) {
  if (!status) {
    return ibc::router::callback_error(status.error());
  }
  return outcome::success();
}

// Proofs that the packet was never received on the destination, shared by
// both timeout handlers.
ibc::common::status_t verify_unreceived(const ibc::host::reader& store,
                                        const channel_end_t& channel,
                                        const connection_end_t& connection,
                                        const packet_t& packet,
                                        const uint64_t next_sequence_recv,
                                        const ibc::core::height_t& proof_height,
                                        const ibc::schema::bytes_view_t& proof) {
  if (channel.ordering == ordering::ordered) {
    if (packet.sequence < next_sequence_recv) {
      return make_error(
          error_code::invalid_packet_sequence,
          fmt::format("packet {} was already received, next recv is {}",
                      packet.sequence, next_sequence_recv));
    }
    return verify_packet_membership(
        store, connection, proof_height, proof,
        ibc::host::path::next_sequence_recv(packet.destination_port,
                                            packet.destination_channel),
        ibc::host::encode_u64(next_sequence_recv));
  }
  return verify_packet_non_membership(
      store, connection, proof_height, proof,
      ibc::host::path::receipt(packet.destination_port,
                               packet.destination_channel, packet.sequence));
}

// Removes the commitment; an ordered channel cannot continue past a timed
// out packet and closes.
ibc::common::status_t resolve_timeout(ibc::host::writer& store,
                                      ibc::router::router& modules,
                                      const packet_t& packet,
                                      std::string event_type) {
  auto app = modules.route(packet.source_port);
  if (!app) {
    return app.as_failure();
  }
  BOOST_OUTCOME_TRYV(
      callback_status(app.value()->on_timeout_packet_execute(packet)));
  auto end = get_channel(store, packet.source_port, packet.source_channel);
  if (!end) {
    return end.as_failure();
  }
  auto& channel = end.value();
  delete_packet_commitment(store, packet.source_port, packet.source_channel,
                           packet.sequence);
  store.emit(packet_event(std::move(event_type), packet, channel));
  if (channel.ordering == ordering::ordered &&
      channel.state != channel_state::closed) {
    channel.state = channel_state::closed;
    set_channel(store, packet.source_port, packet.source_channel, channel);
    store.emit(ibc::core::event_t{
        .type = "channel_close",
        .attributes = {{"port_id", packet.source_port.value},
                       {"channel_id", packet.source_channel.value}}});
    spdlog::info("Channel {}/{} closed by timeout of packet {}",
                 packet.source_port.value, packet.source_channel.value,
                 packet.sequence);
  }
  spdlog::info("Packet {} on {}/{} timed out", packet.sequence,
               packet.source_port.value, packet.source_channel.value);
  return outcome::success();
}

}  // namespace

ibc::common::status_t validate_send_packet(const ibc::host::reader& store,
                                           const packet_t& packet) {
  BOOST_OUTCOME_TRYV(validate_basic(packet));
  auto end = get_channel(store, packet.source_port, packet.source_channel);
  if (!end) {
    return end.as_failure();
  }
  const auto& channel = end.value();
  if (channel.state == channel_state::closed) {
    return make_error(error_code::channel_closed,
                      fmt::format("channel {}/{} is closed",
                                  packet.source_port.value,
                                  packet.source_channel.value));
  }
  BOOST_OUTCOME_TRYV(require_open(channel));
  BOOST_OUTCOME_TRYV(require_counterparty(channel, packet.destination_port,
                                          packet.destination_channel));
  auto connection = hop_connection(store, channel);
  if (!connection) {
    return connection.as_failure();
  }
  const auto& client_id = connection.value().client_id;
  auto client = ibc::client::get_client_state(store, client_id);
  if (!client) {
    return client.as_failure();
  }
  BOOST_OUTCOME_TRYV(
      ibc::client::require_active(store, client_id, client.value()));
  if (!has_timeout(packet)) {
    return make_error(error_code::missing_timeout,
                      "packet must set a timeout height or timestamp");
  }

  const auto& latest = client.value().latest_height;
  if (timed_out_at_height(packet, latest)) {
    return make_error(
        error_code::packet_expired,
        fmt::format("timeout height {} is not above counterparty height {}",
                    ibc::core::to_string(packet.timeout_height),
                    ibc::core::to_string(latest)));
  }
  auto consensus = ibc::client::get_consensus_state(store, client_id, latest);
  if (!consensus) {
    return consensus.as_failure();
  }
  if (timed_out_at_timestamp(packet, consensus.value().timestamp)) {
    return make_error(
        error_code::packet_expired,
        fmt::format("timeout timestamp {} is not after counterparty time {}",
                    ibc::core::to_string(packet.timeout_timestamp),
                    ibc::core::to_string(consensus.value().timestamp)));
  }

  auto next = get_next_sequence(store, sequence_kind::send, packet.source_port,
                                packet.source_channel);
  if (!next) {
    return next.as_failure();
  }
  if (packet.sequence != next.value()) {
    return make_error(error_code::invalid_packet_sequence,
                      fmt::format("packet sequence {} but next send is {}",
                                  packet.sequence, next.value()));
  }
  return outcome::success();
}

ibc::common::status_t execute_send_packet(ibc::host::writer& store,
                                          const packet_t& packet) {
  auto end = get_channel(store, packet.source_port, packet.source_channel);
  if (!end) {
    return end.as_failure();
  }
  set_next_sequence(store, sequence_kind::send, packet.source_port,
                    packet.source_channel, packet.sequence + 1);
  set_packet_commitment(store, packet.source_port, packet.source_channel,
                        packet.sequence, commit_packet(packet));
  store.emit(packet_event("send_packet", packet, end.value()));
  spdlog::info("Sent packet {} on {}/{}", packet.sequence,
               packet.source_port.value, packet.source_channel.value);
  return outcome::success();
}

ibc::common::status_t validate_recv_packet(const ibc::host::reader& store,
                                           const ibc::router::router& modules,
                                           const msg_recv_packet& msg) {
  const auto& packet = msg.packet;
  BOOST_OUTCOME_TRYV(validate_basic(packet));
  auto end =
      get_channel(store, packet.destination_port, packet.destination_channel);
  if (!end) {
    return end.as_failure();
  }
  const auto& channel = end.value();
  BOOST_OUTCOME_TRYV(require_open(channel));
  BOOST_OUTCOME_TRYV(
      require_counterparty(channel, packet.source_port, packet.source_channel));
  auto connection = hop_connection(store, channel);
  if (!connection) {
    return connection.as_failure();
  }
  BOOST_OUTCOME_TRYV(require_open_connection(connection.value()));

  if (timed_out_at_height(packet, store.host_height())) {
    return make_error(
        error_code::packet_timeout_height_elapsed,
        fmt::format("host height {} reached timeout height {}",
                    ibc::core::to_string(store.host_height()),
                    ibc::core::to_string(packet.timeout_height)));
  }
  if (timed_out_at_timestamp(packet, store.host_timestamp())) {
    return make_error(
        error_code::packet_timeout_timestamp_elapsed,
        fmt::format("host time {} reached timeout timestamp {}",
                    ibc::core::to_string(store.host_timestamp()),
                    ibc::core::to_string(packet.timeout_timestamp)));
  }

  auto commitment = commit_packet(packet);
  BOOST_OUTCOME_TRYV(verify_packet_membership(
      store, connection.value(), msg.proof_height, msg.proof_commitment,
      ibc::host::path::commitment(packet.source_port, packet.source_channel,
                                  packet.sequence),
      commitment));

  if (channel.ordering == ordering::ordered) {
    auto next = get_next_sequence(store, sequence_kind::recv,
                                  packet.destination_port,
                                  packet.destination_channel);
    if (!next) {
      return next.as_failure();
    }
    if (packet.sequence != next.value()) {
      return make_error(error_code::invalid_packet_sequence,
                        fmt::format("packet sequence {} but next recv is {}",
                                    packet.sequence, next.value()));
    }
  } else {
    auto received =
        has_packet_receipt(store, packet.destination_port,
                           packet.destination_channel, packet.sequence);
    if (!received) {
      return received.as_failure();
    }
    if (received.value()) {
      return make_error(error_code::packet_already_received,
                        fmt::format("packet {} already has a receipt",
                                    packet.sequence));
    }
  }

  auto ack = get_ack_commitment(store, packet.destination_port,
                                packet.destination_channel, packet.sequence);
  if (!ack) {
    return ack.as_failure();
  }
  if (ack.value()) {
    return make_error(error_code::acknowledgement_exists,
                      fmt::format("packet {} is already acknowledged",
                                  packet.sequence));
  }
  auto app = modules.route(packet.destination_port);
  if (!app) {
    return app.as_failure();
  }
  return outcome::success();
}

ibc::common::status_t execute_recv_packet(ibc::host::writer& store,
                                          ibc::router::router& modules,
                                          const msg_recv_packet& msg) {
  const auto& packet = msg.packet;
  auto end =
      get_channel(store, packet.destination_port, packet.destination_channel);
  if (!end) {
    return end.as_failure();
  }
  const auto& channel = end.value();
  if (channel.ordering == ordering::ordered) {
    set_next_sequence(store, sequence_kind::recv, packet.destination_port,
                      packet.destination_channel, packet.sequence + 1);
  } else {
    set_packet_receipt(store, packet.destination_port,
                       packet.destination_channel, packet.sequence);
  }
  store.emit(packet_event("recv_packet", packet, channel));

  auto app = modules.route(packet.destination_port);
  if (!app) {
    return app.as_failure();
  }
  auto ack = app.value()->on_recv_packet_execute(packet);
  if (!ack) {
    return ibc::router::callback_error(ack.error());
  }
  if (!ack.value().empty()) {
    set_ack_commitment(store, packet.destination_port,
                       packet.destination_channel, packet.sequence,
                       commit_acknowledgement(ack.value()));
    auto event = packet_event("write_acknowledgement", packet, channel);
    event.attributes.push_back(
        {"packet_ack_hex", ibc::schema::to_hex(ack.value())});
    store.emit(std::move(event));
  }
  spdlog::info("Received packet {} on {}/{}", packet.sequence,
               packet.destination_port.value,
               packet.destination_channel.value);
  return outcome::success();
}

ibc::common::status_t validate_acknowledgement(
    const ibc::host::reader& store,
    const ibc::router::router& modules,
    const msg_acknowledgement& msg) {
  const auto& packet = msg.packet;
  BOOST_OUTCOME_TRYV(validate_basic(packet));
  if (msg.acknowledgement.empty()) {
    return make_error(error_code::invalid_acknowledgement,
                      "acknowledgement cannot be empty");
  }
  auto end = get_channel(store, packet.source_port, packet.source_channel);
  if (!end) {
    return end.as_failure();
  }
  const auto& channel = end.value();
  BOOST_OUTCOME_TRYV(require_open(channel));
  BOOST_OUTCOME_TRYV(require_counterparty(channel, packet.destination_port,
                                          packet.destination_channel));
  auto connection = hop_connection(store, channel);
  if (!connection) {
    return connection.as_failure();
  }
  BOOST_OUTCOME_TRYV(require_open_connection(connection.value()));
  BOOST_OUTCOME_TRYV(require_commitment(store, packet));

  if (channel.ordering == ordering::ordered) {
    auto next = get_next_sequence(store, sequence_kind::ack,
                                  packet.source_port, packet.source_channel);
    if (!next) {
      return next.as_failure();
    }
    if (packet.sequence != next.value()) {
      return make_error(error_code::invalid_packet_sequence,
                        fmt::format("packet sequence {} but next ack is {}",
                                    packet.sequence, next.value()));
    }
  }

  auto ack_commitment = commit_acknowledgement(msg.acknowledgement);
  BOOST_OUTCOME_TRYV(verify_packet_membership(
      store, connection.value(), msg.proof_height, msg.proof_acked,
      ibc::host::path::ack(packet.destination_port,
                           packet.destination_channel, packet.sequence),
      ack_commitment));

  auto app = modules.route(packet.source_port);
  if (!app) {
    return app.as_failure();
  }
  return callback_status(app.value()->on_acknowledgement_packet_validate(
      packet, msg.acknowledgement));
}

ibc::common::status_t execute_acknowledgement(
    ibc::host::writer& store,
    ibc::router::router& modules,
    const msg_acknowledgement& msg) {
  const auto& packet = msg.packet;
  auto app = modules.route(packet.source_port);
  if (!app) {
    return app.as_failure();
  }
  BOOST_OUTCOME_TRYV(
      callback_status(app.value()->on_acknowledgement_packet_execute(
          packet, msg.acknowledgement)));
  auto end = get_channel(store, packet.source_port, packet.source_channel);
  if (!end) {
    return end.as_failure();
  }
  const auto& channel = end.value();
  delete_packet_commitment(store, packet.source_port, packet.source_channel,
                           packet.sequence);
  if (channel.ordering == ordering::ordered) {
    set_next_sequence(store, sequence_kind::ack, packet.source_port,
                      packet.source_channel, packet.sequence + 1);
  }
  store.emit(packet_event("acknowledge_packet", packet, channel));
  spdlog::info("Acknowledged packet {} on {}/{}", packet.sequence,
               packet.source_port.value, packet.source_channel.value);
  return outcome::success();
}

ibc::common::status_t validate_timeout(const ibc::host::reader& store,
                                       const ibc::router::router& modules,
                                       const msg_timeout& msg) {
  const auto& packet = msg.packet;
  BOOST_OUTCOME_TRYV(validate_basic(packet));
  auto end = get_channel(store, packet.source_port, packet.source_channel);
  if (!end) {
    return end.as_failure();
  }
  const auto& channel = end.value();
  BOOST_OUTCOME_TRYV(require_open(channel));
  BOOST_OUTCOME_TRYV(require_counterparty(channel, packet.destination_port,
                                          packet.destination_channel));
  auto connection = hop_connection(store, channel);
  if (!connection) {
    return connection.as_failure();
  }
  BOOST_OUTCOME_TRYV(require_commitment(store, packet));

  auto consensus = ibc::client::get_consensus_state(
      store, connection.value().client_id, msg.proof_height);
  if (!consensus) {
    return consensus.as_failure();
  }
  if (!timed_out_at_height(packet, msg.proof_height) &&
      !timed_out_at_timestamp(packet, consensus.value().timestamp)) {
    return make_error(
        error_code::timeout_not_reached,
        fmt::format("packet {} has not timed out at counterparty height {}",
                    packet.sequence, ibc::core::to_string(msg.proof_height)));
  }

  BOOST_OUTCOME_TRYV(verify_unreceived(store, channel, connection.value(),
                                       packet, msg.next_sequence_recv,
                                       msg.proof_height,
                                       msg.proof_unreceived));
  auto app = modules.route(packet.source_port);
  if (!app) {
    return app.as_failure();
  }
  return callback_status(app.value()->on_timeout_packet_validate(packet));
}

ibc::common::status_t execute_timeout(ibc::host::writer& store,
                                      ibc::router::router& modules,
                                      const msg_timeout& msg) {
  return resolve_timeout(store, modules, msg.packet, "timeout_packet");
}

ibc::common::status_t validate_timeout_on_close(
    const ibc::host::reader& store,
    const ibc::router::router& modules,
    const msg_timeout_on_close& msg) {
  const auto& packet = msg.packet;
  BOOST_OUTCOME_TRYV(validate_basic(packet));
  auto end = get_channel(store, packet.source_port, packet.source_channel);
  if (!end) {
    return end.as_failure();
  }
  const auto& channel = end.value();
  BOOST_OUTCOME_TRYV(require_counterparty(channel, packet.destination_port,
                                          packet.destination_channel));
  auto connection = hop_connection(store, channel);
  if (!connection) {
    return connection.as_failure();
  }
  const auto& conn = connection.value();
  BOOST_OUTCOME_TRYV(require_commitment(store, packet));
  if (!conn.counterparty.connection_id) {
    return make_error(error_code::missing_counterparty_connection_id,
                      "connection has no counterparty connection id");
  }

  auto expected = channel_end_t{
      .state = channel_state::closed,
      .ordering = channel.ordering,
      .counterparty = counterparty_t{.port_id = packet.source_port,
                                     .channel_id = packet.source_channel},
      .connection_hops = {*conn.counterparty.connection_id},
      .version = channel.version};
  BOOST_OUTCOME_TRYV(verify_channel_state(
      store, conn, msg.proof_height, msg.proof_close, packet.destination_port,
      packet.destination_channel, expected));
  BOOST_OUTCOME_TRYV(verify_unreceived(store, channel, conn, packet,
                                       msg.next_sequence_recv,
                                       msg.proof_height,
                                       msg.proof_unreceived));
  auto app = modules.route(packet.source_port);
  if (!app) {
    return app.as_failure();
  }
  return callback_status(app.value()->on_timeout_packet_validate(packet));
}

ibc::common::status_t execute_timeout_on_close(
    ibc::host::writer& store,
    ibc::router::router& modules,
    const msg_timeout_on_close& msg) {
  return resolve_timeout(store, modules, msg.packet, "timeout_packet");
}

}  // namespace ibc::channel

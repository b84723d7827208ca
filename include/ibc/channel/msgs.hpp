#pragma once

#include <ibc/channel/channel_end.hpp>
#include <ibc/channel/packet.hpp>
#include <ibc/core/height.hpp>

#include <string>
#include <vector>

namespace ibc::channel {

struct msg_chan_open_init final {
  ibc::host::port_id_t port_id;
  std::vector<ibc::host::connection_id_t> connection_hops;
  ibc::host::port_id_t counterparty_port_id;
  ibc::channel::ordering ordering{ordering::none};
  std::string version;

  bool operator==(const msg_chan_open_init&) const = default;
};

struct msg_chan_open_try final {
  ibc::host::port_id_t port_id;
  std::vector<ibc::host::connection_id_t> connection_hops;
  ibc::host::port_id_t counterparty_port_id;
  ibc::host::channel_id_t counterparty_channel_id;
  ibc::channel::ordering ordering{ordering::none};
  std::string counterparty_version;
  ibc::schema::bytes_t proof_init;
  ibc::core::height_t proof_height;

  bool operator==(const msg_chan_open_try&) const = default;
};

struct msg_chan_open_ack final {
  ibc::host::port_id_t port_id;
  ibc::host::channel_id_t channel_id;
  ibc::host::channel_id_t counterparty_channel_id;
  std::string counterparty_version;
  ibc::schema::bytes_t proof_try;
  ibc::core::height_t proof_height;

  bool operator==(const msg_chan_open_ack&) const = default;
};

struct msg_chan_open_confirm final {
  ibc::host::port_id_t port_id;
  ibc::host::channel_id_t channel_id;
  ibc::schema::bytes_t proof_ack;
  ibc::core::height_t proof_height;

  bool operator==(const msg_chan_open_confirm&) const = default;
};

struct msg_chan_close_init final {
  ibc::host::port_id_t port_id;
  ibc::host::channel_id_t channel_id;

  bool operator==(const msg_chan_close_init&) const = default;
};

struct msg_chan_close_confirm final {
  ibc::host::port_id_t port_id;
  ibc::host::channel_id_t channel_id;
  ibc::schema::bytes_t proof_init;
  ibc::core::height_t proof_height;

  bool operator==(const msg_chan_close_confirm&) const = default;
};

/// `proof_commitment` proves the packet commitment on the source chain.
struct msg_recv_packet final {
  packet_t packet;
  ibc::schema::bytes_t proof_commitment;
  ibc::core::height_t proof_height;

  bool operator==(const msg_recv_packet&) const = default;
};

struct msg_acknowledgement final {
  packet_t packet;
  ibc::schema::bytes_t acknowledgement;
  ibc::schema::bytes_t proof_acked;
  ibc::core::height_t proof_height;

  bool operator==(const msg_acknowledgement&) const = default;
};

/// On ordered channels `proof_unreceived` proves `next_sequence_recv` on
/// the destination; on unordered channels it proves the receipt is absent.
struct msg_timeout final {
  packet_t packet;
  uint64_t next_sequence_recv{};
  ibc::schema::bytes_t proof_unreceived;
  ibc::core::height_t proof_height;

  bool operator==(const msg_timeout&) const = default;
};

struct msg_timeout_on_close final {
  packet_t packet;
  uint64_t next_sequence_recv{};
  ibc::schema::bytes_t proof_unreceived;
  ibc::schema::bytes_t proof_close;
  ibc::core::height_t proof_height;

  bool operator==(const msg_timeout_on_close&) const = default;
};

}  // namespace ibc::channel

#pragma once

#include <ibc/channel/channel_end.hpp>
#include <ibc/channel/packet.hpp>
#include <ibc/common/error.hpp>

#include <string>
#include <vector>

namespace ibc::router {

/// Channel being opened, as seen by the module bound to its port.
struct channel_open_t final {
  ibc::channel::ordering ordering{ibc::channel::ordering::none};
  std::vector<ibc::host::connection_id_t> connection_hops;
  ibc::host::port_id_t port_id;
  ibc::host::channel_id_t channel_id;
  ibc::channel::counterparty_t counterparty;
  std::string version;
};

/// Application bound to a port. Each `*_validate` callback runs in the
/// validate pass and must not mutate; each `*_execute` callback runs in the
/// execute pass and its failure discards the whole message.
class module {
 public:
  virtual ~module() = default;

  /// Returns the channel version to store. `channel.version` is the version
  /// proposed by the relayer and may be empty.
  virtual ibc::common::result_t<std::string> on_chan_open_init_validate(
      const channel_open_t& channel) const = 0;
  virtual ibc::common::result_t<std::string> on_chan_open_init_execute(
      const channel_open_t& channel) = 0;

  /// `channel.version` is the counterparty's version.
  virtual ibc::common::result_t<std::string> on_chan_open_try_validate(
      const channel_open_t& channel) const = 0;
  virtual ibc::common::result_t<std::string> on_chan_open_try_execute(
      const channel_open_t& channel) = 0;

  virtual ibc::common::status_t on_chan_open_ack_validate(
      const ibc::host::port_id_t&,
      const ibc::host::channel_id_t&,
      const std::string&) const {
    return outcome::success();
  }
  virtual ibc::common::status_t on_chan_open_ack_execute(
      const ibc::host::port_id_t&,
      const ibc::host::channel_id_t&,
      const std::string&) {
    return outcome::success();
  }

  virtual ibc::common::status_t on_chan_open_confirm_validate(
      const ibc::host::port_id_t&,
      const ibc::host::channel_id_t&) const {
    return outcome::success();
  }
  virtual ibc::common::status_t on_chan_open_confirm_execute(
      const ibc::host::port_id_t&,
      const ibc::host::channel_id_t&) {
    return outcome::success();
  }

  virtual ibc::common::status_t on_chan_close_init_validate(
      const ibc::host::port_id_t&,
      const ibc::host::channel_id_t&) const {
    return outcome::success();
  }
  virtual ibc::common::status_t on_chan_close_init_execute(
      const ibc::host::port_id_t&,
      const ibc::host::channel_id_t&) {
    return outcome::success();
  }

  virtual ibc::common::status_t on_chan_close_confirm_validate(
      const ibc::host::port_id_t&,
      const ibc::host::channel_id_t&) const {
    return outcome::success();
  }
  virtual ibc::common::status_t on_chan_close_confirm_execute(
      const ibc::host::port_id_t&,
      const ibc::host::channel_id_t&) {
    return outcome::success();
  }

  /// Acknowledgement bytes to commit. Empty means the module writes the
  /// acknowledgement later.
  virtual ibc::common::result_t<ibc::schema::bytes_t> on_recv_packet_execute(
      const ibc::channel::packet_t& packet) = 0;

  virtual ibc::common::status_t on_acknowledgement_packet_validate(
      const ibc::channel::packet_t&,
      const ibc::schema::bytes_view_t&) const {
    return outcome::success();
  }
  virtual ibc::common::status_t on_acknowledgement_packet_execute(
      const ibc::channel::packet_t&,
      const ibc::schema::bytes_view_t&) {
    return outcome::success();
  }

  virtual ibc::common::status_t on_timeout_packet_validate(
      const ibc::channel::packet_t&) const {
    return outcome::success();
  }
  virtual ibc::common::status_t on_timeout_packet_execute(
      const ibc::channel::packet_t&) {
    return outcome::success();
  }
};

}  // namespace ibc::router

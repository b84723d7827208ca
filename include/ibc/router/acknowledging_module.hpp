#pragma once

#include <ibc/router/module.hpp>

namespace ibc::router {

/// Module with no application state: accepts every channel, keeping the
/// proposed version or `default_version` when none is proposed, and
/// acknowledges every packet with a fixed success byte.
class acknowledging_module final : public module {
 public:
  explicit acknowledging_module(std::string default_version);

  ibc::common::result_t<std::string> on_chan_open_init_validate(
      const channel_open_t& channel) const override;
  ibc::common::result_t<std::string> on_chan_open_init_execute(
      const channel_open_t& channel) override;
  ibc::common::result_t<std::string> on_chan_open_try_validate(
      const channel_open_t& channel) const override;
  ibc::common::result_t<std::string> on_chan_open_try_execute(
      const channel_open_t& channel) override;
  ibc::common::result_t<ibc::schema::bytes_t> on_recv_packet_execute(
      const ibc::channel::packet_t& packet) override;

 private:
  std::string choose_version(const std::string& proposed) const;

  std::string default_version_;
};

}  // namespace ibc::router

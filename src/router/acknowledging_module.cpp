#include <ibc/router/acknowledging_module.hpp>
#include <spdlog/spdlog.h>

namespace ibc::router {

namespace {

inline constexpr auto kSuccessAck = uint8_t{0x01};

}  // namespace

acknowledging_module::acknowledging_module(std::string default_version)
    : default_version_{std::move(default_version)} {}

std::string acknowledging_module::choose_version(
    const std::string& proposed) const {
  return proposed.empty() ? default_version_ : proposed;
}

ibc::common::result_t<std::string>
acknowledging_module::on_chan_open_init_validate(
    const channel_open_t& channel) const {
  return choose_version(channel.version);
}

ibc::common::result_t<std::string>
acknowledging_module::on_chan_open_init_execute(const channel_open_t& channel) {
  return choose_version(channel.version);
}

ibc::common::result_t<std::string>
acknowledging_module::on_chan_open_try_validate(
    const channel_open_t& channel) const {
  return choose_version(channel.version);
}

ibc::common::result_t<std::string>
acknowledging_module::on_chan_open_try_execute(const channel_open_t& channel) {
  return choose_version(channel.version);
}

ibc::common::result_t<ibc::schema::bytes_t>
acknowledging_module::on_recv_packet_execute(
    const ibc::channel::packet_t& packet) {
  spdlog::debug("Acknowledging packet {} from {}/{}", packet.sequence,
                packet.source_port.value, packet.source_channel.value);
  return ibc::schema::bytes_t{kSuccessAck};
}

}  // namespace ibc::router

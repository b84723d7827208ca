#include <ibc/channel/verify.hpp>
#include <ibc/connection/store.hpp>
#include <ibc/connection/verify.hpp>
#include <ibc/host/path.hpp>
#include <ibc/schema/encoding/scale/encoder.hpp>
#include <spdlog/fmt/fmt.h>

namespace ibc::channel {

using ibc::common::error_code;
using ibc::common::make_error;

ibc::common::status_t validate_connection_hops(
    const std::vector<ibc::host::connection_id_t>& hops) {
  if (hops.size() != 1) {
    return make_error(
        error_code::invalid_connection_hops,
        fmt::format("expected a single connection hop, got {}", hops.size()));
  }
  return ibc::host::validate(hops.front());
}

ibc::common::result_t<ibc::connection::connection_end_t> hop_connection(
    const ibc::host::reader& store,
    const channel_end_t& end) {
  BOOST_OUTCOME_TRYV(validate_connection_hops(end.connection_hops));
  return ibc::connection::get_connection(store, end.connection_hops.front());
}

ibc::common::status_t require_open_connection(
    const ibc::connection::connection_end_t& connection) {
  if (connection.state != ibc::connection::connection_state::open) {
    return make_error(
        error_code::invalid_connection_state,
        fmt::format("connection is {}, expected {}",
                    ibc::connection::to_string(connection.state),
                    ibc::connection::to_string(
                        ibc::connection::connection_state::open)));
  }
  return outcome::success();
}

ibc::common::status_t verify_ordering_supported(
    const ibc::connection::connection_end_t& connection,
    const ordering order) {
  if (connection.versions.size() != 1) {
    return make_error(
        error_code::invalid_version,
        fmt::format("connection must carry a single version, has {}",
                    connection.versions.size()));
  }
  if (order == ordering::none ||
      !ibc::connection::verify_supported_feature(connection.versions.front(),
                                                 to_string(order))) {
    return make_error(
        error_code::ordering_not_supported,
        fmt::format("connection version {} does not support {}",
                    connection.versions.front().identifier, to_string(order)));
  }
  return outcome::success();
}

ibc::common::status_t verify_channel_state(
    const ibc::host::reader& store,
    const ibc::connection::connection_end_t& connection,
    const ibc::core::height_t& proof_height,
    const ibc::schema::bytes_view_t& proof,
    const ibc::host::port_id_t& port_id,
    const ibc::host::channel_id_t& channel_id,
    const channel_end_t& expected) {
  auto encoder = ibc::schema::encoding::scale_encoder_t{};
  return verify_packet_membership(
      store, connection, proof_height, proof,
      ibc::host::path::channel_end(port_id, channel_id),
      encoder.encode(expected));
}

ibc::common::status_t verify_packet_membership(
    const ibc::host::reader& store,
    const ibc::connection::connection_end_t& connection,
    const ibc::core::height_t& proof_height,
    const ibc::schema::bytes_view_t& proof,
    std::string path,
    const ibc::schema::bytes_view_t& value) {
  return ibc::connection::verify_membership(
      store, connection, proof_height, proof, std::move(path), value,
      error_code::channel_verification_failed, true);
}

ibc::common::status_t verify_packet_non_membership(
    const ibc::host::reader& store,
    const ibc::connection::connection_end_t& connection,
    const ibc::core::height_t& proof_height,
    const ibc::schema::bytes_view_t& proof,
    std::string path) {
  return ibc::connection::verify_non_membership(
      store, connection, proof_height, proof, std::move(path),
      error_code::channel_verification_failed, true);
}

}  // namespace ibc::channel

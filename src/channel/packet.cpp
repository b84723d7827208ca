#include <ibc/channel/packet.hpp>
#include <ibc/crypto/hash.hpp>

#include <boost/endian/buffers.hpp>

namespace ibc::channel {

namespace {

void append_be64(ibc::schema::bytes_t& out, const uint64_t value) {
  auto buffer = boost::endian::big_uint64_buf_t{value};
  const auto* begin = buffer.data();
  out.insert(out.end(), begin, begin + sizeof(buffer));
}

}  // namespace

ibc::common::status_t validate_basic(const packet_t& packet) {
  if (packet.sequence == 0) {
    return ibc::common::make_error(ibc::common::error_code::invalid_packet,
                                   "packet sequence cannot be 0");
  }
  if (packet.data.empty()) {
    return ibc::common::make_error(ibc::common::error_code::invalid_packet,
                                   "packet data cannot be empty");
  }
  BOOST_OUTCOME_TRYV(ibc::host::validate(packet.source_port));
  BOOST_OUTCOME_TRYV(ibc::host::validate(packet.source_channel));
  BOOST_OUTCOME_TRYV(ibc::host::validate(packet.destination_port));
  BOOST_OUTCOME_TRYV(ibc::host::validate(packet.destination_channel));
  return outcome::success();
}

bool has_timeout(const packet_t& packet) {
  return !ibc::core::is_zero(packet.timeout_height) ||
         ibc::core::is_set(packet.timeout_timestamp);
}

bool timed_out_at_height(const packet_t& packet,
                         const ibc::core::height_t& height) {
  return !ibc::core::is_zero(packet.timeout_height) &&
         height >= packet.timeout_height;
}

bool timed_out_at_timestamp(const packet_t& packet,
                            const ibc::core::timestamp_t& timestamp) {
  return ibc::core::is_set(packet.timeout_timestamp) &&
         timestamp >= packet.timeout_timestamp;
}

ibc::schema::hash32_t commit_packet(const packet_t& packet) {
  auto preimage = ibc::schema::bytes_t{};
  preimage.reserve(3 * sizeof(uint64_t) + 32);
  append_be64(preimage, packet.timeout_timestamp.nanoseconds);
  append_be64(preimage, packet.timeout_height.revision_number);
  append_be64(preimage, packet.timeout_height.revision_height);
  auto data_hash = ibc::crypto::sha256(packet.data);
  preimage.insert(preimage.end(), data_hash.begin(), data_hash.end());
  return ibc::crypto::sha256(preimage);
}

ibc::schema::hash32_t commit_acknowledgement(
    const ibc::schema::bytes_view_t& acknowledgement) {
  return ibc::crypto::sha256(acknowledgement);
}

}  // namespace ibc::channel

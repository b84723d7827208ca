#pragma once

#include <ibc/common/error.hpp>
#include <ibc/core/height.hpp>
#include <ibc/core/timestamp.hpp>
#include <ibc/host/identifiers.hpp>
#include <ibc/schema/primitives.hpp>

namespace ibc::channel {

struct packet_t final {
  uint64_t sequence{};
  ibc::host::port_id_t source_port;
  ibc::host::channel_id_t source_channel;
  ibc::host::port_id_t destination_port;
  ibc::host::channel_id_t destination_channel;
  ibc::schema::bytes_t data;
  ibc::core::height_t timeout_height;
  ibc::core::timestamp_t timeout_timestamp;

  bool operator==(const packet_t&) const = default;
};

/// Sequence, identifiers and data; does not look at timeouts.
ibc::common::status_t validate_basic(const packet_t& packet);

bool has_timeout(const packet_t& packet);

/// True once `height` reaches a set timeout height.
bool timed_out_at_height(const packet_t& packet,
                         const ibc::core::height_t& height);
/// True once `timestamp` reaches a set timeout timestamp.
bool timed_out_at_timestamp(const packet_t& packet,
                            const ibc::core::timestamp_t& timestamp);

/// sha256(be64(timeout timestamp) || be64(timeout revision number) ||
///        be64(timeout revision height) || sha256(data))
ibc::schema::hash32_t commit_packet(const packet_t& packet);

/// sha256(acknowledgement)
ibc::schema::hash32_t commit_acknowledgement(
    const ibc::schema::bytes_view_t& acknowledgement);

}  // namespace ibc::channel

#pragma once

#include <ibc/channel/channel_end.hpp>
#include <ibc/host/context.hpp>

#include <optional>

namespace ibc::channel {

ibc::common::result_t<channel_end_t> get_channel(
    const ibc::host::reader& store,
    const ibc::host::port_id_t& port_id,
    const ibc::host::channel_id_t& channel_id);
void set_channel(ibc::host::writer& store,
                 const ibc::host::port_id_t& port_id,
                 const ibc::host::channel_id_t& channel_id,
                 const channel_end_t& end);

enum class sequence_kind : uint8_t { send, recv, ack };

/// Next send/recv/ack sequence; unset is `missing_sequence`.
ibc::common::result_t<uint64_t> get_next_sequence(
    const ibc::host::reader& store,
    sequence_kind kind,
    const ibc::host::port_id_t& port_id,
    const ibc::host::channel_id_t& channel_id);
void set_next_sequence(ibc::host::writer& store,
                       sequence_kind kind,
                       const ibc::host::port_id_t& port_id,
                       const ibc::host::channel_id_t& channel_id,
                       uint64_t sequence);

ibc::common::result_t<std::optional<ibc::schema::bytes_t>>
get_packet_commitment(const ibc::host::reader& store,
                      const ibc::host::port_id_t& port_id,
                      const ibc::host::channel_id_t& channel_id,
                      uint64_t sequence);
void set_packet_commitment(ibc::host::writer& store,
                           const ibc::host::port_id_t& port_id,
                           const ibc::host::channel_id_t& channel_id,
                           uint64_t sequence,
                           const ibc::schema::hash32_t& commitment);
void delete_packet_commitment(ibc::host::writer& store,
                              const ibc::host::port_id_t& port_id,
                              const ibc::host::channel_id_t& channel_id,
                              uint64_t sequence);

ibc::common::result_t<bool> has_packet_receipt(
    const ibc::host::reader& store,
    const ibc::host::port_id_t& port_id,
    const ibc::host::channel_id_t& channel_id,
    uint64_t sequence);
void set_packet_receipt(ibc::host::writer& store,
                        const ibc::host::port_id_t& port_id,
                        const ibc::host::channel_id_t& channel_id,
                        uint64_t sequence);

ibc::common::result_t<std::optional<ibc::schema::bytes_t>>
get_ack_commitment(const ibc::host::reader& store,
                   const ibc::host::port_id_t& port_id,
                   const ibc::host::channel_id_t& channel_id,
                   uint64_t sequence);
void set_ack_commitment(ibc::host::writer& store,
                        const ibc::host::port_id_t& port_id,
                        const ibc::host::channel_id_t& channel_id,
                        uint64_t sequence,
                        const ibc::schema::hash32_t& commitment);

}  // namespace ibc::channel

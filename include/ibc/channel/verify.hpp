#pragma once

#include <ibc/channel/channel_end.hpp>
#include <ibc/connection/connection_end.hpp>
#include <ibc/host/context.hpp>

#include <string>

// Proofs about the counterparty's channel store. All of them enforce the
// connection's delay period and report commitment failures as
// `channel_verification_failed`.
namespace ibc::channel {

/// Exactly one hop; `invalid_connection_hops` otherwise.
ibc::common::status_t validate_connection_hops(
    const std::vector<ibc::host::connection_id_t>& hops);

/// The connection underlying `end`.
ibc::common::result_t<ibc::connection::connection_end_t> hop_connection(
    const ibc::host::reader& store,
    const channel_end_t& end);

ibc::common::status_t require_open_connection(
    const ibc::connection::connection_end_t& connection);

/// The single connection version must list `order` as a feature.
ibc::common::status_t verify_ordering_supported(
    const ibc::connection::connection_end_t& connection,
    ordering order);

ibc::common::status_t verify_channel_state(
    const ibc::host::reader& store,
    const ibc::connection::connection_end_t& connection,
    const ibc::core::height_t& proof_height,
    const ibc::schema::bytes_view_t& proof,
    const ibc::host::port_id_t& port_id,
    const ibc::host::channel_id_t& channel_id,
    const channel_end_t& expected);

ibc::common::status_t verify_packet_membership(
    const ibc::host::reader& store,
    const ibc::connection::connection_end_t& connection,
    const ibc::core::height_t& proof_height,
    const ibc::schema::bytes_view_t& proof,
    std::string path,
    const ibc::schema::bytes_view_t& value);

ibc::common::status_t verify_packet_non_membership(
    const ibc::host::reader& store,
    const ibc::connection::connection_end_t& connection,
    const ibc::core::height_t& proof_height,
    const ibc::schema::bytes_view_t& proof,
    std::string path);

}  // namespace ibc::channel

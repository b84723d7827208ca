#pragma once

#include <ibc/core/height.hpp>
#include <ibc/host/identifiers.hpp>

#include <cstdint>
#include <string>
#include <string_view>

// Provable store paths. Both chains derive the same strings, so a proof for
// a path on one chain can be checked by the other.
namespace ibc::host::path {

inline constexpr auto kNextClientSequence =
    std::string_view{"nextClientSequence"};
inline constexpr auto kNextConnectionSequence =
    std::string_view{"nextConnectionSequence"};
inline constexpr auto kNextChannelSequence =
    std::string_view{"nextChannelSequence"};

std::string client_state(const client_id_t& client_id);
std::string consensus_state(const client_id_t& client_id,
                            const ibc::core::height_t& height);
std::string consensus_heights(const client_id_t& client_id);
std::string client_update_time(const client_id_t& client_id,
                               const ibc::core::height_t& height);
std::string client_update_height(const client_id_t& client_id,
                                 const ibc::core::height_t& height);
std::string client_connections(const client_id_t& client_id);

std::string connection(const connection_id_t& connection_id);

std::string channel_end(const port_id_t& port_id, const channel_id_t& channel_id);
std::string next_sequence_send(const port_id_t& port_id,
                               const channel_id_t& channel_id);
std::string next_sequence_recv(const port_id_t& port_id,
                               const channel_id_t& channel_id);
std::string next_sequence_ack(const port_id_t& port_id,
                              const channel_id_t& channel_id);
std::string commitment(const port_id_t& port_id,
                       const channel_id_t& channel_id,
                       uint64_t sequence);
std::string receipt(const port_id_t& port_id,
                    const channel_id_t& channel_id,
                    uint64_t sequence);
std::string ack(const port_id_t& port_id,
                const channel_id_t& channel_id,
                uint64_t sequence);

/// `{upgrade_key}/{height}/upgradedClient`
std::string upgraded_client_state(std::string_view upgrade_key,
                                  uint64_t height);
/// `{upgrade_key}/{height}/upgradedConsState`
std::string upgraded_consensus_state(std::string_view upgrade_key,
                                     uint64_t height);

}  // namespace ibc::host::path

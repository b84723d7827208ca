#include <ibc/host/path.hpp>
#include <spdlog/fmt/fmt.h>

namespace ibc::host::path {

std::string client_state(const client_id_t& client_id) {
  return fmt::format("clients/{}/clientState", client_id.value);
}

std::string consensus_state(const client_id_t& client_id,
                            const ibc::core::height_t& height) {
  return fmt::format("clients/{}/consensusStates/{}-{}", client_id.value,
                     height.revision_number, height.revision_height);
}

std::string consensus_heights(const client_id_t& client_id) {
  return fmt::format("clients/{}/consensusHeights", client_id.value);
}

std::string client_update_time(const client_id_t& client_id,
                               const ibc::core::height_t& height) {
  return fmt::format("{}/processedTime", consensus_state(client_id, height));
}

std::string client_update_height(const client_id_t& client_id,
                                 const ibc::core::height_t& height) {
  return fmt::format("{}/processedHeight", consensus_state(client_id, height));
}

std::string client_connections(const client_id_t& client_id) {
  return fmt::format("clients/{}/connections", client_id.value);
}

std::string connection(const connection_id_t& connection_id) {
  return fmt::format("connections/{}", connection_id.value);
}

std::string channel_end(const port_id_t& port_id,
                        const channel_id_t& channel_id) {
  return fmt::format("channelEnds/ports/{}/channels/{}", port_id.value,
                     channel_id.value);
}

std::string next_sequence_send(const port_id_t& port_id,
                               const channel_id_t& channel_id) {
  return fmt::format("nextSequenceSend/ports/{}/channels/{}", port_id.value,
                     channel_id.value);
}

std::string next_sequence_recv(const port_id_t& port_id,
                               const channel_id_t& channel_id) {
  return fmt::format("nextSequenceRecv/ports/{}/channels/{}", port_id.value,
                     channel_id.value);
}

std::string next_sequence_ack(const port_id_t& port_id,
                              const channel_id_t& channel_id) {
  return fmt::format("nextSequenceAck/ports/{}/channels/{}", port_id.value,
                     channel_id.value);
}

std::string commitment(const port_id_t& port_id,
                       const channel_id_t& channel_id,
                       const uint64_t sequence) {
  return fmt::format("commitments/ports/{}/channels/{}/sequences/{}",
                     port_id.value, channel_id.value, sequence);
}

std::string receipt(const port_id_t& port_id,
                    const channel_id_t& channel_id,
                    const uint64_t sequence) {
  return fmt::format("receipts/ports/{}/channels/{}/sequences/{}",
                     port_id.value, channel_id.value, sequence);
}

std::string ack(const port_id_t& port_id,
                const channel_id_t& channel_id,
                const uint64_t sequence) {
  return fmt::format("acks/ports/{}/channels/{}/sequences/{}", port_id.value,
                     channel_id.value, sequence);
}

std::string upgraded_client_state(const std::string_view upgrade_key,
                                  const uint64_t height) {
  return fmt::format("{}/{}/upgradedClient", upgrade_key, height);
}

std::string upgraded_consensus_state(const std::string_view upgrade_key,
                                     const uint64_t height) {
  return fmt::format("{}/{}/upgradedConsState", upgrade_key, height);
}

}  // namespace ibc::host::path

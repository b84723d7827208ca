#pragma once

#include <ibc/client/consensus_state.hpp>
#include <ibc/connection/connection_end.hpp>
#include <ibc/core/height.hpp>
#include <ibc/host/context.hpp>

#include <string>
#include <vector>

namespace ibc::connection {

ibc::common::result_t<connection_end_t> get_connection(
    const ibc::host::reader& store,
    const ibc::host::connection_id_t& connection_id);
void set_connection(ibc::host::writer& store,
                    const ibc::host::connection_id_t& connection_id,
                    const connection_end_t& end);

ibc::common::result_t<std::vector<ibc::host::connection_id_t>>
client_connections(const ibc::host::reader& store,
                   const ibc::host::client_id_t& client_id);
ibc::common::status_t add_client_connection(
    ibc::host::writer& store,
    const ibc::host::client_id_t& client_id,
    const ibc::host::connection_id_t& connection_id);

/// Consensus state a counterparty holds for this chain at `height`, derived
/// from the committed host block.
ibc::common::result_t<ibc::client::consensus_state_t> self_consensus_state(
    const ibc::host::reader& store,
    const ibc::core::height_t& height);

/// Check the counterparty's client of this chain against host parameters.
ibc::common::status_t validate_self_client(
    const ibc::host::reader& store,
    const ibc::client::client_state_t& client_state);

}  // namespace ibc::connection

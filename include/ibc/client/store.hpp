#pragma once

#include <ibc/client/client_state.hpp>
#include <ibc/client/consensus_state.hpp>
#include <ibc/host/context.hpp>
#include <ibc/host/identifiers.hpp>

#include <optional>
#include <vector>

namespace ibc::client {

/// Host time and height at which a consensus state was stored.
struct update_metadata_t final {
  ibc::core::timestamp_t time;
  ibc::core::height_t height;

  bool operator==(const update_metadata_t&) const = default;
};

ibc::common::result_t<client_state_t> get_client_state(
    const ibc::host::reader& store,
    const ibc::host::client_id_t& client_id);
void set_client_state(ibc::host::writer& store,
                      const ibc::host::client_id_t& client_id,
                      const client_state_t& state);

ibc::common::result_t<std::optional<consensus_state_t>> find_consensus_state(
    const ibc::host::reader& store,
    const ibc::host::client_id_t& client_id,
    const ibc::core::height_t& height);

/// Like find_consensus_state but missing is `consensus_state_not_found`.
ibc::common::result_t<consensus_state_t> get_consensus_state(
    const ibc::host::reader& store,
    const ibc::host::client_id_t& client_id,
    const ibc::core::height_t& height);

/// Store a consensus state and index its height.
ibc::common::status_t set_consensus_state(
    ibc::host::writer& store,
    const ibc::host::client_id_t& client_id,
    const ibc::core::height_t& height,
    const consensus_state_t& state);

/// Remove a consensus state, its metadata and its index entry.
ibc::common::status_t delete_consensus_state(
    ibc::host::writer& store,
    const ibc::host::client_id_t& client_id,
    const ibc::core::height_t& height);

/// Stored consensus heights in ascending order.
ibc::common::result_t<std::vector<ibc::core::height_t>> consensus_heights(
    const ibc::host::reader& store,
    const ibc::host::client_id_t& client_id);

/// Greatest stored height strictly below `height`.
ibc::common::result_t<std::optional<ibc::core::height_t>> previous_height(
    const ibc::host::reader& store,
    const ibc::host::client_id_t& client_id,
    const ibc::core::height_t& height);

/// Smallest stored height strictly above `height`.
ibc::common::result_t<std::optional<ibc::core::height_t>> next_height(
    const ibc::host::reader& store,
    const ibc::host::client_id_t& client_id,
    const ibc::core::height_t& height);

/// Record the current host time and height against `height`.
void set_update_metadata(ibc::host::writer& store,
                         const ibc::host::client_id_t& client_id,
                         const ibc::core::height_t& height);

ibc::common::result_t<update_metadata_t> get_update_metadata(
    const ibc::host::reader& store,
    const ibc::host::client_id_t& client_id,
    const ibc::core::height_t& height);

}  // namespace ibc::client

#pragma once

#include <ibc/client/client_state.hpp>
#include <ibc/host/context.hpp>
#include <ibc/host/identifiers.hpp>

#include <string>

namespace ibc::client {

/// Prove `value` at `path` under the counterparty root stored for
/// `proof_height`. The client must be Active and know that height.
ibc::common::status_t verify_membership(
    const ibc::host::reader& store,
    const ibc::host::client_id_t& client_id,
    const client_state_t& state,
    const ibc::core::height_t& proof_height,
    const ibc::schema::bytes_view_t& prefix,
    const ibc::schema::bytes_view_t& proof,
    std::string path,
    const ibc::schema::bytes_view_t& value);

ibc::common::status_t verify_non_membership(
    const ibc::host::reader& store,
    const ibc::host::client_id_t& client_id,
    const client_state_t& state,
    const ibc::core::height_t& proof_height,
    const ibc::schema::bytes_view_t& prefix,
    const ibc::schema::bytes_view_t& proof,
    std::string path);

/// Re-tag commitment failures under `code`. Client, decoding and host
/// errors pass through unchanged.
ibc::common::error_t as_verification_error(ibc::common::error_code code,
                                           const ibc::common::error_t& error);

}  // namespace ibc::client

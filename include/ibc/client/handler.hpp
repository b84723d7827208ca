#pragma once

#include <ibc/client/msgs.hpp>
#include <ibc/client/verifier.hpp>
#include <ibc/host/context.hpp>

// Client message handlers. `validate_*` only reads; `execute_*` assumes its
// validate counterpart passed against the same state and applies the
// transition.
namespace ibc::client {

ibc::common::status_t validate_create_client(const ibc::host::reader& store,
                                             const msg_create_client& msg);
ibc::common::result_t<ibc::host::client_id_t> execute_create_client(
    ibc::host::writer& store,
    const msg_create_client& msg);

ibc::common::status_t validate_update_client(
    const ibc::host::reader& store,
    const msg_update_client& msg,
    const signature_verifier_t& verifier);
ibc::common::status_t execute_update_client(ibc::host::writer& store,
                                            const msg_update_client& msg);

ibc::common::status_t validate_submit_misbehaviour(
    const ibc::host::reader& store,
    const msg_submit_misbehaviour& msg,
    const signature_verifier_t& verifier);
ibc::common::status_t execute_submit_misbehaviour(
    ibc::host::writer& store,
    const msg_submit_misbehaviour& msg);

ibc::common::status_t validate_upgrade_client(const ibc::host::reader& store,
                                              const msg_upgrade_client& msg);
ibc::common::status_t execute_upgrade_client(ibc::host::writer& store,
                                             const msg_upgrade_client& msg);

ibc::common::status_t validate_recover_client(const ibc::host::reader& store,
                                              const msg_recover_client& msg);
ibc::common::status_t execute_recover_client(ibc::host::writer& store,
                                             const msg_recover_client& msg);

/// Client state after an upgrade: chain-chosen fields from `upgraded`,
/// client-chosen fields from `current`.
client_state_t apply_upgrade(const client_state_t& current,
                             const client_state_t& upgraded);

}  // namespace ibc::client

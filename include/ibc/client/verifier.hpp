#pragma once

#include <ibc/client/client_state.hpp>
#include <ibc/client/consensus_state.hpp>
#include <ibc/client/header.hpp>
#include <ibc/common/error.hpp>

#include <functional>

namespace ibc::client {

/// Host-supplied oracle: does `signature` over `message` verify under `key`.
using signature_verifier_t =
    std::function<bool(const ibc::schema::bytes_view_t& message,
                       const ibc::schema::public_key_t& key,
                       const ibc::schema::bytes_view_t& signature)>;

/// OpenSSL-backed Ed25519 / secp256k1 verification.
signature_verifier_t default_signature_verifier();

/// More than `level` of `set`'s voting power signed `signed_header`.
/// Signatures from validators outside the set are ignored.
ibc::common::status_t verify_commit(const std::string& chain_id,
                                    const validator_set_t& set,
                                    const signed_header_t& signed_header,
                                    const trust_level_t& level,
                                    const signature_verifier_t& verifier);

/// Light-client verification of `header` against the trusted consensus
/// state at `header.trusted_height`, at host time `now`.
ibc::common::status_t verify_header(const client_state_t& client_state,
                                    const consensus_state_t& trusted,
                                    const header_t& header,
                                    ibc::core::timestamp_t now,
                                    const signature_verifier_t& verifier);

}  // namespace ibc::client

#pragma once

#include <ibc/client/client_state.hpp>
#include <ibc/client/consensus_state.hpp>
#include <ibc/client/header.hpp>
#include <ibc/host/identifiers.hpp>

namespace ibc::client {

struct msg_create_client final {
  client_state_t client_state;
  consensus_state_t consensus_state;

  bool operator==(const msg_create_client&) const = default;
};

struct msg_update_client final {
  ibc::host::client_id_t client_id;
  header_t header;

  bool operator==(const msg_update_client&) const = default;
};

/// Upgraded states as committed by the counterparty in its upgrade store,
/// with merkle proofs against the client's latest consensus root.
struct msg_upgrade_client final {
  ibc::host::client_id_t client_id;
  client_state_t client_state;
  consensus_state_t consensus_state;
  ibc::schema::bytes_t proof_upgrade_client;
  ibc::schema::bytes_t proof_upgrade_consensus_state;

  bool operator==(const msg_upgrade_client&) const = default;
};

struct msg_submit_misbehaviour final {
  ibc::host::client_id_t client_id;
  misbehaviour_t misbehaviour;

  bool operator==(const msg_submit_misbehaviour&) const = default;
};

struct msg_recover_client final {
  ibc::host::client_id_t subject_client_id;
  ibc::host::client_id_t substitute_client_id;

  bool operator==(const msg_recover_client&) const = default;
};

}  // namespace ibc::client

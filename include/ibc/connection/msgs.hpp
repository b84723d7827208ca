#pragma once

#include <ibc/client/client_state.hpp>
#include <ibc/connection/connection_end.hpp>
#include <ibc/core/height.hpp>

#include <optional>
#include <vector>

namespace ibc::connection {

struct msg_conn_open_init final {
  ibc::host::client_id_t client_id;
  counterparty_t counterparty;
  std::optional<version_t> version;
  ibc::schema::duration_nanoseconds_t delay_period{};

  bool operator==(const msg_conn_open_init&) const = default;
};

/// `client_state` is the counterparty's client of this chain; the three
/// proofs are taken at `proof_height` on the counterparty.
struct msg_conn_open_try final {
  ibc::host::client_id_t client_id;
  ibc::client::client_state_t client_state;
  counterparty_t counterparty;
  ibc::schema::duration_nanoseconds_t delay_period{};
  std::vector<version_t> counterparty_versions;
  ibc::core::height_t proof_height;
  ibc::schema::bytes_t proof_init;
  ibc::schema::bytes_t proof_client;
  ibc::schema::bytes_t proof_consensus;
  ibc::core::height_t consensus_height;

  bool operator==(const msg_conn_open_try&) const = default;
};

struct msg_conn_open_ack final {
  ibc::host::connection_id_t connection_id;
  ibc::host::connection_id_t counterparty_connection_id;
  version_t version;
  ibc::client::client_state_t client_state;
  ibc::core::height_t proof_height;
  ibc::schema::bytes_t proof_try;
  ibc::schema::bytes_t proof_client;
  ibc::schema::bytes_t proof_consensus;
  ibc::core::height_t consensus_height;

  bool operator==(const msg_conn_open_ack&) const = default;
};

struct msg_conn_open_confirm final {
  ibc::host::connection_id_t connection_id;
  ibc::schema::bytes_t proof_ack;
  ibc::core::height_t proof_height;

  bool operator==(const msg_conn_open_confirm&) const = default;
};

}  // namespace ibc::connection

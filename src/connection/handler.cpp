#include <ibc/client/status.hpp>
#include <ibc/client/store.hpp>
#include <ibc/connection/handler.hpp>
#include <ibc/connection/store.hpp>
#include <ibc/connection/verify.hpp>
#include <ibc/host/path.hpp>
#include <ibc/host/store.hpp>
#include <ibc/schema/encoding/scale/encoder.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace ibc::connection {

namespace {

using ibc::common::error_code;
using ibc::common::make_error;

ibc::core::event_t connection_event(
    std::string type,
    const ibc::host::connection_id_t& connection_id,
    const connection_end_t& end) {
  auto counterparty_connection =
      end.counterparty.connection_id ? end.counterparty.connection_id->value
                                     : std::string{};
  return ibc::core::event_t{
      .type = std::move(type),
      .attributes = {{"connection_id", connection_id.value},
                     {"client_id", end.client_id.value},
                     {"counterparty_client_id",
                      end.counterparty.client_id.value},
                     {"counterparty_connection_id",
                      std::move(counterparty_connection)}}};
}

ibc::common::status_t require_state(const connection_end_t& end,
                                    const connection_state expected) {
  if (end.state != expected) {
    return make_error(error_code::invalid_connection_state,
                      fmt::format("connection is {}, expected {}",
                                  to_string(end.state), to_string(expected)));
  }
  return outcome::success();
}

ibc::common::status_t require_active_client(
    const ibc::host::reader& store,
    const ibc::host::client_id_t& client_id) {
  auto state = ibc::client::get_client_state(store, client_id);
  if (!state) {
    return state.as_failure();
  }
  return ibc::client::require_active(store, client_id, state.value());
}

ibc::common::status_t check_consensus_height(
    const ibc::host::reader& store,
    const ibc::core::height_t& consensus_height) {
  if (consensus_height > store.host_height()) {
    return make_error(
        error_code::invalid_consensus_height,
        fmt::format("consensus height {} is above host height {}",
                    ibc::core::to_string(consensus_height),
                    ibc::core::to_string(store.host_height())));
  }
  return outcome::success();
}

// Proves the counterparty's connection end, its client of this chain, and
// the consensus state of this chain that client holds.
ibc::common::status_t verify_handshake_proofs(
    const ibc::host::reader& store,
    const connection_end_t& local,
    const ibc::host::connection_id_t& counterparty_connection_id,
    const connection_end_t& expected,
    const ibc::client::client_state_t& self_client,
    const ibc::core::height_t& proof_height,
    const ibc::schema::bytes_view_t& proof_connection,
    const ibc::schema::bytes_view_t& proof_client,
    const ibc::schema::bytes_view_t& proof_consensus,
    const ibc::core::height_t& consensus_height) {
  auto encoder = ibc::schema::encoding::scale_encoder_t{};
  BOOST_OUTCOME_TRYV(verify_membership(
      store, local, proof_height, proof_connection,
      ibc::host::path::connection(counterparty_connection_id),
      encoder.encode(expected), error_code::connection_verification_failed,
      true));
  BOOST_OUTCOME_TRYV(verify_membership(
      store, local, proof_height, proof_client,
      ibc::host::path::client_state(local.counterparty.client_id),
      encoder.encode(self_client), error_code::connection_verification_failed,
      true));
  auto self_consensus = self_consensus_state(store, consensus_height);
  if (!self_consensus) {
    return self_consensus.as_failure();
  }
  return verify_membership(
      store, local, proof_height, proof_consensus,
      ibc::host::path::consensus_state(local.counterparty.client_id,
                                       consensus_height),
      encoder.encode(self_consensus.value()),
      error_code::connection_verification_failed, true);
}

ibc::common::result_t<ibc::host::connection_id_t> store_new_connection(
    ibc::host::writer& store,
    const connection_end_t& end) {
  auto sequence = ibc::host::allocate_sequence(
      store, ibc::host::path::kNextConnectionSequence);
  if (!sequence) {
    return sequence.as_failure();
  }
  auto connection_id = ibc::host::format_connection_id(sequence.value());
  set_connection(store, connection_id, end);
  BOOST_OUTCOME_TRYV(add_client_connection(store, end.client_id, connection_id));
  return connection_id;
}

}  // namespace

ibc::common::status_t validate_conn_open_init(const ibc::host::reader& store,
                                              const msg_conn_open_init& msg) {
  BOOST_OUTCOME_TRYV(ibc::host::validate(msg.counterparty.client_id));
  if (msg.counterparty.prefix.empty()) {
    return make_error(error_code::empty_prefix,
                      "counterparty prefix cannot be empty");
  }
  BOOST_OUTCOME_TRYV(require_active_client(store, msg.client_id));
  if (msg.version) {
    BOOST_OUTCOME_TRYV(
        verify_proposed_version(*msg.version, store.chain_info().versions));
  }
  return outcome::success();
}

ibc::common::result_t<ibc::host::connection_id_t> execute_conn_open_init(
    ibc::host::writer& store,
    const msg_conn_open_init& msg) {
  auto versions = msg.version ? std::vector<version_t>{*msg.version}
                              : store.chain_info().versions;
  auto end = connection_end_t{
      .state = connection_state::init,
      .client_id = msg.client_id,
      .counterparty = counterparty_t{.client_id = msg.counterparty.client_id,
                                     .connection_id = std::nullopt,
                                     .prefix = msg.counterparty.prefix},
      .versions = std::move(versions),
      .delay_period = msg.delay_period};
  auto connection_id = store_new_connection(store, end);
  if (!connection_id) {
    return connection_id.as_failure();
  }
  store.emit(connection_event("connection_open_init", connection_id.value(),
                              end));
  spdlog::info("Connection {} Init on client {}", connection_id.value().value,
               msg.client_id.value);
  return connection_id;
}

ibc::common::status_t validate_conn_open_try(const ibc::host::reader& store,
                                             const msg_conn_open_try& msg) {
  if (!msg.counterparty.connection_id) {
    return make_error(error_code::missing_counterparty_connection_id,
                      "counterparty connection id must be set");
  }
  if (msg.counterparty.prefix.empty()) {
    return make_error(error_code::empty_prefix,
                      "counterparty prefix cannot be empty");
  }
  BOOST_OUTCOME_TRYV(validate_self_client(store, msg.client_state));
  BOOST_OUTCOME_TRYV(check_consensus_height(store, msg.consensus_height));
  BOOST_OUTCOME_TRYV(require_active_client(store, msg.client_id));

  const auto& info = store.chain_info();
  auto local = connection_end_t{.state = connection_state::try_open,
                                .client_id = msg.client_id,
                                .counterparty = msg.counterparty,
                                .versions = {},
                                .delay_period = msg.delay_period};
  auto expected = connection_end_t{
      .state = connection_state::init,
      .client_id = msg.counterparty.client_id,
      .counterparty = counterparty_t{.client_id = msg.client_id,
                                     .connection_id = std::nullopt,
                                     .prefix = info.commitment_prefix},
      .versions = msg.counterparty_versions,
      .delay_period = msg.delay_period};
  BOOST_OUTCOME_TRYV(verify_handshake_proofs(
      store, local, *msg.counterparty.connection_id, expected,
      msg.client_state, msg.proof_height, msg.proof_init, msg.proof_client,
      msg.proof_consensus, msg.consensus_height));
  auto version = pick_version(info.versions, msg.counterparty_versions);
  if (!version) {
    return version.as_failure();
  }
  return outcome::success();
}

ibc::common::result_t<ibc::host::connection_id_t> execute_conn_open_try(
    ibc::host::writer& store,
    const msg_conn_open_try& msg) {
  auto version =
      pick_version(store.chain_info().versions, msg.counterparty_versions);
  if (!version) {
    return version.as_failure();
  }
  auto end = connection_end_t{.state = connection_state::try_open,
                              .client_id = msg.client_id,
                              .counterparty = msg.counterparty,
                              .versions = {version.value()},
                              .delay_period = msg.delay_period};
  auto connection_id = store_new_connection(store, end);
  if (!connection_id) {
    return connection_id.as_failure();
  }
  store.emit(
      connection_event("connection_open_try", connection_id.value(), end));
  spdlog::info("Connection {} TryOpen on client {}",
               connection_id.value().value, msg.client_id.value);
  return connection_id;
}

ibc::common::status_t validate_conn_open_ack(const ibc::host::reader& store,
                                             const msg_conn_open_ack& msg) {
  auto end = get_connection(store, msg.connection_id);
  if (!end) {
    return end.as_failure();
  }
  const auto& local = end.value();
  BOOST_OUTCOME_TRYV(require_state(local, connection_state::init));
  if (!is_supported_version(msg.version, local.versions)) {
    return make_error(error_code::version_not_supported,
                      fmt::format("version {} was not proposed",
                                  msg.version.identifier));
  }
  BOOST_OUTCOME_TRYV(validate_self_client(store, msg.client_state));
  BOOST_OUTCOME_TRYV(check_consensus_height(store, msg.consensus_height));
  BOOST_OUTCOME_TRYV(require_active_client(store, local.client_id));

  auto expected = connection_end_t{
      .state = connection_state::try_open,
      .client_id = local.counterparty.client_id,
      .counterparty =
          counterparty_t{.client_id = local.client_id,
                         .connection_id = msg.connection_id,
                         .prefix = store.chain_info().commitment_prefix},
      .versions = {msg.version},
      .delay_period = local.delay_period};
  return verify_handshake_proofs(
      store, local, msg.counterparty_connection_id, expected,
      msg.client_state, msg.proof_height, msg.proof_try, msg.proof_client,
      msg.proof_consensus, msg.consensus_height);
}

ibc::common::status_t execute_conn_open_ack(ibc::host::writer& store,
                                            const msg_conn_open_ack& msg) {
  auto end = get_connection(store, msg.connection_id);
  if (!end) {
    return end.as_failure();
  }
  auto& local = end.value();
  local.state = connection_state::open;
  local.counterparty.connection_id = msg.counterparty_connection_id;
  local.versions = {msg.version};
  set_connection(store, msg.connection_id, local);
  store.emit(connection_event("connection_open_ack", msg.connection_id, local));
  spdlog::info("Connection {} Open (ack)", msg.connection_id.value);
  return outcome::success();
}

ibc::common::status_t validate_conn_open_confirm(
    const ibc::host::reader& store,
    const msg_conn_open_confirm& msg) {
  auto end = get_connection(store, msg.connection_id);
  if (!end) {
    return end.as_failure();
  }
  const auto& local = end.value();
  BOOST_OUTCOME_TRYV(require_state(local, connection_state::try_open));
  if (!local.counterparty.connection_id) {
    return make_error(error_code::missing_counterparty_connection_id,
                      "TryOpen connection has no counterparty connection id");
  }
  auto expected = connection_end_t{
      .state = connection_state::open,
      .client_id = local.counterparty.client_id,
      .counterparty =
          counterparty_t{.client_id = local.client_id,
                         .connection_id = msg.connection_id,
                         .prefix = store.chain_info().commitment_prefix},
      .versions = local.versions,
      .delay_period = local.delay_period};
  auto encoder = ibc::schema::encoding::scale_encoder_t{};
  return verify_membership(
      store, local, msg.proof_height, msg.proof_ack,
      ibc::host::path::connection(*local.counterparty.connection_id),
      encoder.encode(expected), error_code::connection_verification_failed,
      true);
}

ibc::common::status_t execute_conn_open_confirm(
    ibc::host::writer& store,
    const msg_conn_open_confirm& msg) {
  auto end = get_connection(store, msg.connection_id);
  if (!end) {
    return end.as_failure();
  }
  auto& local = end.value();
  local.state = connection_state::open;
  set_connection(store, msg.connection_id, local);
  store.emit(
      connection_event("connection_open_confirm", msg.connection_id, local));
  spdlog::info("Connection {} Open (confirm)", msg.connection_id.value);
  return outcome::success();
}

}  // namespace ibc::connection

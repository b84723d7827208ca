#include <ibc/client/client_state.hpp>
#include <ibc/connection/store.hpp>
#include <ibc/host/path.hpp>
#include <ibc/host/store.hpp>
#include <spdlog/fmt/fmt.h>


namespace ibc::connection {

namespace {

using ibc::common::error_code;
using ibc::common::make_error;

ibc::common::error_t self_client_error(std::string log) {
  return make_error(error_code::invalid_self_client_state, std::move(log));
}

}  // namespace

ibc::common::result_t<connection_end_t> get_connection(
    const ibc::host::reader& store,
    const ibc::host::connection_id_t& connection_id) {
  auto end = ibc::host::get_entity<connection_end_t>(
      store, ibc::host::path::connection(connection_id), "connection end");
  if (!end) {
    return end.as_failure();
  }
  if (!end.value()) {
    return make_error(
        error_code::connection_not_found,
        fmt::format("connection {} does not exist", connection_id.value));
  }
  return std::move(*end.value());
}

void set_connection(ibc::host::writer& store,
                    const ibc::host::connection_id_t& connection_id,
                    const connection_end_t& end) {
  ibc::host::put_entity(store, ibc::host::path::connection(connection_id),
                        end);
}

ibc::common::result_t<std::vector<ibc::host::connection_id_t>>
client_connections(const ibc::host::reader& store,
                   const ibc::host::client_id_t& client_id) {
  auto ids = ibc::host::get_entity<std::vector<ibc::host::connection_id_t>>(
      store, ibc::host::path::client_connections(client_id),
      "client connections");
  if (!ids) {
    return ids.as_failure();
  }
  return ids.value().value_or(std::vector<ibc::host::connection_id_t>{});
}

ibc::common::status_t add_client_connection(
    ibc::host::writer& store,
    const ibc::host::client_id_t& client_id,
    const ibc::host::connection_id_t& connection_id) {
  auto ids = client_connections(store, client_id);
  if (!ids) {
    return ids.as_failure();
  }
  ids.value().push_back(connection_id);
  ibc::host::put_entity(store, ibc::host::path::client_connections(client_id),
                        ids.value());
  return outcome::success();
}

ibc::common::result_t<ibc::client::consensus_state_t> self_consensus_state(
    const ibc::host::reader& store,
    const ibc::core::height_t& height) {
  auto host = store.host_height();
  if (height.revision_number != host.revision_number) {
    return make_error(
        error_code::missing_host_consensus_state,
        fmt::format("height {} is not in host revision {}",
                    ibc::core::to_string(height), host.revision_number));
  }
  auto block = store.host_block(height.revision_height);
  if (!block) {
    return block.as_failure();
  }
  if (!block.value()) {
    return make_error(error_code::missing_host_consensus_state,
                      fmt::format("no committed host block at {}",
                                  ibc::core::to_string(height)));
  }
  return ibc::client::consensus_state_t{
      .root = block.value()->app_hash,
      .timestamp = block.value()->timestamp,
      .next_validators_hash = block.value()->next_validators_hash};
}

ibc::common::status_t validate_self_client(
    const ibc::host::reader& store,
    const ibc::client::client_state_t& client_state) {
  const auto& info = store.chain_info();
  if (ibc::client::is_frozen(client_state)) {
    return self_client_error("client of this chain is frozen");
  }
  if (client_state.chain_id != info.chain_id) {
    return self_client_error(fmt::format("chain id {} is not {}",
                                         client_state.chain_id,
                                         info.chain_id));
  }
  auto host = store.host_height();
  if (client_state.latest_height.revision_number != host.revision_number) {
    return self_client_error(
        fmt::format("client revision {} is not host revision {}",
                    client_state.latest_height.revision_number,
                    host.revision_number));
  }
  if (client_state.latest_height >= host) {
    return self_client_error(
        fmt::format("client height {} is not below host height {}",
                    ibc::core::to_string(client_state.latest_height),
                    ibc::core::to_string(host)));
  }
  if (client_state.proof_specs != info.proof_specs) {
    return self_client_error("proof specs differ from the host's");
  }
  auto trust = ibc::client::validate_trust_level(client_state.trust_level);
  if (!trust) {
    return ibc::common::wrap_error(error_code::invalid_self_client_state,
                                   trust.error());
  }
  if (client_state.unbonding_period != info.unbonding_period) {
    return self_client_error(
        fmt::format("unbonding period {}ns is not the host's {}ns",
                    client_state.unbonding_period, info.unbonding_period));
  }
  if (client_state.trusting_period >= client_state.unbonding_period) {
    return self_client_error("trusting period must be below unbonding period");
  }
  if (!client_state.upgrade_path.empty() &&
      client_state.upgrade_path != info.upgrade_path) {
    return self_client_error("upgrade path differs from the host's");
  }
  return outcome::success();
}

}  // namespace ibc::connection

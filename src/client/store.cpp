#include <ibc/client/store.hpp>
#include <ibc/host/path.hpp>
#include <ibc/host/store.hpp>
#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <iterator>

namespace ibc::client {

namespace {

using ibc::common::error_code;
using ibc::common::make_error;
using ibc::core::height_t;

void set_heights(ibc::host::writer& store,
                 const ibc::host::client_id_t& client_id,
                 const std::vector<height_t>& heights) {
  if (heights.empty()) {
    store.remove(ibc::host::path::consensus_heights(client_id));
    return;
  }
  ibc::host::put_entity(store, ibc::host::path::consensus_heights(client_id),
                        heights);
}

}  // namespace

ibc::common::result_t<client_state_t> get_client_state(
    const ibc::host::reader& store,
    const ibc::host::client_id_t& client_id) {
  auto state = ibc::host::get_entity<client_state_t>(
      store, ibc::host::path::client_state(client_id), "client state");
  if (!state) {
    return state.as_failure();
  }
  if (!state.value()) {
    return make_error(error_code::client_not_found,
                      fmt::format("client {} does not exist", client_id.value));
  }
  return std::move(*state.value());
}

void set_client_state(ibc::host::writer& store,
                      const ibc::host::client_id_t& client_id,
                      const client_state_t& state) {
  ibc::host::put_entity(store, ibc::host::path::client_state(client_id),
                        state);
}

ibc::common::result_t<std::optional<consensus_state_t>> find_consensus_state(
    const ibc::host::reader& store,
    const ibc::host::client_id_t& client_id,
    const height_t& height) {
  return ibc::host::get_entity<consensus_state_t>(
      store, ibc::host::path::consensus_state(client_id, height),
      "consensus state");
}

ibc::common::result_t<consensus_state_t> get_consensus_state(
    const ibc::host::reader& store,
    const ibc::host::client_id_t& client_id,
    const height_t& height) {
  auto state = find_consensus_state(store, client_id, height);
  if (!state) {
    return state.as_failure();
  }
  if (!state.value()) {
    return make_error(error_code::consensus_state_not_found,
                      fmt::format("client {} has no consensus state at {}",
                                  client_id.value,
                                  ibc::core::to_string(height)));
  }
  return std::move(*state.value());
}

ibc::common::status_t set_consensus_state(
    ibc::host::writer& store,
    const ibc::host::client_id_t& client_id,
    const height_t& height,
    const consensus_state_t& state) {
  auto heights = consensus_heights(store, client_id);
  if (!heights) {
    return heights.as_failure();
  }
  auto& sorted = heights.value();
  auto it = std::lower_bound(std::begin(sorted), std::end(sorted), height);
  if (it == std::end(sorted) || *it != height) {
    sorted.insert(it, height);
    set_heights(store, client_id, sorted);
  }
  ibc::host::put_entity(store,
                        ibc::host::path::consensus_state(client_id, height),
                        state);
  return outcome::success();
}

ibc::common::status_t delete_consensus_state(
    ibc::host::writer& store,
    const ibc::host::client_id_t& client_id,
    const height_t& height) {
  auto heights = consensus_heights(store, client_id);
  if (!heights) {
    return heights.as_failure();
  }
  auto& sorted = heights.value();
  sorted.erase(std::remove(std::begin(sorted), std::end(sorted), height),
               std::end(sorted));
  set_heights(store, client_id, sorted);
  store.remove(ibc::host::path::consensus_state(client_id, height));
  store.remove(ibc::host::path::client_update_time(client_id, height));
  store.remove(ibc::host::path::client_update_height(client_id, height));
  return outcome::success();
}

ibc::common::result_t<std::vector<height_t>> consensus_heights(
    const ibc::host::reader& store,
    const ibc::host::client_id_t& client_id) {
  auto heights = ibc::host::get_entity<std::vector<height_t>>(
      store, ibc::host::path::consensus_heights(client_id),
      "consensus heights");
  if (!heights) {
    return heights.as_failure();
  }
  return heights.value().value_or(std::vector<height_t>{});
}

ibc::common::result_t<std::optional<height_t>> previous_height(
    const ibc::host::reader& store,
    const ibc::host::client_id_t& client_id,
    const height_t& height) {
  auto heights = consensus_heights(store, client_id);
  if (!heights) {
    return heights.as_failure();
  }
  const auto& sorted = heights.value();
  auto it = std::lower_bound(std::begin(sorted), std::end(sorted), height);
  if (it == std::begin(sorted)) {
    return std::optional<height_t>{};
  }
  return std::optional<height_t>{*std::prev(it)};
}

ibc::common::result_t<std::optional<height_t>> next_height(
    const ibc::host::reader& store,
    const ibc::host::client_id_t& client_id,
    const height_t& height) {
  auto heights = consensus_heights(store, client_id);
  if (!heights) {
    return heights.as_failure();
  }
  const auto& sorted = heights.value();
  auto it = std::upper_bound(std::begin(sorted), std::end(sorted), height);
  if (it == std::end(sorted)) {
    return std::optional<height_t>{};
  }
  return std::optional<height_t>{*it};
}

void set_update_metadata(ibc::host::writer& store,
                         const ibc::host::client_id_t& client_id,
                         const height_t& height) {
  ibc::host::set_u64(store,
                     ibc::host::path::client_update_time(client_id, height),
                     store.host_timestamp().nanoseconds);
  ibc::host::put_entity(
      store, ibc::host::path::client_update_height(client_id, height),
      store.host_height());
}

ibc::common::result_t<update_metadata_t> get_update_metadata(
    const ibc::host::reader& store,
    const ibc::host::client_id_t& client_id,
    const height_t& height) {
  auto time = ibc::host::get_u64(
      store, ibc::host::path::client_update_time(client_id, height));
  if (!time) {
    return time.as_failure();
  }
  auto processed = ibc::host::get_entity<height_t>(
      store, ibc::host::path::client_update_height(client_id, height),
      "processed height");
  if (!processed) {
    return processed.as_failure();
  }
  if (!time.value() || !processed.value()) {
    return make_error(error_code::missing_update_metadata,
                      fmt::format("client {} has no update metadata at {}",
                                  client_id.value,
                                  ibc::core::to_string(height)));
  }
  return update_metadata_t{
      .time = ibc::core::timestamp_t{*time.value()},
      .height = *processed.value()};
}

}  // namespace ibc::client

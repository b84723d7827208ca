#include <ibc/client/status.hpp>
#include <ibc/client/store.hpp>
#include <spdlog/fmt/fmt.h>

namespace ibc::client {

bool is_expired(const client_state_t& state,
                const ibc::core::timestamp_t& consensus_time,
                const ibc::core::timestamp_t& now) {
  return now.nanoseconds > consensus_time.nanoseconds &&
         now.nanoseconds - consensus_time.nanoseconds > state.trusting_period;
}

ibc::common::result_t<client_status> status(
    const ibc::host::reader& store,
    const ibc::host::client_id_t& client_id,
    const client_state_t& state) {
  if (is_frozen(state)) {
    return client_status::frozen;
  }
  auto latest = find_consensus_state(store, client_id, state.latest_height);
  if (!latest) {
    return latest.as_failure();
  }
  if (!latest.value() ||
      is_expired(state, latest.value()->timestamp, store.host_timestamp())) {
    return client_status::expired;
  }
  return client_status::active;
}

ibc::common::status_t require_active(const ibc::host::reader& store,
                                     const ibc::host::client_id_t& client_id,
                                     const client_state_t& state) {
  auto current = status(store, client_id, state);
  if (!current) {
    return current.as_failure();
  }
  switch (current.value()) {
    case client_status::active:
      return outcome::success();
    case client_status::frozen:
      return ibc::common::make_error(
          ibc::common::error_code::client_frozen,
          fmt::format("client {} is frozen at {}", client_id.value,
                      ibc::core::to_string(*state.frozen_height)));
    case client_status::expired:
      break;
  }
  return ibc::common::make_error(
      ibc::common::error_code::client_expired,
      fmt::format("client {} is expired", client_id.value));
}

}  // namespace ibc::client

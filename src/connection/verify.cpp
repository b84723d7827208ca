#include <ibc/client/proof.hpp>
#include <ibc/client/status.hpp>
#include <ibc/client/store.hpp>
#include <ibc/connection/verify.hpp>
#include <spdlog/fmt/fmt.h>

namespace ibc::connection {

namespace {

using ibc::common::error_code;
using ibc::common::make_error;

uint64_t delay_blocks(const ibc::schema::duration_nanoseconds_t delay,
                      const ibc::schema::duration_nanoseconds_t block_time) {
  if (block_time == 0) {
    return 0;
  }
  return delay / block_time + (delay % block_time == 0 ? 0 : 1);
}

ibc::common::result_t<ibc::client::client_state_t> proof_client(
    const ibc::host::reader& store,
    const connection_end_t& end,
    const ibc::core::height_t& proof_height,
    const bool check_delay) {
  auto state = ibc::client::get_client_state(store, end.client_id);
  if (!state) {
    return state.as_failure();
  }
  BOOST_OUTCOME_TRYV(
      ibc::client::require_active(store, end.client_id, state.value()));
  if (check_delay) {
    BOOST_OUTCOME_TRYV(verify_delay_period_passed(store, end, proof_height));
  }
  return state;
}

}  // namespace

ibc::common::status_t verify_delay_period_passed(
    const ibc::host::reader& store,
    const connection_end_t& end,
    const ibc::core::height_t& proof_height) {
  auto metadata =
      ibc::client::get_update_metadata(store, end.client_id, proof_height);
  if (!metadata) {
    return metadata.as_failure();
  }
  auto now = store.host_timestamp();
  auto valid_time = ibc::core::add(metadata.value().time, end.delay_period);
  if (now < valid_time) {
    return make_error(
        error_code::not_enough_time_elapsed,
        fmt::format("host time {} is before {}", ibc::core::to_string(now),
                    ibc::core::to_string(valid_time)));
  }
  auto blocks = delay_blocks(end.delay_period,
                             store.chain_info().max_expected_time_per_block);
  auto valid_height = ibc::core::add(metadata.value().height, blocks);
  auto host = store.host_height();
  if (host < valid_height) {
    return make_error(
        error_code::not_enough_blocks_elapsed,
        fmt::format("host height {} is before {}", ibc::core::to_string(host),
                    ibc::core::to_string(valid_height)));
  }
  return outcome::success();
}

ibc::common::status_t verify_membership(
    const ibc::host::reader& store,
    const connection_end_t& end,
    const ibc::core::height_t& proof_height,
    const ibc::schema::bytes_view_t& proof,
    std::string path,
    const ibc::schema::bytes_view_t& value,
    const ibc::common::error_code failure_code,
    const bool check_delay) {
  auto state = proof_client(store, end, proof_height, check_delay);
  if (!state) {
    return state.as_failure();
  }
  auto verified = ibc::client::verify_membership(
      store, end.client_id, state.value(), proof_height,
      end.counterparty.prefix, proof, std::move(path), value);
  if (!verified) {
    return ibc::client::as_verification_error(failure_code, verified.error());
  }
  return outcome::success();
}

ibc::common::status_t verify_non_membership(
    const ibc::host::reader& store,
    const connection_end_t& end,
    const ibc::core::height_t& proof_height,
    const ibc::schema::bytes_view_t& proof,
    std::string path,
    const ibc::common::error_code failure_code,
    const bool check_delay) {
  auto state = proof_client(store, end, proof_height, check_delay);
  if (!state) {
    return state.as_failure();
  }
  auto verified = ibc::client::verify_non_membership(
      store, end.client_id, state.value(), proof_height,
      end.counterparty.prefix, proof, std::move(path));
  if (!verified) {
    return ibc::client::as_verification_error(failure_code, verified.error());
  }
  return outcome::success();
}

}  // namespace ibc::connection

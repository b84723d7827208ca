#pragma once

#include <ibc/connection/connection_end.hpp>
#include <ibc/core/height.hpp>
#include <ibc/host/context.hpp>

#include <string>

namespace ibc::connection {

/// Both delay constraints for a proof at `proof_height`: host time and host
/// height must have moved past the update metadata by the connection's
/// delay period (time) and its block equivalent (height).
ibc::common::status_t verify_delay_period_passed(
    const ibc::host::reader& store,
    const connection_end_t& end,
    const ibc::core::height_t& proof_height);

/// Prove `value` at `path` on the counterparty of `end`. Commitment
/// failures are reported as `failure_code`.
ibc::common::status_t verify_membership(
    const ibc::host::reader& store,
    const connection_end_t& end,
    const ibc::core::height_t& proof_height,
    const ibc::schema::bytes_view_t& proof,
    std::string path,
    const ibc::schema::bytes_view_t& value,
    ibc::common::error_code failure_code,
    bool check_delay);

ibc::common::status_t verify_non_membership(
    const ibc::host::reader& store,
    const connection_end_t& end,
    const ibc::core::height_t& proof_height,
    const ibc::schema::bytes_view_t& proof,
    std::string path,
    ibc::common::error_code failure_code,
    bool check_delay);

}  // namespace ibc::connection

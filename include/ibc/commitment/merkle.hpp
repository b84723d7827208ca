#pragma once

#include <ibc/commitment/ics23.hpp>
#include <ibc/common/error.hpp>

#include <string>
#include <vector>

namespace ibc::commitment {

/// Keys from the outermost store inwards, e.g. ["ibc", "clients/..."].
struct merkle_path_t final {
  std::vector<std::string> key_path;

  bool operator==(const merkle_path_t&) const = default;
};

/// One ICS23 proof per store layer, innermost first.
struct merkle_proof_t final {
  std::vector<ics23::commitment_proof_t> proofs;

  bool operator==(const merkle_proof_t&) const = default;
};

merkle_path_t apply_prefix(const ibc::schema::bytes_view_t& prefix,
                           std::string path);

ibc::common::status_t validate_proof_specs(
    const std::vector<ics23::proof_spec_t>& specs);

ibc::common::status_t verify_membership(
    const std::vector<ics23::proof_spec_t>& specs,
    const ibc::schema::bytes_view_t& root,
    const merkle_path_t& path,
    const ibc::schema::bytes_view_t& value,
    const merkle_proof_t& proof);

ibc::common::status_t verify_non_membership(
    const std::vector<ics23::proof_spec_t>& specs,
    const ibc::schema::bytes_view_t& root,
    const merkle_path_t& path,
    const merkle_proof_t& proof);

ibc::common::result_t<merkle_proof_t> decode_proof(
    const ibc::schema::bytes_view_t& bytes);

ibc::schema::bytes_t encode_proof(const merkle_proof_t& proof);

}  // namespace ibc::commitment

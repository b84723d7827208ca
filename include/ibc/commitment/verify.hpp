#pragma once

#include <ibc/commitment/ics23.hpp>
#include <ibc/common/error.hpp>

namespace ibc::commitment::ics23 {

/// Structural check of a proof spec: leaf prefix, child order permutation,
/// child size and depth bounds.
ibc::common::status_t validate_spec(const proof_spec_t& spec);

/// The leaf and every inner step of `proof` are shaped as `spec` allows.
ibc::common::status_t check_existence_spec(const existence_proof_t& proof,
                                           const proof_spec_t& spec);

ibc::common::status_t verify_existence(const existence_proof_t& proof,
                                       const proof_spec_t& spec,
                                       const ibc::schema::bytes_view_t& root,
                                       const ibc::schema::bytes_view_t& key,
                                       const ibc::schema::bytes_view_t& value);

ibc::common::status_t verify_non_existence(
    const non_existence_proof_t& proof,
    const proof_spec_t& spec,
    const ibc::schema::bytes_view_t& root,
    const ibc::schema::bytes_view_t& key);

/// Root implied by either proof form.
ibc::common::result_t<ibc::schema::bytes_t> calculate_root(
    const commitment_proof_t& proof);

ibc::common::status_t verify_membership(const commitment_proof_t& proof,
                                        const proof_spec_t& spec,
                                        const ibc::schema::bytes_view_t& root,
                                        const ibc::schema::bytes_view_t& key,
                                        const ibc::schema::bytes_view_t& value);

ibc::common::status_t verify_non_membership(
    const commitment_proof_t& proof,
    const proof_spec_t& spec,
    const ibc::schema::bytes_view_t& root,
    const ibc::schema::bytes_view_t& key);

bool is_left_most(const inner_spec_t& spec, const std::vector<inner_op_t>& path);
bool is_right_most(const inner_spec_t& spec,
                   const std::vector<inner_op_t>& path);
bool is_left_neighbor(const inner_spec_t& spec,
                      const std::vector<inner_op_t>& left,
                      const std::vector<inner_op_t>& right);

}  // namespace ibc::commitment::ics23

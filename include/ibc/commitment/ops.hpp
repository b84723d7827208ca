#pragma once

#include <ibc/commitment/ics23.hpp>
#include <ibc/common/error.hpp>

namespace ibc::commitment::ics23 {

ibc::common::result_t<ibc::schema::bytes_t> do_hash(
    hash_op op,
    const ibc::schema::bytes_view_t& preimage);

/// Length-prefix `data` as requested by `op`. The require_* variants only
/// check the size and pass the data through.
ibc::common::result_t<ibc::schema::bytes_t> do_length(
    length_op op,
    const ibc::schema::bytes_view_t& data);

ibc::common::result_t<ibc::schema::bytes_t> apply_leaf(
    const leaf_op_t& op,
    const ibc::schema::bytes_view_t& key,
    const ibc::schema::bytes_view_t& value);

ibc::common::result_t<ibc::schema::bytes_t> apply_inner(
    const inner_op_t& op,
    const ibc::schema::bytes_view_t& child);

/// Root implied by an existence proof: the leaf hash folded through `path`
/// from the leaf upwards.
ibc::common::result_t<ibc::schema::bytes_t> calculate_existence_root(
    const existence_proof_t& proof);

ibc::schema::bytes_t encode_varint(uint64_t value);

}  // namespace ibc::commitment::ics23

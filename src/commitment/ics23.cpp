#include <ibc/commitment/ics23.hpp>

namespace ibc::commitment::ics23 {

namespace {

leaf_op_t sha256_leaf() {
  return leaf_op_t{.hash = hash_op::sha256,
                   .prehash_key = hash_op::no_hash,
                   .prehash_value = hash_op::sha256,
                   .length = length_op::var_proto,
                   .prefix = {0x00}};
}

}  // namespace

proof_spec_t tendermint_spec() {
  return proof_spec_t{.leaf_spec = sha256_leaf(),
                      .inner_spec = inner_spec_t{.child_order = {0, 1},
                                                 .child_size = 32,
                                                 .min_prefix_length = 1,
                                                 .max_prefix_length = 1,
                                                 .empty_child = {},
                                                 .hash = hash_op::sha256}};
}

proof_spec_t iavl_spec() {
  return proof_spec_t{.leaf_spec = sha256_leaf(),
                      .inner_spec = inner_spec_t{.child_order = {0, 1},
                                                 .child_size = 33,
                                                 .min_prefix_length = 4,
                                                 .max_prefix_length = 12,
                                                 .empty_child = {},
                                                 .hash = hash_op::sha256}};
}

}  // namespace ibc::commitment::ics23

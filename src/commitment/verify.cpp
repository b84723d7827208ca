#include <ibc/commitment/ops.hpp>
#include <ibc/commitment/verify.hpp>
#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <span>

namespace ibc::commitment::ics23 {

namespace {

using ibc::common::error_code;
using ibc::common::make_error;
using ibc::common::result_t;
using ibc::common::status_t;
using ibc::schema::bytes_t;
using ibc::schema::bytes_view_t;

struct padding_t final {
  size_t min_prefix{};
  size_t max_prefix{};
  size_t suffix{};
};

bool equal(const bytes_view_t& lhs, const bytes_view_t& rhs) {
  return std::equal(std::begin(lhs), std::end(lhs), std::begin(rhs),
                    std::end(rhs));
}

bool has_prefix(const bytes_view_t& data, const bytes_view_t& prefix) {
  return data.size() >= prefix.size() &&
         std::equal(std::begin(prefix), std::end(prefix), std::begin(data));
}

int compare(const bytes_view_t& lhs, const bytes_view_t& rhs) {
  if (std::lexicographical_compare(std::begin(lhs), std::end(lhs),
                                   std::begin(rhs), std::end(rhs))) {
    return -1;
  }
  return equal(lhs, rhs) ? 0 : 1;
}

std::optional<size_t> position(const inner_spec_t& spec, const size_t branch) {
  for (auto i = size_t{0}; i < spec.child_order.size(); ++i) {
    if (spec.child_order[i] == static_cast<int32_t>(branch)) {
      return i;
    }
  }
  return std::nullopt;
}

std::optional<padding_t> get_padding(const inner_spec_t& spec,
                                     const size_t branch) {
  auto idx = position(spec, branch);
  if (!idx) {
    return std::nullopt;
  }
  auto child_size = static_cast<size_t>(spec.child_size);
  auto prefix = *idx * child_size;
  return padding_t{
      .min_prefix = prefix + static_cast<size_t>(spec.min_prefix_length),
      .max_prefix = prefix + static_cast<size_t>(spec.max_prefix_length),
      .suffix = (spec.child_order.size() - 1 - *idx) * child_size};
}

bool has_padding(const inner_op_t& op, const padding_t& padding) {
  return op.prefix.size() >= padding.min_prefix &&
         op.prefix.size() <= padding.max_prefix &&
         op.suffix.size() == padding.suffix;
}

std::optional<size_t> order_from_padding(const inner_spec_t& spec,
                                         const inner_op_t& op) {
  for (auto branch = size_t{0}; branch < spec.child_order.size(); ++branch) {
    auto padding = get_padding(spec, branch);
    if (padding && has_padding(op, *padding)) {
      return branch;
    }
  }
  return std::nullopt;
}

bool is_empty_child(const inner_spec_t& spec,
                    const bytes_t& data,
                    const size_t from) {
  auto child_size = static_cast<size_t>(spec.child_size);
  if (spec.empty_child.size() != child_size ||
      from + child_size > data.size()) {
    return false;
  }
  return equal(spec.empty_child,
               bytes_view_t{data.data() + from, child_size});
}

bool left_branches_are_empty(const inner_spec_t& spec, const inner_op_t& op) {
  auto idx = order_from_padding(spec, op);
  if (!idx || *idx == 0) {
    return false;
  }
  auto child_size = static_cast<size_t>(spec.child_size);
  if (op.prefix.size() < *idx * child_size) {
    return false;
  }
  auto actual_prefix = op.prefix.size() - *idx * child_size;
  for (auto i = size_t{0}; i < *idx; ++i) {
    auto pos = position(spec, i);
    if (!pos || !is_empty_child(spec, op.prefix,
                                actual_prefix + *pos * child_size)) {
      return false;
    }
  }
  return true;
}

bool right_branches_are_empty(const inner_spec_t& spec, const inner_op_t& op) {
  auto idx = order_from_padding(spec, op);
  if (!idx) {
    return false;
  }
  auto right_branches = spec.child_order.size() - 1 - *idx;
  if (right_branches == 0) {
    return false;
  }
  auto child_size = static_cast<size_t>(spec.child_size);
  if (op.suffix.size() != right_branches * child_size) {
    return false;
  }
  for (auto i = size_t{0}; i < right_branches; ++i) {
    auto pos = position(spec, i);
    if (!pos || !is_empty_child(spec, op.suffix, *pos * child_size)) {
      return false;
    }
  }
  return true;
}

status_t check_leaf(const leaf_op_t& leaf, const proof_spec_t& spec) {
  const auto& expected = spec.leaf_spec;
  if (leaf.hash != expected.hash) {
    return make_error(error_code::invalid_merkle_proof,
                      fmt::format("unexpected leaf hash op {}",
                                  static_cast<int>(leaf.hash)));
  }
  if (leaf.prehash_key != expected.prehash_key) {
    return make_error(error_code::invalid_merkle_proof,
                      "unexpected leaf prehash key op");
  }
  if (leaf.prehash_value != expected.prehash_value) {
    return make_error(error_code::invalid_merkle_proof,
                      "unexpected leaf prehash value op");
  }
  if (leaf.length != expected.length) {
    return make_error(error_code::invalid_merkle_proof,
                      "unexpected leaf length op");
  }
  if (!has_prefix(leaf.prefix, expected.prefix)) {
    return make_error(error_code::invalid_merkle_proof,
                      fmt::format("leaf prefix {} does not start with {}",
                                  ibc::schema::to_hex(leaf.prefix),
                                  ibc::schema::to_hex(expected.prefix)));
  }
  return outcome::success();
}

status_t check_inner(const inner_op_t& op,
                     const proof_spec_t& spec,
                     const size_t layer) {
  const auto& inner = spec.inner_spec;
  if (op.hash != inner.hash) {
    return make_error(error_code::invalid_merkle_proof,
                      fmt::format("unexpected inner hash op {} at layer {}",
                                  static_cast<int>(op.hash), layer));
  }
  if (!spec.leaf_spec.prefix.empty() &&
      has_prefix(op.prefix, spec.leaf_spec.prefix)) {
    return make_error(error_code::invalid_merkle_proof,
                      fmt::format("inner prefix starts with leaf prefix at "
                                  "layer {}",
                                  layer));
  }
  if (op.prefix.size() < static_cast<size_t>(inner.min_prefix_length)) {
    return make_error(error_code::invalid_merkle_proof,
                      fmt::format("inner prefix too short at layer {}", layer));
  }
  auto max_left_child_bytes =
      (inner.child_order.size() - 1) * static_cast<size_t>(inner.child_size);
  if (op.prefix.size() >
      static_cast<size_t>(inner.max_prefix_length) + max_left_child_bytes) {
    return make_error(error_code::invalid_merkle_proof,
                      fmt::format("inner prefix too long at layer {}", layer));
  }
  if (op.suffix.size() % static_cast<size_t>(inner.child_size) != 0) {
    return make_error(error_code::invalid_merkle_proof,
                      fmt::format("inner suffix length {} is not a multiple "
                                  "of child size at layer {}",
                                  op.suffix.size(), layer));
  }
  return outcome::success();
}

result_t<bytes_t> key_for_comparison(const proof_spec_t& spec,
                                     const bytes_view_t& key) {
  if (!spec.prehash_key_before_comparison) {
    return ibc::schema::make_bytes(key);
  }
  return do_hash(spec.leaf_spec.prehash_key, key);
}

status_t require_ordered(const proof_spec_t& spec,
                         const bytes_view_t& lower,
                         const bytes_view_t& upper) {
  auto lhs = key_for_comparison(spec, lower);
  if (!lhs) {
    return lhs.as_failure();
  }
  auto rhs = key_for_comparison(spec, upper);
  if (!rhs) {
    return rhs.as_failure();
  }
  if (compare(lhs.value(), rhs.value()) >= 0) {
    return make_error(error_code::non_membership_verification_failed,
                      "neighbour keys are not ordered around the key");
  }
  return outcome::success();
}

}  // namespace

status_t validate_spec(const proof_spec_t& spec) {
  const auto& inner = spec.inner_spec;
  if (inner.child_size <= 0) {
    return make_error(error_code::invalid_proof_spec,
                      "inner spec child size must be positive");
  }
  if (inner.child_order.size() < 2) {
    return make_error(error_code::invalid_proof_spec,
                      "inner spec needs at least two children");
  }
  auto sorted = inner.child_order;
  std::sort(std::begin(sorted), std::end(sorted));
  for (auto i = size_t{0}; i < sorted.size(); ++i) {
    if (sorted[i] != static_cast<int32_t>(i)) {
      return make_error(error_code::invalid_proof_spec,
                        "child order must be a permutation of 0..n-1");
    }
  }
  if (inner.min_prefix_length < 0 ||
      inner.max_prefix_length < inner.min_prefix_length) {
    return make_error(error_code::invalid_proof_spec,
                      fmt::format("invalid prefix bounds [{}, {}]",
                                  inner.min_prefix_length,
                                  inner.max_prefix_length));
  }
  if (spec.min_depth < 0 || spec.max_depth < 0 ||
      (spec.max_depth > 0 && spec.max_depth < spec.min_depth)) {
    return make_error(error_code::invalid_proof_spec,
                      fmt::format("invalid depth bounds [{}, {}]",
                                  spec.min_depth, spec.max_depth));
  }
  return outcome::success();
}

status_t check_existence_spec(const existence_proof_t& proof,
                              const proof_spec_t& spec) {
  BOOST_OUTCOME_TRYV(check_leaf(proof.leaf, spec));
  if (spec.min_depth > 0 &&
      proof.path.size() < static_cast<size_t>(spec.min_depth)) {
    return make_error(error_code::invalid_merkle_proof,
                      fmt::format("proof depth {} below minimum {}",
                                  proof.path.size(), spec.min_depth));
  }
  if (spec.max_depth > 0 &&
      proof.path.size() > static_cast<size_t>(spec.max_depth)) {
    return make_error(error_code::invalid_merkle_proof,
                      fmt::format("proof depth {} above maximum {}",
                                  proof.path.size(), spec.max_depth));
  }
  auto layer = size_t{1};
  for (const auto& step : proof.path) {
    BOOST_OUTCOME_TRYV(check_inner(step, spec, layer));
    ++layer;
  }
  return outcome::success();
}

status_t verify_existence(const existence_proof_t& proof,
                          const proof_spec_t& spec,
                          const bytes_view_t& root,
                          const bytes_view_t& key,
                          const bytes_view_t& value) {
  if (!equal(proof.key, key)) {
    return make_error(error_code::membership_verification_failed,
                      fmt::format("proof is for key {}, expected {}",
                                  ibc::schema::to_hex(proof.key),
                                  ibc::schema::to_hex(key)));
  }
  if (!equal(proof.value, value)) {
    return make_error(error_code::membership_verification_failed,
                      "proven value does not match");
  }
  BOOST_OUTCOME_TRYV(check_existence_spec(proof, spec));
  auto calculated = calculate_existence_root(proof);
  if (!calculated) {
    return calculated.as_failure();
  }
  if (!equal(calculated.value(), root)) {
    return make_error(error_code::membership_verification_failed,
                      fmt::format("calculated root {} does not match {}",
                                  ibc::schema::to_hex(calculated.value()),
                                  ibc::schema::to_hex(root)));
  }
  return outcome::success();
}

status_t verify_non_existence(const non_existence_proof_t& proof,
                              const proof_spec_t& spec,
                              const bytes_view_t& root,
                              const bytes_view_t& key) {
  if (!proof.left && !proof.right) {
    return make_error(error_code::non_membership_verification_failed,
                      "neither left nor right neighbour proven");
  }
  if (proof.left) {
    BOOST_OUTCOME_TRYV(verify_existence(*proof.left, spec, root,
                                        proof.left->key, proof.left->value));
    BOOST_OUTCOME_TRYV(require_ordered(spec, proof.left->key, key));
  }
  if (proof.right) {
    BOOST_OUTCOME_TRYV(verify_existence(*proof.right, spec, root,
                                        proof.right->key, proof.right->value));
    BOOST_OUTCOME_TRYV(require_ordered(spec, key, proof.right->key));
  }
  if (!proof.left) {
    if (!is_left_most(spec.inner_spec, proof.right->path)) {
      return make_error(error_code::non_membership_verification_failed,
                        "right neighbour is not the left-most leaf");
    }
  } else if (!proof.right) {
    if (!is_right_most(spec.inner_spec, proof.left->path)) {
      return make_error(error_code::non_membership_verification_failed,
                        "left neighbour is not the right-most leaf");
    }
  } else if (!is_left_neighbor(spec.inner_spec, proof.left->path,
                               proof.right->path)) {
    return make_error(error_code::non_membership_verification_failed,
                      "neighbours are not adjacent");
  }
  return outcome::success();
}

result_t<bytes_t> calculate_root(const commitment_proof_t& proof) {
  return std::visit(
      overloaded{
          [](const existence_proof_t& existence) -> result_t<bytes_t> {
            return calculate_existence_root(existence);
          },
          [](const non_existence_proof_t& absence) -> result_t<bytes_t> {
            if (absence.left) {
              return calculate_existence_root(*absence.left);
            }
            if (absence.right) {
              return calculate_existence_root(*absence.right);
            }
            return make_error(error_code::invalid_merkle_proof,
                              "non-existence proof has no neighbours");
          }},
      proof);
}

status_t verify_membership(const commitment_proof_t& proof,
                           const proof_spec_t& spec,
                           const bytes_view_t& root,
                           const bytes_view_t& key,
                           const bytes_view_t& value) {
  const auto* existence = std::get_if<existence_proof_t>(&proof);
  if (existence == nullptr) {
    return make_error(error_code::membership_verification_failed,
                      "expected an existence proof");
  }
  return verify_existence(*existence, spec, root, key, value);
}

status_t verify_non_membership(const commitment_proof_t& proof,
                               const proof_spec_t& spec,
                               const bytes_view_t& root,
                               const bytes_view_t& key) {
  const auto* absence = std::get_if<non_existence_proof_t>(&proof);
  if (absence == nullptr) {
    return make_error(error_code::non_membership_verification_failed,
                      "expected a non-existence proof");
  }
  if (!equal(absence->key, key)) {
    return make_error(error_code::non_membership_verification_failed,
                      "non-existence proof is for a different key");
  }
  return verify_non_existence(*absence, spec, root, key);
}

bool is_left_most(const inner_spec_t& spec,
                  const std::vector<inner_op_t>& path) {
  auto padding = get_padding(spec, 0);
  if (!padding) {
    return false;
  }
  return std::all_of(std::begin(path), std::end(path),
                     [&](const inner_op_t& step) {
                       return has_padding(step, *padding) ||
                              left_branches_are_empty(spec, step);
                     });
}

bool is_right_most(const inner_spec_t& spec,
                   const std::vector<inner_op_t>& path) {
  if (spec.child_order.empty()) {
    return false;
  }
  auto padding = get_padding(spec, spec.child_order.size() - 1);
  if (!padding) {
    return false;
  }
  return std::all_of(std::begin(path), std::end(path),
                     [&](const inner_op_t& step) {
                       return has_padding(step, *padding) ||
                              right_branches_are_empty(spec, step);
                     });
}

bool is_left_neighbor(const inner_spec_t& spec,
                      const std::vector<inner_op_t>& left,
                      const std::vector<inner_op_t>& right) {
  // Strip the shared path from the top down.
  auto left_top = left.size();
  auto right_top = right.size();
  while (left_top > 0 && right_top > 0 &&
         left[left_top - 1].prefix == right[right_top - 1].prefix &&
         left[left_top - 1].suffix == right[right_top - 1].suffix) {
    --left_top;
    --right_top;
  }
  if (left_top == 0 || right_top == 0) {
    return false;
  }
  auto left_branch = order_from_padding(spec, left[left_top - 1]);
  auto right_branch = order_from_padding(spec, right[right_top - 1]);
  if (!left_branch || !right_branch || *right_branch != *left_branch + 1) {
    return false;
  }
  auto left_below = std::vector<inner_op_t>(
      std::begin(left), std::begin(left) + static_cast<long>(left_top - 1));
  auto right_below = std::vector<inner_op_t>(
      std::begin(right), std::begin(right) + static_cast<long>(right_top - 1));
  return is_right_most(spec, left_below) && is_left_most(spec, right_below);
}

}  // namespace ibc::commitment::ics23

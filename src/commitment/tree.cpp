#include <ibc/commitment/ops.hpp>
#include <ibc/commitment/tree.hpp>
#include <ibc/crypto/hash.hpp>

#include <algorithm>
#include <bit>
#include <iterator>

namespace ibc::commitment {

namespace {

using ibc::schema::bytes_t;
using ibc::schema::bytes_view_t;

constexpr auto kLeafPrefix = uint8_t{0x00};
constexpr auto kInnerPrefix = uint8_t{0x01};

size_t split_point(const size_t n) {
  return std::bit_floor(n - 1);
}

void append(bytes_t& out, const bytes_view_t& data) {
  out.insert(std::end(out), std::begin(data), std::end(data));
}

ibc::schema::hash32_t slices_root(const std::vector<bytes_t>& items,
                                  const size_t begin,
                                  const size_t end) {
  const auto n = end - begin;
  if (n == 0) {
    return ibc::crypto::sha256(bytes_view_t{});
  }
  if (n == 1) {
    auto preimage = bytes_t{kLeafPrefix};
    append(preimage, items[begin]);
    return ibc::crypto::sha256(preimage);
  }
  const auto k = split_point(n);
  auto left = slices_root(items, begin, begin + k);
  auto right = slices_root(items, begin + k, end);
  auto preimage = bytes_t{kInnerPrefix};
  append(preimage, left);
  append(preimage, right);
  return ibc::crypto::sha256(preimage);
}

}  // namespace

ibc::schema::hash32_t hash_from_byte_slices(const std::vector<bytes_t>& items) {
  return slices_root(items, 0, items.size());
}

simple_tree::simple_tree(const entries_t& entries)
    : entries_{std::begin(entries), std::end(entries)} {
  leaves_.reserve(entries_.size());
  for (const auto& [key, value] : entries_) {
    leaves_.push_back(leaf_hash(key, value));
  }
  root_ = subtree_root(0, leaves_.size());
}

const bytes_t& simple_tree::root() const {
  return root_;
}

size_t simple_tree::size() const {
  return entries_.size();
}

bytes_t simple_tree::leaf_hash(const bytes_view_t& key,
                               const bytes_view_t& value) {
  auto value_hash = ibc::crypto::sha256(value);
  auto preimage = bytes_t{kLeafPrefix};
  append(preimage, ics23::encode_varint(key.size()));
  append(preimage, key);
  append(preimage, ics23::encode_varint(value_hash.size()));
  append(preimage, value_hash);
  return ibc::schema::make_bytes(ibc::crypto::sha256(preimage));
}

bytes_t simple_tree::inner_hash(const bytes_view_t& left,
                                const bytes_view_t& right) {
  auto preimage = bytes_t{kInnerPrefix};
  append(preimage, left);
  append(preimage, right);
  return ibc::schema::make_bytes(ibc::crypto::sha256(preimage));
}

bytes_t simple_tree::empty_hash() {
  return ibc::schema::make_bytes(ibc::crypto::sha256(bytes_view_t{}));
}

bytes_t simple_tree::subtree_root(const size_t begin, const size_t end) const {
  const auto n = end - begin;
  if (n == 0) {
    return empty_hash();
  }
  if (n == 1) {
    return leaves_[begin];
  }
  const auto k = split_point(n);
  return inner_hash(subtree_root(begin, begin + k), subtree_root(begin + k, end));
}

void simple_tree::collect_path(const size_t begin,
                               const size_t end,
                               const size_t index,
                               std::vector<ics23::inner_op_t>& path) const {
  const auto n = end - begin;
  if (n <= 1) {
    return;
  }
  const auto k = split_point(n);
  if (index < begin + k) {
    collect_path(begin, begin + k, index, path);
    path.push_back(ics23::inner_op_t{.hash = ics23::hash_op::sha256,
                                     .prefix = {kInnerPrefix},
                                     .suffix = subtree_root(begin + k, end)});
  } else {
    collect_path(begin + k, end, index, path);
    auto prefix = bytes_t{kInnerPrefix};
    append(prefix, subtree_root(begin, begin + k));
    path.push_back(ics23::inner_op_t{.hash = ics23::hash_op::sha256,
                                     .prefix = std::move(prefix),
                                     .suffix = {}});
  }
}

ics23::existence_proof_t simple_tree::existence_at(const size_t index) const {
  auto proof = ics23::existence_proof_t{
      .key = entries_[index].first,
      .value = entries_[index].second,
      .leaf = ics23::tendermint_spec().leaf_spec,
      .path = {}};
  collect_path(0, leaves_.size(), index, proof.path);
  return proof;
}

size_t simple_tree::lower_bound(const bytes_view_t& key) const {
  auto it = std::lower_bound(
      std::begin(entries_), std::end(entries_), key,
      [](const auto& entry, const bytes_view_t& k) {
        return std::lexicographical_compare(std::begin(entry.first),
                                            std::end(entry.first),
                                            std::begin(k), std::end(k));
      });
  return static_cast<size_t>(std::distance(std::begin(entries_), it));
}

std::optional<size_t> simple_tree::find(const bytes_view_t& key) const {
  auto index = lower_bound(key);
  if (index < entries_.size() &&
      std::equal(std::begin(entries_[index].first),
                 std::end(entries_[index].first), std::begin(key),
                 std::end(key))) {
    return index;
  }
  return std::nullopt;
}

std::optional<ics23::existence_proof_t> simple_tree::prove_existence(
    const bytes_view_t& key) const {
  auto index = find(key);
  if (!index) {
    return std::nullopt;
  }
  return existence_at(*index);
}

std::optional<ics23::non_existence_proof_t> simple_tree::prove_non_existence(
    const bytes_view_t& key) const {
  if (entries_.empty() || find(key)) {
    return std::nullopt;
  }
  auto index = lower_bound(key);
  auto proof = ics23::non_existence_proof_t{.key = ibc::schema::make_bytes(key)};
  if (index > 0) {
    proof.left = existence_at(index - 1);
  }
  if (index < entries_.size()) {
    proof.right = existence_at(index);
  }
  return proof;
}

std::optional<ics23::commitment_proof_t> simple_tree::prove(
    const bytes_view_t& key) const {
  if (auto existence = prove_existence(key)) {
    return ics23::commitment_proof_t{std::move(*existence)};
  }
  if (auto absence = prove_non_existence(key)) {
    return ics23::commitment_proof_t{std::move(*absence)};
  }
  return std::nullopt;
}

}  // namespace ibc::commitment

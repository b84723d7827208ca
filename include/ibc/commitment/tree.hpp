#pragma once

#include <ibc/commitment/ics23.hpp>

#include <map>
#include <optional>
#include <utility>
#include <vector>

namespace ibc::commitment {

/// Deterministic Merkle map over sorted keys, laid out as the CometBFT
/// simple tree. Proofs verify under `ics23::tendermint_spec()`.
class simple_tree final {
 public:
  using entries_t = std::map<ibc::schema::bytes_t, ibc::schema::bytes_t>;

  simple_tree() = default;
  explicit simple_tree(const entries_t& entries);

  const ibc::schema::bytes_t& root() const;
  size_t size() const;

  std::optional<ics23::existence_proof_t> prove_existence(
      const ibc::schema::bytes_view_t& key) const;

  /// Neighbours around an absent key. std::nullopt when the key exists or
  /// the tree is empty.
  std::optional<ics23::non_existence_proof_t> prove_non_existence(
      const ibc::schema::bytes_view_t& key) const;

  std::optional<ics23::commitment_proof_t> prove(
      const ibc::schema::bytes_view_t& key) const;

  static ibc::schema::bytes_t leaf_hash(const ibc::schema::bytes_view_t& key,
                                        const ibc::schema::bytes_view_t& value);
  static ibc::schema::bytes_t inner_hash(const ibc::schema::bytes_view_t& left,
                                         const ibc::schema::bytes_view_t& right);
  static ibc::schema::bytes_t empty_hash();

 private:
  ibc::schema::bytes_t subtree_root(size_t begin, size_t end) const;
  void collect_path(size_t begin,
                    size_t end,
                    size_t index,
                    std::vector<ics23::inner_op_t>& path) const;
  ics23::existence_proof_t existence_at(size_t index) const;
  std::optional<size_t> find(const ibc::schema::bytes_view_t& key) const;
  size_t lower_bound(const ibc::schema::bytes_view_t& key) const;

  std::vector<std::pair<ibc::schema::bytes_t, ibc::schema::bytes_t>> entries_;
  std::vector<ibc::schema::bytes_t> leaves_;
  ibc::schema::bytes_t root_{empty_hash()};
};

/// Root of the simple tree over an ordered list of items (CometBFT
/// `HashFromByteSlices`): leaves are sha256(0x00 || item).
ibc::schema::hash32_t hash_from_byte_slices(
    const std::vector<ibc::schema::bytes_t>& items);

}  // namespace ibc::commitment

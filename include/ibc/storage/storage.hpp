#pragma once
#include <ibc/common/error.hpp>
#include <ibc/schema/primitives.hpp>
#include <map>
#include <optional>
#include <string_view>
#include <vector>

namespace ibc::storage {

using key_value_entry_t =
    std::pair<ibc::schema::bytes_t, ibc::schema::bytes_t>;

/// Pending mutations keyed by raw key; std::nullopt deletes the key.
using write_set_t =
    std::map<ibc::schema::bytes_t, std::optional<ibc::schema::bytes_t>>;

/// Last committed block persisted by the storage backend.
struct committed_state final {
  uint64_t height{};
  ibc::schema::hash32_t state_root{};

  bool operator==(const committed_state&) const = default;
};

template <typename Library>
struct storage {
  /// Raw value at key, or std::nullopt when missing.
  ibc::common::result_t<std::optional<ibc::schema::bytes_t>> get(
      const ibc::schema::bytes_view_t& key) const;

  /// Return all key-value pairs that share the provided key prefix, in key
  /// order.
  ibc::common::result_t<std::vector<key_value_entry_t>> list_by_prefix(
      const ibc::schema::bytes_view_t& prefix) const;

  /// Apply every write in one atomic batch.
  ibc::common::status_t apply(const write_set_t& writes);

  /// Load the most recent committed checkpoint (height + state_root).
  ibc::common::result_t<std::optional<committed_state>> load_committed_state()
      const;

  /// Persist the most recent committed checkpoint (height + state_root).
  ibc::common::status_t save_committed_state(const committed_state& state);
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace ibc::storage

#pragma once
#include <ibc/storage/storage.hpp>
#include <algorithm>
#include <iterator>
#include <map>

namespace ibc::storage {

struct memory_storage_tag {};

/// Ordered in-memory backend. Used by tests and by hosts that keep no state
/// across restarts.
template <>
struct storage<memory_storage_tag> final {
  std::map<ibc::schema::bytes_t, ibc::schema::bytes_t> entries;
  std::optional<committed_state> committed;

  ibc::common::result_t<std::optional<ibc::schema::bytes_t>> get(
      const ibc::schema::bytes_view_t& key) const {
    auto it = entries.find(ibc::schema::make_bytes(key));
    if (it == std::end(entries)) {
      return std::optional<ibc::schema::bytes_t>{};
    }
    return std::optional<ibc::schema::bytes_t>{it->second};
  }

  ibc::common::result_t<std::vector<key_value_entry_t>> list_by_prefix(
      const ibc::schema::bytes_view_t& prefix) const {
    auto out = std::vector<key_value_entry_t>{};
    for (auto it = entries.lower_bound(ibc::schema::make_bytes(prefix));
         it != std::end(entries); ++it) {
      if (it->first.size() < prefix.size() ||
          !std::equal(std::begin(prefix), std::end(prefix),
                      std::begin(it->first))) {
        break;
      }
      out.emplace_back(it->first, it->second);
    }
    return out;
  }

  ibc::common::status_t apply(const write_set_t& writes) {
    for (const auto& [key, value] : writes) {
      if (value) {
        entries[key] = *value;
      } else {
        entries.erase(key);
      }
    }
    return outcome::success();
  }

  ibc::common::result_t<std::optional<committed_state>> load_committed_state()
      const {
    return committed;
  }

  ibc::common::status_t save_committed_state(const committed_state& state) {
    committed = state;
    return outcome::success();
  }
};

template <>
inline storage<memory_storage_tag> make_storage<memory_storage_tag>(
    const std::string_view&) {
  return storage<memory_storage_tag>{};
}

}  // namespace ibc::storage

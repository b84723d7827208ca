#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <ibc/storage/storage.hpp>
#include <memory>
#include <string_view>

namespace ibc::storage {

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  ibc::common::result_t<std::optional<ibc::schema::bytes_t>> get(
      const ibc::schema::bytes_view_t& key) const;
  ibc::common::result_t<std::vector<key_value_entry_t>> list_by_prefix(
      const ibc::schema::bytes_view_t& prefix) const;
  ibc::common::status_t apply(const write_set_t& writes);
  ibc::common::result_t<std::optional<committed_state>> load_committed_state()
      const;
  ibc::common::status_t save_committed_state(const committed_state& state);
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

}  // namespace ibc::storage

#include <ibc/common/critical.hpp>
#include <ibc/schema/encoding/scale/encoder.hpp>
#include <ibc/storage/rocksdb/storage.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <iterator>
#include <tuple>

namespace ibc::storage {

namespace {

using ibc::common::error_code;
using ibc::common::make_error;

inline constexpr auto kCommittedStateKey =
    std::string_view{"SYS|APP|COMMITTED_STATE"};

ROCKSDB_NAMESPACE::Slice make_slice(const ibc::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

ibc::schema::bytes_t to_bytes(const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

void require_open(const std::unique_ptr<ROCKSDB_NAMESPACE::DB>& database) {
  if (!database) {
    ibc::common::critical("RocksDB database is not initialized");
  }
}

}  // namespace

ibc::common::result_t<std::optional<ibc::schema::bytes_t>>
storage<rocksdb_storage_tag>::get(const ibc::schema::bytes_view_t& key) const {
  require_open(database);
  auto value = std::string{};
  auto status =
      database->Get(ROCKSDB_NAMESPACE::ReadOptions{}, make_slice(key), &value);
  if (status.IsNotFound()) {
    return std::optional<ibc::schema::bytes_t>{};
  }
  if (!status.ok()) {
    spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
    return make_error(error_code::storage_read_failed, status.ToString());
  }
  return std::optional<ibc::schema::bytes_t>{
      ibc::schema::bytes_t(std::begin(value), std::end(value))};
}

ibc::common::result_t<std::vector<key_value_entry_t>>
storage<rocksdb_storage_tag>::list_by_prefix(
    const ibc::schema::bytes_view_t& prefix) const {
  require_open(database);
  auto entries = std::vector<key_value_entry_t>{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  auto prefix_slice = make_slice(prefix);
  for (iterator->Seek(prefix_slice);
       iterator->Valid() && iterator->key().starts_with(prefix_slice);
       iterator->Next()) {
    entries.emplace_back(to_bytes(iterator->key()),
                         to_bytes(iterator->value()));
  }
  if (!iterator->status().ok()) {
    return make_error(error_code::storage_read_failed,
                      iterator->status().ToString());
  }
  return entries;
}

ibc::common::status_t storage<rocksdb_storage_tag>::apply(
    const write_set_t& writes) {
  require_open(database);
  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : writes) {
    auto status = value ? batch.Put(make_slice(key), make_slice(*value))
                        : batch.Delete(make_slice(key));
    if (!status.ok()) {
      return make_error(error_code::storage_write_failed, status.ToString());
    }
  }
  auto status = database->Write(ROCKSDB_NAMESPACE::WriteOptions{}, &batch);
  if (!status.ok()) {
    spdlog::error("Failed to write batch to RocksDB: {}", status.ToString());
    return make_error(error_code::storage_write_failed, status.ToString());
  }
  return outcome::success();
}

ibc::common::result_t<std::optional<committed_state>>
storage<rocksdb_storage_tag>::load_committed_state() const {
  auto raw = get(ibc::schema::make_bytes_view(kCommittedStateKey));
  if (!raw) {
    return raw.as_failure();
  }
  if (!raw.value()) {
    return std::optional<committed_state>{};
  }
  auto decoded = ibc::schema::encoding::decode_input<
      std::tuple<uint64_t, ibc::schema::hash32_t>>(*raw.value(),
                                                   "committed state");
  if (!decoded) {
    return make_error(error_code::storage_read_failed, decoded.error().log);
  }
  return std::optional<committed_state>{
      committed_state{.height = std::get<0>(decoded.value()),
                      .state_root = std::get<1>(decoded.value())}};
}

ibc::common::status_t storage<rocksdb_storage_tag>::save_committed_state(
    const committed_state& state) {
  auto encoder = ibc::schema::encoding::scale_encoder_t{};
  auto writes = write_set_t{};
  writes.emplace(ibc::schema::make_bytes(kCommittedStateKey),
                 encoder.encode(std::tuple{state.height, state.state_root}));
  return apply(writes);
}

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto store = storage<rocksdb_storage_tag>();

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    spdlog::error("Failed to open RocksDB at {}: {}", path, status.ToString());
    ibc::common::critical("Failed to open RocksDB");
  }
  spdlog::info("Successfully opened RocksDB at {}", path);
  store.database.reset(database);

  return store;
}

}  // namespace ibc::storage

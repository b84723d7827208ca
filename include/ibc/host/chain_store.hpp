#pragma once

#include <ibc/commitment/merkle.hpp>
#include <ibc/commitment/tree.hpp>
#include <ibc/common/critical.hpp>
#include <ibc/host/context.hpp>
#include <ibc/host/transaction.hpp>
#include <ibc/schema/encoding/scale/encoder.hpp>
#include <ibc/storage/storage.hpp>
#include <boost/endian/buffers.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <array>
#include <cstring>
#include <map>
#include <string>
#include <string_view>

namespace ibc::host {

inline constexpr auto kIbcStore = std::string_view{"ibc"};
inline constexpr auto kUpgradeStore = std::string_view{"upgrade"};
inline constexpr auto kStores = std::array{kIbcStore, kUpgradeStore};

namespace detail {

inline constexpr auto kHostBlockPrefix = std::string_view{"SYS|HOST|BLOCK|"};

inline ibc::schema::bytes_t store_key(const std::string_view store,
                                      const std::string_view path) {
  auto key = ibc::schema::make_bytes(store);
  key.push_back('/');
  key.insert(std::end(key), std::begin(path), std::end(path));
  return key;
}

inline ibc::schema::bytes_t host_block_key(const uint64_t height) {
  auto key = ibc::schema::make_bytes(kHostBlockPrefix);
  auto buffer = boost::endian::big_uint64_buf_t{height};
  key.insert(std::end(key), buffer.data(), buffer.data() + sizeof(buffer));
  return key;
}

}  // namespace detail

/// Host chain state over a storage backend: two provable substores ("ibc",
/// "upgrade") committed under one app hash, plus unprovable host records
/// under `SYS|` keys.
template <typename StorageTag>
class chain_store final : public reader {
 public:
  chain_store(ibc::storage::storage<StorageTag> storage, chain_info_t info)
      : storage_{std::move(storage)}, info_{std::move(info)} {
    auto committed = storage_.load_committed_state();
    if (!committed) {
      ibc::common::critical(ibc::common::describe(committed.error()));
    }
    if (committed.value()) {
      height_ = committed.value()->height;
      auto rebuilt = rebuild_trees();
      if (!rebuilt) {
        ibc::common::critical(ibc::common::describe(rebuilt.error()));
      }
      auto block = host_block(height_);
      if (!block) {
        ibc::common::critical(ibc::common::describe(block.error()));
      }
      if (block.value()) {
        timestamp_ = block.value()->timestamp;
        next_validators_hash_ = block.value()->next_validators_hash;
      }
      spdlog::info("Resuming chain {} at height {}", info_.chain_id, height_);
    }
  }

  ibc::common::result_t<std::optional<ibc::schema::bytes_t>> get(
      std::string_view path) const override {
    return get(kIbcStore, path);
  }

  ibc::common::result_t<std::optional<ibc::schema::bytes_t>> get(
      const std::string_view store,
      const std::string_view path) const {
    return storage_.get(detail::store_key(store, path));
  }

  ibc::core::height_t host_height() const override {
    return ibc::core::height_t{
        .revision_number = parse_chain_revision(info_.chain_id),
        .revision_height = height_};
  }

  ibc::core::timestamp_t host_timestamp() const override {
    return timestamp_;
  }

  const chain_info_t& chain_info() const override { return info_; }

  ibc::common::result_t<std::optional<host_block_t>> host_block(
      const uint64_t height) const override {
    auto raw = storage_.get(detail::host_block_key(height));
    if (!raw) {
      return raw.as_failure();
    }
    if (!raw.value()) {
      return std::optional<host_block_t>{};
    }
    auto decoded = ibc::schema::encoding::decode_input<host_block_t>(
        *raw.value(), "host block");
    if (!decoded) {
      return decoded.as_failure();
    }
    return std::optional<host_block_t>{std::move(decoded.value())};
  }

  /// Direct write into a substore, used by the host application for data it
  /// owns such as upgrade plans.
  ibc::common::status_t set(const std::string_view store,
                            const std::string_view path,
                            ibc::schema::bytes_t value) {
    auto writes = ibc::storage::write_set_t{};
    writes.emplace(detail::store_key(store, path), std::move(value));
    return storage_.apply(writes);
  }

  /// Atomically apply the writes buffered by a transaction to the ibc store.
  ibc::common::status_t apply(const transaction::changes_t& changes) {
    auto writes = ibc::storage::write_set_t{};
    for (const auto& [path, value] : changes) {
      writes.emplace(detail::store_key(kIbcStore, path), value);
    }
    return storage_.apply(writes);
  }

  void begin_block(const uint64_t height,
                   const ibc::core::timestamp_t timestamp,
                   const ibc::schema::hash32_t& next_validators_hash) {
    height_ = height;
    timestamp_ = timestamp;
    next_validators_hash_ = next_validators_hash;
  }

  /// Commit the current block: recompute every substore root, record the
  /// host block and the checkpoint, and return the app hash.
  ibc::common::result_t<ibc::schema::bytes_t> commit() {
    BOOST_OUTCOME_TRYV(rebuild_trees());
    auto block = host_block_t{.height = height_,
                              .timestamp = timestamp_,
                              .app_hash = outer_.root(),
                              .next_validators_hash = next_validators_hash_};
    auto encoder = ibc::schema::encoding::scale_encoder_t{};
    auto writes = ibc::storage::write_set_t{};
    writes.emplace(detail::host_block_key(height_), encoder.encode(block));
    BOOST_OUTCOME_TRYV(storage_.apply(writes));

    auto root = ibc::schema::try_make_hash32(outer_.root());
    if (!root) {
      ibc::common::critical("state root is not 32 bytes");
    }
    BOOST_OUTCOME_TRYV(storage_.save_committed_state(
        ibc::storage::committed_state{.height = height_, .state_root = *root}));
    spdlog::debug("Committed height {} app hash {}", height_,
                  ibc::schema::to_hex(outer_.root()));
    return outer_.root();
  }

  const ibc::schema::bytes_t& app_hash() const { return outer_.root(); }

  /// Existence or non-existence proof of `path` in `store` against the last
  /// committed app hash.
  ibc::common::result_t<ibc::commitment::merkle_proof_t> prove(
      const std::string_view store,
      const std::string_view path) const {
    auto it = trees_.find(std::string{store});
    if (it == std::end(trees_)) {
      return ibc::common::make_error(
          ibc::common::error_code::storage_read_failed,
          fmt::format("unknown store {}", store));
    }
    auto inner = it->second.prove(ibc::schema::make_bytes_view(path));
    if (!inner) {
      return ibc::common::make_error(
          ibc::common::error_code::storage_read_failed,
          fmt::format("store {} is empty, cannot prove {}", store, path));
    }
    auto outer = outer_.prove_existence(ibc::schema::make_bytes_view(store));
    if (!outer) {
      ibc::common::critical("committed store missing from app hash tree");
    }
    return ibc::commitment::merkle_proof_t{
        .proofs = {std::move(*inner),
                   ibc::commitment::ics23::commitment_proof_t{
                       std::move(*outer)}}};
  }

  ibc::storage::storage<StorageTag>& storage() { return storage_; }

 private:
  ibc::common::status_t rebuild_trees() {
    auto roots = ibc::commitment::simple_tree::entries_t{};
    for (const auto& store : kStores) {
      auto prefix = detail::store_key(store, "");
      auto listed = storage_.list_by_prefix(prefix);
      if (!listed) {
        return listed.as_failure();
      }
      auto entries = ibc::commitment::simple_tree::entries_t{};
      for (auto& [key, value] : listed.value()) {
        entries.emplace(
            ibc::schema::bytes_t(std::begin(key) +
                                     static_cast<long>(prefix.size()),
                                 std::end(key)),
            std::move(value));
      }
      auto tree = ibc::commitment::simple_tree{entries};
      roots.emplace(ibc::schema::make_bytes(store), tree.root());
      trees_.insert_or_assign(std::string{store}, std::move(tree));
    }
    outer_ = ibc::commitment::simple_tree{roots};
    return outcome::success();
  }

  ibc::storage::storage<StorageTag> storage_;
  chain_info_t info_;
  uint64_t height_{};
  ibc::core::timestamp_t timestamp_;
  ibc::schema::hash32_t next_validators_hash_{};
  std::map<std::string, ibc::commitment::simple_tree> trees_;
  ibc::commitment::simple_tree outer_;
};

}  // namespace ibc::host

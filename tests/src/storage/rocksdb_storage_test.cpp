#include <ibc/host/chain_store.hpp>
#include <ibc/storage/rocksdb/storage.hpp>
#include <ibc/storage/storage.hpp>
#include <ibc/testing/common.hpp>
#include <gtest/gtest.h>

#include <optional>
#include <string>

namespace {

using storage_tag = ibc::storage::rocksdb_storage_tag;

}  // namespace

TEST(rocksdb_storage, committed_state_round_trips) {
  auto db = ibc::testing::make_db_path("ibc_storage_committed");
  {
    auto storage = ibc::storage::make_storage<storage_tag>(db);
    auto empty = storage.load_committed_state();
    ASSERT_TRUE(empty);
    EXPECT_FALSE(empty.value().has_value());

    auto state = ibc::storage::committed_state{
        .height = 42, .state_root = ibc::testing::make_hash(10)};
    ASSERT_TRUE(storage.save_committed_state(state));
    auto loaded = storage.load_committed_state();
    ASSERT_TRUE(loaded);
    ASSERT_TRUE(loaded.value().has_value());
    EXPECT_EQ(*loaded.value(), state);
  }
  ibc::testing::remove_path(db);
}

TEST(rocksdb_storage, batches_apply_puts_and_deletes_in_key_order) {
  auto db = ibc::testing::make_db_path("ibc_storage_batch");
  {
    auto storage = ibc::storage::make_storage<storage_tag>(db);
    auto writes = ibc::storage::write_set_t{};
    writes.emplace(ibc::testing::make_bytes("ibc/b"),
                   ibc::testing::make_bytes("2"));
    writes.emplace(ibc::testing::make_bytes("ibc/a"),
                   ibc::testing::make_bytes("1"));
    writes.emplace(ibc::testing::make_bytes("upgrade/c"),
                   ibc::testing::make_bytes("3"));
    ASSERT_TRUE(storage.apply(writes));

    auto listed = storage.list_by_prefix(ibc::testing::make_bytes("ibc/"));
    ASSERT_TRUE(listed);
    ASSERT_EQ(listed.value().size(), 2u);
    EXPECT_EQ(listed.value()[0].first, ibc::testing::make_bytes("ibc/a"));
    EXPECT_EQ(listed.value()[1].second, ibc::testing::make_bytes("2"));

    auto removal = ibc::storage::write_set_t{};
    removal.emplace(ibc::testing::make_bytes("ibc/a"), std::nullopt);
    ASSERT_TRUE(storage.apply(removal));
    auto gone = storage.get(ibc::testing::make_bytes("ibc/a"));
    ASSERT_TRUE(gone);
    EXPECT_FALSE(gone.value().has_value());
  }
  ibc::testing::remove_path(db);
}

TEST(rocksdb_storage, chain_store_resumes_with_same_app_hash) {
  auto db = ibc::testing::make_db_path("ibc_storage_resume");
  auto root = ibc::schema::bytes_t{};
  {
    auto chain = ibc::host::chain_store<storage_tag>{
        ibc::storage::make_storage<storage_tag>(db),
        ibc::host::make_chain_info("resume-1")};
    chain.begin_block(1, ibc::core::from_seconds(100),
                      ibc::testing::make_hash(3));
    auto tx = ibc::host::transaction{chain};
    tx.set("connections/connection-0", ibc::testing::make_bytes("end"));
    ASSERT_TRUE(chain.apply(tx.changes()));
    auto committed = chain.commit();
    ASSERT_TRUE(committed);
    root = committed.value();
  }
  {
    auto chain = ibc::host::chain_store<storage_tag>{
        ibc::storage::make_storage<storage_tag>(db),
        ibc::host::make_chain_info("resume-1")};
    EXPECT_EQ(chain.host_height().revision_height, 1u);
    EXPECT_EQ(chain.host_timestamp(), ibc::core::from_seconds(100));
    EXPECT_EQ(chain.app_hash(), root);
    auto proof = chain.prove(ibc::host::kIbcStore, "connections/connection-0");
    EXPECT_TRUE(proof);
  }
  ibc::testing::remove_path(db);
}

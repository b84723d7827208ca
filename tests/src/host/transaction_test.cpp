#include <ibc/host/chain_store.hpp>
#include <ibc/host/store.hpp>
#include <ibc/host/transaction.hpp>
#include <ibc/storage/memory/storage.hpp>
#include <ibc/testing/common.hpp>
#include <gtest/gtest.h>

namespace {

using chain_t = ibc::host::chain_store<ibc::storage::memory_storage_tag>;

chain_t make_chain() {
  return chain_t{ibc::storage::make_storage<ibc::storage::memory_storage_tag>(""),
                 ibc::host::make_chain_info("testchain-1")};
}

}  // namespace

TEST(transaction, reads_see_own_writes_but_not_the_base) {
  auto chain = make_chain();
  chain.begin_block(1, ibc::core::from_seconds(10), {});
  auto tx = ibc::host::transaction{chain};
  tx.set("a", ibc::testing::make_bytes("1"));

  auto read = tx.get("a");
  ASSERT_TRUE(read);
  ASSERT_TRUE(read.value().has_value());
  EXPECT_EQ(*read.value(), ibc::testing::make_bytes("1"));

  auto base = chain.get("a");
  ASSERT_TRUE(base);
  EXPECT_FALSE(base.value().has_value());
}

TEST(transaction, dropped_transaction_leaves_store_untouched) {
  auto chain = make_chain();
  chain.begin_block(1, ibc::core::from_seconds(10), {});
  {
    auto tx = ibc::host::transaction{chain};
    ibc::host::set_u64(tx, "counter", 9);
    tx.emit(ibc::core::event_t{.type = "dropped", .attributes = {}});
  }
  auto counter = ibc::host::get_u64(chain, "counter");
  ASSERT_TRUE(counter);
  EXPECT_FALSE(counter.value().has_value());
}

TEST(transaction, removals_shadow_base_values) {
  auto chain = make_chain();
  chain.begin_block(1, ibc::core::from_seconds(10), {});
  auto seed = ibc::host::transaction{chain};
  seed.set("a", ibc::testing::make_bytes("1"));
  ASSERT_TRUE(chain.apply(seed.changes()));

  auto tx = ibc::host::transaction{chain};
  tx.remove("a");
  auto exists = ibc::host::exists(tx, "a");
  ASSERT_TRUE(exists);
  EXPECT_FALSE(exists.value());

  ASSERT_TRUE(chain.apply(tx.changes()));
  exists = ibc::host::exists(chain, "a");
  ASSERT_TRUE(exists);
  EXPECT_FALSE(exists.value());
}

TEST(store, sequences_are_allocated_from_zero_big_endian) {
  auto chain = make_chain();
  auto tx = ibc::host::transaction{chain};
  auto first = ibc::host::allocate_sequence(tx, "next");
  auto second = ibc::host::allocate_sequence(tx, "next");
  ASSERT_TRUE(first);
  ASSERT_TRUE(second);
  EXPECT_EQ(first.value(), 0u);
  EXPECT_EQ(second.value(), 1u);
  EXPECT_EQ(ibc::host::encode_u64(0x0102),
            (ibc::schema::bytes_t{0, 0, 0, 0, 0, 0, 0x01, 0x02}));
  EXPECT_FALSE(ibc::host::decode_u64(ibc::testing::make_bytes("short")));
}

TEST(chain_store, commit_records_host_block_and_changes_app_hash) {
  auto chain = make_chain();
  chain.begin_block(1, ibc::core::from_seconds(10), ibc::testing::make_hash(1));
  auto empty_root = chain.commit();
  ASSERT_TRUE(empty_root);

  chain.begin_block(2, ibc::core::from_seconds(15), ibc::testing::make_hash(2));
  auto tx = ibc::host::transaction{chain};
  tx.set("clients/x", ibc::testing::make_bytes("state"));
  ASSERT_TRUE(chain.apply(tx.changes()));
  auto root = chain.commit();
  ASSERT_TRUE(root);
  EXPECT_NE(root.value(), empty_root.value());
  EXPECT_EQ(chain.host_height().revision_number, 1u);
  EXPECT_EQ(chain.host_height().revision_height, 2u);

  auto block = chain.host_block(2);
  ASSERT_TRUE(block);
  ASSERT_TRUE(block.value().has_value());
  EXPECT_EQ(block.value()->app_hash, root.value());
  EXPECT_EQ(block.value()->timestamp, ibc::core::from_seconds(15));
  EXPECT_EQ(block.value()->next_validators_hash, ibc::testing::make_hash(2));
}

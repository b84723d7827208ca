#include <ibc/core/height.hpp>
#include <ibc/core/timestamp.hpp>
#include <ibc/testing/common.hpp>
#include <gtest/gtest.h>

using ibc::common::error_code;
using ibc::core::height_t;
using ibc::testing::error_of;

TEST(height, ordering_is_revision_first) {
  auto low = height_t{.revision_number = 1, .revision_height = 900};
  auto high = height_t{.revision_number = 2, .revision_height = 1};
  EXPECT_LT(low, high);
  EXPECT_LT(low, ibc::core::increment(low));
  EXPECT_EQ(ibc::core::add(low, 100).revision_height, 1000u);
  EXPECT_EQ(ibc::core::add(low, 100).revision_number, 1u);
}

TEST(height, zero_revision_height_is_rejected) {
  EXPECT_EQ(error_of(ibc::core::make_height(4, 0)), error_code::invalid_height);
  auto height = ibc::core::make_height(4, 1);
  ASSERT_TRUE(height);
  EXPECT_FALSE(ibc::core::is_zero(height.value()));
  EXPECT_TRUE(ibc::core::is_zero(ibc::core::zero_height()));
}

TEST(height, decrement_stops_at_one) {
  auto one = height_t{.revision_number = 3, .revision_height = 1};
  EXPECT_EQ(error_of(ibc::core::decrement(one)), error_code::invalid_height);
  auto two = ibc::core::decrement(ibc::core::increment(ibc::core::increment(one)));
  ASSERT_TRUE(two);
  EXPECT_EQ(two.value().revision_height, 2u);
}

TEST(height, string_form_parses_back) {
  auto height = height_t{.revision_number = 7, .revision_height = 123};
  EXPECT_EQ(ibc::core::to_string(height), "7-123");
  EXPECT_EQ(ibc::core::try_parse_height("7-123"), height);
  EXPECT_FALSE(ibc::core::try_parse_height("7"));
  EXPECT_FALSE(ibc::core::try_parse_height("7-"));
  EXPECT_FALSE(ibc::core::try_parse_height("a-1"));
  EXPECT_FALSE(ibc::core::try_parse_height("1-2-3"));
}

TEST(timestamp, arithmetic_saturates_and_orders) {
  auto start = ibc::core::from_seconds(1000);
  EXPECT_EQ(start.nanoseconds, 1'000'000'000'000ull);
  EXPECT_EQ(ibc::core::from_milliseconds(1500).nanoseconds, 1'500'000'000ull);
  EXPECT_FALSE(ibc::core::is_set(ibc::core::timestamp_t{}));

  auto later = ibc::core::add(start, ibc::core::seconds(5));
  auto elapsed = ibc::core::duration_since(later, start);
  ASSERT_TRUE(elapsed);
  EXPECT_EQ(elapsed.value(), ibc::core::seconds(5));
  EXPECT_FALSE(ibc::core::duration_since(start, later));

  auto max = ibc::core::add(later, ~uint64_t{0});
  EXPECT_EQ(max.nanoseconds, ~uint64_t{0});
  EXPECT_EQ(ibc::core::to_string(ibc::core::timestamp_t{1'500'000'000}),
            "1.500000000");
}

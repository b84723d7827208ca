#pragma once

#include <ibc/common/error.hpp>
#include <ibc/schema/primitives.hpp>

#include <compare>
#include <cstdint>
#include <string>

namespace ibc::core {

/// Nanoseconds since the Unix epoch. Zero means "unset" on packet timeouts.
struct timestamp_t final {
  uint64_t nanoseconds{};

  auto operator<=>(const timestamp_t&) const = default;
};

inline constexpr uint64_t kNanosecondsPerSecond = 1'000'000'000ull;

timestamp_t from_seconds(uint64_t seconds);
timestamp_t from_milliseconds(uint64_t milliseconds);
bool is_set(const timestamp_t& timestamp);

timestamp_t add(const timestamp_t& timestamp,
                ibc::schema::duration_nanoseconds_t duration);

/// Elapsed time from `earlier` to `later`; fails when `earlier` is after
/// `later`.
ibc::common::result_t<ibc::schema::duration_nanoseconds_t> duration_since(
    const timestamp_t& later,
    const timestamp_t& earlier);

inline constexpr ibc::schema::duration_nanoseconds_t seconds(
    const uint64_t value) {
  return value * kNanosecondsPerSecond;
}

std::string to_string(const timestamp_t& timestamp);

}  // namespace ibc::core

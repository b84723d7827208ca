#include <ibc/core/timestamp.hpp>
#include <spdlog/fmt/fmt.h>

#include <limits>

namespace ibc::core {

timestamp_t from_seconds(const uint64_t seconds) {
  return timestamp_t{.nanoseconds = seconds * kNanosecondsPerSecond};
}

timestamp_t from_milliseconds(const uint64_t milliseconds) {
  return timestamp_t{.nanoseconds = milliseconds * 1'000'000ull};
}

bool is_set(const timestamp_t& timestamp) {
  return timestamp.nanoseconds != 0;
}

timestamp_t add(const timestamp_t& timestamp,
                const ibc::schema::duration_nanoseconds_t duration) {
  constexpr auto kMax = std::numeric_limits<uint64_t>::max();
  if (kMax - timestamp.nanoseconds < duration) {
    return timestamp_t{.nanoseconds = kMax};
  }
  return timestamp_t{.nanoseconds = timestamp.nanoseconds + duration};
}

ibc::common::result_t<ibc::schema::duration_nanoseconds_t> duration_since(
    const timestamp_t& later,
    const timestamp_t& earlier) {
  if (earlier > later) {
    return ibc::common::make_error(
        ibc::common::error_code::header_not_monotonic,
        fmt::format("timestamp {} is after {}", earlier.nanoseconds,
                    later.nanoseconds));
  }
  return later.nanoseconds - earlier.nanoseconds;
}

std::string to_string(const timestamp_t& timestamp) {
  return fmt::format("{}.{:09}", timestamp.nanoseconds / kNanosecondsPerSecond,
                     timestamp.nanoseconds % kNanosecondsPerSecond);
}

}  // namespace ibc::core

#pragma once

#include <ibc/common/error.hpp>
#include <ibc/schema/primitives.hpp>
#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace ibc::testing {

inline ibc::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = ibc::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline ibc::schema::bytes_t make_bytes(const std::string_view text) {
  return ibc::schema::make_bytes(text);
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

/// Error code of a failed result, for EXPECT_EQ against an expected code.
template <typename Result>
ibc::common::error_code error_of(const Result& result) {
  EXPECT_FALSE(result.has_value());
  if (result.has_value()) {
    return ibc::common::error_code{};
  }
  return result.error().code;
}

}  // namespace ibc::testing

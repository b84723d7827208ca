#pragma once

#include <ibc/common/error.hpp>

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace ibc::core {

/// Block height of a counterparty chain: (revision number, height within the
/// revision). Ordered lexicographically, so a revision bump always compares
/// greater than any height of an earlier revision.
struct height_t final {
  uint64_t revision_number{};
  uint64_t revision_height{};

  auto operator<=>(const height_t&) const = default;
};

/// Construct a client height. `revision_height` must be at least 1.
ibc::common::result_t<height_t> make_height(uint64_t revision_number,
                                            uint64_t revision_height);

/// Height 0-0 is the "no timeout" marker carried by packets.
height_t zero_height();
bool is_zero(const height_t& height);

height_t increment(const height_t& height);
height_t add(const height_t& height, uint64_t delta);
ibc::common::result_t<height_t> sub(const height_t& height, uint64_t delta);
ibc::common::result_t<height_t> decrement(const height_t& height);

std::string to_string(const height_t& height);

/// Parse "{revision_number}-{revision_height}".
std::optional<height_t> try_parse_height(std::string_view value);

}  // namespace ibc::core

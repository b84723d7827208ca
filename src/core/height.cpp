#include <ibc/core/height.hpp>
#include <spdlog/fmt/fmt.h>

#include <charconv>

namespace ibc::core {

namespace {

std::optional<uint64_t> parse_u64(const std::string_view value) {
  if (value.empty()) {
    return std::nullopt;
  }
  auto parsed = uint64_t{};
  const auto* end = value.data() + value.size();
  auto [ptr, ec] = std::from_chars(value.data(), end, parsed);
  if (ec != std::errc{} || ptr != end) {
    return std::nullopt;
  }
  return parsed;
}

}  // namespace

ibc::common::result_t<height_t> make_height(const uint64_t revision_number,
                                            const uint64_t revision_height) {
  if (revision_height == 0) {
    return ibc::common::make_error(
        ibc::common::error_code::invalid_height,
        fmt::format("revision height must be non-zero (revision {})",
                    revision_number));
  }
  return height_t{.revision_number = revision_number,
                  .revision_height = revision_height};
}

height_t zero_height() {
  return height_t{};
}

bool is_zero(const height_t& height) {
  return height.revision_number == 0 && height.revision_height == 0;
}

height_t increment(const height_t& height) {
  return add(height, 1);
}

height_t add(const height_t& height, const uint64_t delta) {
  return height_t{.revision_number = height.revision_number,
                  .revision_height = height.revision_height + delta};
}

ibc::common::result_t<height_t> sub(const height_t& height,
                                    const uint64_t delta) {
  if (height.revision_height <= delta) {
    return ibc::common::make_error(
        ibc::common::error_code::invalid_height,
        fmt::format("cannot subtract {} from {}", delta, to_string(height)));
  }
  return height_t{.revision_number = height.revision_number,
                  .revision_height = height.revision_height - delta};
}

ibc::common::result_t<height_t> decrement(const height_t& height) {
  return sub(height, 1);
}

std::string to_string(const height_t& height) {
  return fmt::format("{}-{}", height.revision_number, height.revision_height);
}

std::optional<height_t> try_parse_height(const std::string_view value) {
  auto dash = value.find('-');
  if (dash == std::string_view::npos) {
    return std::nullopt;
  }
  auto revision_number = parse_u64(value.substr(0, dash));
  auto revision_height = parse_u64(value.substr(dash + 1));
  if (!revision_number || !revision_height) {
    return std::nullopt;
  }
  return height_t{.revision_number = *revision_number,
                  .revision_height = *revision_height};
}

}  // namespace ibc::core

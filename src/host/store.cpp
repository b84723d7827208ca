#include <ibc/host/store.hpp>
#include <boost/endian/buffers.hpp>
#include <spdlog/fmt/fmt.h>

#include <cstring>

namespace ibc::host {

ibc::schema::bytes_t encode_u64(const uint64_t value) {
  auto buffer = boost::endian::big_uint64_buf_t{value};
  auto out = ibc::schema::bytes_t(sizeof(buffer));
  std::memcpy(out.data(), buffer.data(), sizeof(buffer));
  return out;
}

std::optional<uint64_t> decode_u64(const ibc::schema::bytes_view_t& bytes) {
  auto buffer = boost::endian::big_uint64_buf_t{};
  if (bytes.size() != sizeof(buffer)) {
    return std::nullopt;
  }
  std::memcpy(&buffer, bytes.data(), sizeof(buffer));
  return buffer.value();
}

ibc::common::result_t<std::optional<uint64_t>> get_u64(
    const reader& store,
    const std::string_view path) {
  auto raw = store.get(path);
  if (!raw) {
    return raw.as_failure();
  }
  if (!raw.value()) {
    return std::optional<uint64_t>{};
  }
  auto value = decode_u64(*raw.value());
  if (!value) {
    return ibc::common::make_error(
        ibc::common::error_code::decoding_failed,
        fmt::format("{} does not hold an 8-byte counter", path));
  }
  return value;
}

void set_u64(writer& store, std::string path, const uint64_t value) {
  store.set(std::move(path), encode_u64(value));
}

ibc::common::result_t<uint64_t> allocate_sequence(writer& store,
                                                  const std::string_view path) {
  auto current = get_u64(store, path);
  if (!current) {
    return current.as_failure();
  }
  auto value = current.value().value_or(0);
  set_u64(store, std::string{path}, value + 1);
  return value;
}

ibc::common::result_t<bool> exists(const reader& store,
                                   const std::string_view path) {
  auto raw = store.get(path);
  if (!raw) {
    return raw.as_failure();
  }
  return raw.value().has_value();
}

}  // namespace ibc::host

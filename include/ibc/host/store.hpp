#pragma once

#include <ibc/host/context.hpp>
#include <ibc/schema/encoding/scale/encoder.hpp>

#include <optional>
#include <string>
#include <string_view>

// Typed access to the provable store. Entities are SCALE encoded; sequences
// and counters are 8-byte big-endian so counterparties can prove them.
namespace ibc::host {

template <typename T>
ibc::common::result_t<std::optional<T>> get_entity(const reader& store,
                                                   const std::string_view path,
                                                   const std::string_view what) {
  auto raw = store.get(path);
  if (!raw) {
    return raw.as_failure();
  }
  if (!raw.value()) {
    return std::optional<T>{};
  }
  auto decoded = ibc::schema::encoding::decode_input<T>(*raw.value(), what);
  if (!decoded) {
    return decoded.as_failure();
  }
  return std::optional<T>{std::move(decoded.value())};
}

template <typename T>
void put_entity(writer& store, std::string path, const T& value) {
  auto encoder = ibc::schema::encoding::scale_encoder_t{};
  store.set(std::move(path), encoder.encode(value));
}

ibc::schema::bytes_t encode_u64(uint64_t value);
std::optional<uint64_t> decode_u64(const ibc::schema::bytes_view_t& bytes);

ibc::common::result_t<std::optional<uint64_t>> get_u64(const reader& store,
                                                       std::string_view path);
void set_u64(writer& store, std::string path, uint64_t value);

/// Return the counter at `path` (zero when unset) and store its successor.
ibc::common::result_t<uint64_t> allocate_sequence(writer& store,
                                                  std::string_view path);

ibc::common::result_t<bool> exists(const reader& store, std::string_view path);

}  // namespace ibc::host

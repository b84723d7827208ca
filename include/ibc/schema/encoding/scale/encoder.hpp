#pragma once
#include <ibc/common/critical.hpp>
#include <ibc/common/error.hpp>
#include <ibc/schema/encoding/encoder.hpp>
#include <exception>
#include <iterator>
#include <scale/scale.hpp>
#include <spdlog/fmt/fmt.h>
#include <string_view>

namespace ibc::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  ibc::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, ibc::schema::bytes_t& out);

  template <typename T>
  T decode(const ibc::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const ibc::schema::bytes_view_t& bytes);
};

using scale_encoder_t = encoder<scale_encoder_tag>;

template <typename T>
ibc::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    ibc::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        ibc::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(const ibc::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    ibc::common::critical("failed to decode SCALE bytes");
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const ibc::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

/// Decode untrusted input. Failures surface as `decoding_failed` rather
/// than terminating.
template <typename T>
ibc::common::result_t<T> decode_input(const ibc::schema::bytes_view_t& bytes,
                                      const std::string_view what) {
  auto encoder = scale_encoder_t{};
  auto decoded = std::optional<T>{};
  try {
    decoded = encoder.try_decode<T>(bytes);
  } catch (const std::exception& ex) {
    return ibc::common::make_error(
        ibc::common::error_code::decoding_failed,
        fmt::format("malformed {}: {}", what, ex.what()));
  }
  if (!decoded) {
    return ibc::common::make_error(
        ibc::common::error_code::decoding_failed,
        fmt::format("malformed {} ({} bytes)", what, bytes.size()));
  }
  return std::move(*decoded);
}

}  // namespace ibc::schema::encoding

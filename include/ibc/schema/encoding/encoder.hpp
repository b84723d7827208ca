#pragma once
#include <ibc/schema/primitives.hpp>
#include <optional>
#include <span>

namespace ibc::schema::encoding {

/// Build-time selected encoder. Stored entities, proofs and message envelopes
/// all go through one encoder so that proven values are byte-identical on
/// both chains.
template <typename Library>
struct encoder {
  template <typename T>
  ibc::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, ibc::schema::bytes_t& out);

  template <typename T>
  T decode(const ibc::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const ibc::schema::bytes_view_t& bytes);
};

}  // namespace ibc::schema::encoding

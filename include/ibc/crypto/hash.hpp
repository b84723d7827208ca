#pragma once

#include <ibc/schema/primitives.hpp>

#include <optional>
#include <string_view>

namespace ibc::crypto {

ibc::schema::hash32_t sha256(const ibc::schema::bytes_view_t& bytes);

/// Digest `bytes` with the OpenSSL algorithm named `algorithm`
/// ("SHA2-512", "RIPEMD-160", "KECCAK-256", ...). Returns std::nullopt when
/// the running OpenSSL build does not provide it.
std::optional<ibc::schema::bytes_t> digest(
    std::string_view algorithm,
    const ibc::schema::bytes_view_t& bytes);

}  // namespace ibc::crypto

#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace ibc::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using duration_nanoseconds_t = uint64_t;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);
bytes_t make_bytes(const hash32_t& hash);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string_view make_string_view(const bytes_t& bytes);
std::string make_string(const bytes_view_t& bytes);

std::optional<hash32_t> try_make_hash32(const bytes_view_t& bytes);
hash32_t make_zero_hash();

std::string to_hex(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_hex(std::string_view hex);
bytes_t from_hex(std::string_view hex);

/// Validator public keys. CometBFT validators sign with Ed25519 by default;
/// secp256k1 keys are accepted by chains that enable them.
struct ed25519_public_key final {
  std::array<uint8_t, 32> public_key{};

  bool operator==(const ed25519_public_key&) const = default;
};

struct secp256k1_public_key final {
  std::array<uint8_t, 33> public_key{};

  bool operator==(const secp256k1_public_key&) const = default;
};

using public_key_t = std::variant<ed25519_public_key, secp256k1_public_key>;

}  // namespace ibc::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

#include <ibc/blake3/hash.hpp>
#include <ibc/commitment/ops.hpp>
#include <ibc/crypto/hash.hpp>
#include <boost/endian/conversion.hpp>
#include <spdlog/fmt/fmt.h>

#include <cstring>
#include <iterator>

namespace ibc::commitment::ics23 {

namespace {

using ibc::common::error_code;
using ibc::common::make_error;
using ibc::common::result_t;
using ibc::schema::bytes_t;
using ibc::schema::bytes_view_t;

result_t<bytes_t> openssl_digest(const std::string_view algorithm,
                                 const bytes_view_t& preimage) {
  auto digest = ibc::crypto::digest(algorithm, preimage);
  if (!digest) {
    return make_error(error_code::unsupported_hash_op,
                      fmt::format("{} is not available", algorithm));
  }
  return std::move(*digest);
}

template <typename T>
bytes_t fixed_prefix(const bytes_view_t& data, const bool big) {
  auto length = static_cast<T>(data.size());
  if (big) {
    boost::endian::native_to_big_inplace(length);
  } else {
    boost::endian::native_to_little_inplace(length);
  }
  auto out = bytes_t(sizeof(T));
  std::memcpy(out.data(), &length, sizeof(T));
  out.insert(std::end(out), std::begin(data), std::end(data));
  return out;
}

result_t<bytes_t> prepare_leaf_data(const hash_op prehash,
                                    const length_op length,
                                    const bytes_view_t& data) {
  auto hashed = do_hash(prehash, data);
  if (!hashed) {
    return hashed.as_failure();
  }
  return do_length(length, hashed.value());
}

}  // namespace

bytes_t encode_varint(uint64_t value) {
  auto out = bytes_t{};
  while (value >= 0x80) {
    out.push_back(static_cast<uint8_t>((value & 0x7f) | 0x80));
    value >>= 7;
  }
  out.push_back(static_cast<uint8_t>(value));
  return out;
}

result_t<bytes_t> do_hash(const hash_op op, const bytes_view_t& preimage) {
  switch (op) {
    case hash_op::no_hash:
      return ibc::schema::make_bytes(preimage);
    case hash_op::sha256:
      return ibc::schema::make_bytes(ibc::crypto::sha256(preimage));
    case hash_op::sha512:
      return openssl_digest("SHA2-512", preimage);
    case hash_op::sha512_256:
      return openssl_digest("SHA2-512/256", preimage);
    case hash_op::keccak256:
      return openssl_digest("KECCAK-256", preimage);
    case hash_op::ripemd160:
      return openssl_digest("RIPEMD-160", preimage);
    case hash_op::bitcoin: {
      auto inner = ibc::crypto::sha256(preimage);
      return openssl_digest("RIPEMD-160", inner);
    }
    case hash_op::blake2b_512:
      return openssl_digest("BLAKE2B-512", preimage);
    case hash_op::blake2s_256:
      return openssl_digest("BLAKE2S-256", preimage);
    case hash_op::blake3:
      return ibc::schema::make_bytes(ibc::blake3::hash(preimage));
  }
  return make_error(error_code::unsupported_hash_op,
                    fmt::format("hash op {}", static_cast<int>(op)));
}

result_t<bytes_t> do_length(const length_op op, const bytes_view_t& data) {
  switch (op) {
    case length_op::no_prefix:
      return ibc::schema::make_bytes(data);
    case length_op::var_proto: {
      auto out = encode_varint(data.size());
      out.insert(std::end(out), std::begin(data), std::end(data));
      return out;
    }
    case length_op::fixed32_big:
      return fixed_prefix<uint32_t>(data, true);
    case length_op::fixed32_little:
      return fixed_prefix<uint32_t>(data, false);
    case length_op::fixed64_big:
      return fixed_prefix<uint64_t>(data, true);
    case length_op::fixed64_little:
      return fixed_prefix<uint64_t>(data, false);
    case length_op::require_32_bytes:
      if (data.size() != 32) {
        return make_error(error_code::invalid_merkle_proof,
                          fmt::format("expected 32 bytes, got {}",
                                      data.size()));
      }
      return ibc::schema::make_bytes(data);
    case length_op::require_64_bytes:
      if (data.size() != 64) {
        return make_error(error_code::invalid_merkle_proof,
                          fmt::format("expected 64 bytes, got {}",
                                      data.size()));
      }
      return ibc::schema::make_bytes(data);
    case length_op::var_rlp:
      break;
  }
  return make_error(error_code::invalid_proof_spec,
                    fmt::format("unsupported length op {}",
                                static_cast<int>(op)));
}

result_t<bytes_t> apply_leaf(const leaf_op_t& op,
                             const bytes_view_t& key,
                             const bytes_view_t& value) {
  if (key.empty()) {
    return make_error(error_code::invalid_merkle_proof, "leaf op needs key");
  }
  if (value.empty()) {
    return make_error(error_code::invalid_merkle_proof, "leaf op needs value");
  }
  auto key_data = prepare_leaf_data(op.prehash_key, op.length, key);
  if (!key_data) {
    return key_data.as_failure();
  }
  auto value_data = prepare_leaf_data(op.prehash_value, op.length, value);
  if (!value_data) {
    return value_data.as_failure();
  }
  auto preimage = op.prefix;
  preimage.insert(std::end(preimage), std::begin(key_data.value()),
                  std::end(key_data.value()));
  preimage.insert(std::end(preimage), std::begin(value_data.value()),
                  std::end(value_data.value()));
  return do_hash(op.hash, preimage);
}

result_t<bytes_t> apply_inner(const inner_op_t& op, const bytes_view_t& child) {
  if (child.empty()) {
    return make_error(error_code::invalid_merkle_proof,
                      "inner op needs child value");
  }
  auto preimage = op.prefix;
  preimage.insert(std::end(preimage), std::begin(child), std::end(child));
  preimage.insert(std::end(preimage), std::begin(op.suffix),
                  std::end(op.suffix));
  return do_hash(op.hash, preimage);
}

result_t<bytes_t> calculate_existence_root(const existence_proof_t& proof) {
  if (proof.key.empty()) {
    return make_error(error_code::invalid_merkle_proof,
                      "existence proof must have key set");
  }
  if (proof.value.empty()) {
    return make_error(error_code::invalid_merkle_proof,
                      "existence proof must have value set");
  }
  auto current = apply_leaf(proof.leaf, proof.key, proof.value);
  if (!current) {
    return current.as_failure();
  }
  for (const auto& step : proof.path) {
    current = apply_inner(step, current.value());
    if (!current) {
      return current.as_failure();
    }
  }
  return current;
}

}  // namespace ibc::commitment::ics23

#include <ibc/crypto/verify.hpp>

#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/ecdsa.h>
#include <openssl/evp.h>

#include <array>
#include <memory>
#include <vector>

namespace ibc::crypto {

namespace {

using evp_pkey_ctx_ptr =
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using evp_pkey_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;
using ecdsa_sig_ptr = std::unique_ptr<ECDSA_SIG, decltype(&ECDSA_SIG_free)>;
using bignum_ptr = std::unique_ptr<BIGNUM, decltype(&BN_free)>;

constexpr auto kCompactSignatureSize = size_t{64};

bool openssl_has_ed25519() {
  auto ctx = evp_pkey_ctx_ptr{EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr),
                              EVP_PKEY_CTX_free};
  return static_cast<bool>(ctx);
}

bool openssl_has_secp256k1() {
  auto ctx = evp_pkey_ctx_ptr{
      EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr), EVP_PKEY_CTX_free};
  return static_cast<bool>(ctx);
}

bool verify_ed25519(const ibc::schema::bytes_view_t& message,
                    const ibc::schema::ed25519_public_key& key,
                    const ibc::schema::bytes_view_t& signature) {
  if (signature.size() != kCompactSignatureSize) {
    return false;
  }
  auto pkey = evp_pkey_ptr{
      EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr,
                                  key.public_key.data(), key.public_key.size()),
      EVP_PKEY_free};
  if (!pkey) {
    return false;
  }

  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    return false;
  }

  auto ok = false;
  if (EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) ==
      1) {
    ok = EVP_DigestVerify(ctx.get(), signature.data(), signature.size(),
                          message.data(), message.size()) == 1;
  }
  return ok;
}

bool verify_secp256k1(const ibc::schema::bytes_view_t& message,
                      const ibc::schema::secp256k1_public_key& key,
                      const ibc::schema::bytes_view_t& signature) {
  if (signature.size() != kCompactSignatureSize) {
    return false;
  }

  auto key_ctx = evp_pkey_ctx_ptr{
      EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr), EVP_PKEY_CTX_free};
  if (!key_ctx || EVP_PKEY_fromdata_init(key_ctx.get()) != 1) {
    return false;
  }

  auto* group_name = const_cast<char*>("secp256k1");
  auto params =
      std::array{OSSL_PARAM_construct_utf8_string(OSSL_PKEY_PARAM_GROUP_NAME,
                                                  group_name, 0),
                 OSSL_PARAM_construct_octet_string(
                     OSSL_PKEY_PARAM_PUB_KEY,
                     const_cast<unsigned char*>(key.public_key.data()),
                     key.public_key.size()),
                 OSSL_PARAM_construct_end()};

  auto* raw_pkey = static_cast<EVP_PKEY*>(nullptr);
  if (EVP_PKEY_fromdata(key_ctx.get(), &raw_pkey, EVP_PKEY_PUBLIC_KEY,
                        params.data()) != 1) {
    return false;
  }
  auto pkey = evp_pkey_ptr{raw_pkey, EVP_PKEY_free};

  auto ecdsa_sig = ecdsa_sig_ptr{ECDSA_SIG_new(), ECDSA_SIG_free};
  if (!ecdsa_sig) {
    return false;
  }
  auto r = bignum_ptr{BN_bin2bn(signature.data(), 32, nullptr), BN_free};
  auto s = bignum_ptr{BN_bin2bn(signature.data() + 32, 32, nullptr), BN_free};
  if (!r || !s ||
      ECDSA_SIG_set0(ecdsa_sig.get(), r.release(), s.release()) != 1) {
    return false;
  }

  auto der_len = i2d_ECDSA_SIG(ecdsa_sig.get(), nullptr);
  if (der_len <= 0) {
    return false;
  }
  auto der = std::vector<uint8_t>(static_cast<size_t>(der_len));
  auto* der_ptr = der.data();
  i2d_ECDSA_SIG(ecdsa_sig.get(), &der_ptr);

  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    return false;
  }

  auto ok = false;
  if (EVP_DigestVerifyInit(ctx.get(), nullptr, EVP_sha256(), nullptr,
                           pkey.get()) == 1) {
    ok = EVP_DigestVerify(ctx.get(), der.data(), der.size(), message.data(),
                          message.size()) == 1;
  }
  return ok;
}

}  // namespace

bool available() {
  static const auto available_now =
      openssl_has_ed25519() && openssl_has_secp256k1();
  return available_now;
}

bool verify_signature(const ibc::schema::bytes_view_t& message,
                      const ibc::schema::public_key_t& public_key,
                      const ibc::schema::bytes_view_t& signature) {
  return std::visit(
      overloaded{[&](const ibc::schema::ed25519_public_key& key) {
                   return verify_ed25519(message, key, signature);
                 },
                 [&](const ibc::schema::secp256k1_public_key& key) {
                   return verify_secp256k1(message, key, signature);
                 }},
      public_key);
}

}  // namespace ibc::crypto

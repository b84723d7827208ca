#include <ibc/crypto/hash.hpp>
#include <ibc/crypto/verify.hpp>
#include <ibc/testing/common.hpp>
#include <ibc/testing/signer.hpp>
#include <gtest/gtest.h>
#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/ecdsa.h>
#include <openssl/evp.h>
#include <openssl/obj_mac.h>

#include <array>
#include <optional>
#include <vector>

#if defined(__clang__)
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wdeprecated-declarations"
#elif defined(__GNUC__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#endif

namespace {

struct secp_fixture_t final {
  ibc::schema::secp256k1_public_key public_key;
  ibc::schema::bytes_t signature;
  ibc::schema::bytes_t message;
};

// secp256k1 vote signature in the 64-byte compact r || s form validators
// put on the wire.
std::optional<secp_fixture_t> make_secp_fixture() {
  auto* ec_key = EC_KEY_new_by_curve_name(NID_secp256k1);
  if (ec_key == nullptr) {
    return std::nullopt;
  }
  if (EC_KEY_generate_key(ec_key) != 1) {
    EC_KEY_free(ec_key);
    return std::nullopt;
  }
  EC_KEY_set_conv_form(ec_key, POINT_CONVERSION_COMPRESSED);

  auto fixture = secp_fixture_t{};
  auto* pub_ptr = fixture.public_key.public_key.data();
  if (i2o_ECPublicKey(ec_key, &pub_ptr) !=
      static_cast<int>(fixture.public_key.public_key.size())) {
    EC_KEY_free(ec_key);
    return std::nullopt;
  }

  fixture.message = ibc::testing::make_bytes("canonical vote");
  auto digest = ibc::crypto::sha256(fixture.message);
  auto* sig = ECDSA_do_sign(digest.data(), static_cast<int>(digest.size()),
                            ec_key);
  EC_KEY_free(ec_key);
  if (sig == nullptr) {
    return std::nullopt;
  }
  const auto* r = static_cast<const BIGNUM*>(nullptr);
  const auto* s = static_cast<const BIGNUM*>(nullptr);
  ECDSA_SIG_get0(sig, &r, &s);
  fixture.signature.resize(64);
  auto ok_r = BN_bn2binpad(r, fixture.signature.data(), 32);
  auto ok_s = BN_bn2binpad(s, fixture.signature.data() + 32, 32);
  ECDSA_SIG_free(sig);
  if (ok_r != 32 || ok_s != 32) {
    return std::nullopt;
  }
  return fixture;
}

}  // namespace

TEST(crypto_verify, verifies_ed25519_votes) {
  if (!ibc::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose required crypto providers";
  }
  auto signer = ibc::testing::ed25519_signer{};
  auto message = ibc::testing::make_bytes("precommit");
  auto signature = signer.sign(message);
  auto key = ibc::schema::public_key_t{signer.public_key()};
  EXPECT_TRUE(ibc::crypto::verify_signature(message, key, signature));

  message[0] ^= 0x01;
  EXPECT_FALSE(ibc::crypto::verify_signature(message, key, signature));

  auto other = ibc::testing::ed25519_signer{};
  EXPECT_FALSE(ibc::crypto::verify_signature(
      message, ibc::schema::public_key_t{other.public_key()},
      signer.sign(message)));
}

TEST(crypto_verify, rejects_truncated_signatures) {
  if (!ibc::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose required crypto providers";
  }
  auto signer = ibc::testing::ed25519_signer{};
  auto message = ibc::testing::make_bytes("precommit");
  auto signature = signer.sign(message);
  signature.pop_back();
  EXPECT_FALSE(ibc::crypto::verify_signature(
      message, ibc::schema::public_key_t{signer.public_key()}, signature));
}

TEST(crypto_verify, verifies_secp256k1_compact_signatures) {
  if (!ibc::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose required crypto providers";
  }
  auto fixture = make_secp_fixture();
  ASSERT_TRUE(fixture.has_value());
  auto key = ibc::schema::public_key_t{fixture->public_key};
  EXPECT_TRUE(ibc::crypto::verify_signature(fixture->message, key,
                                            fixture->signature));

  fixture->signature[10] ^= 0x01;
  EXPECT_FALSE(ibc::crypto::verify_signature(fixture->message, key,
                                             fixture->signature));
}

TEST(crypto_hash, sha256_matches_known_digest) {
  EXPECT_EQ(ibc::schema::to_hex(
                ibc::crypto::sha256(ibc::testing::make_bytes("abc"))),
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

#if defined(__clang__)
#pragma clang diagnostic pop
#elif defined(__GNUC__)
#pragma GCC diagnostic pop
#endif

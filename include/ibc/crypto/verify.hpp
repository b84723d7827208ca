#pragma once

#include <ibc/schema/primitives.hpp>

namespace ibc::crypto {

/// True when the linked OpenSSL provides both Ed25519 and secp256k1.
bool available();

/// Verify a validator signature. Ed25519 signs the raw message; secp256k1
/// signs sha256(message) and carries a 64-byte compact (r || s) signature.
bool verify_signature(const ibc::schema::bytes_view_t& message,
                      const ibc::schema::public_key_t& public_key,
                      const ibc::schema::bytes_view_t& signature);

}  // namespace ibc::crypto

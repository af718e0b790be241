/**
 * @file key_envelope.h
 * @brief Passphrase-based encryption of private keys at rest
 *
 * Key-encryption key: scrypt(passphrase, salt, N=2^logN, r, p) -> 32 bytes
 * Cipher:             AES-256-GCM, 96-bit IV, 128-bit tag
 *
 * Envelope layout (base64 of):
 *   "CGAK" | version(1) | logN(1) | r(4, BE) | p(4, BE) | salt(16) | iv(12) | tag(16) | ciphertext
 *
 * The 14-byte header is authenticated as GCM AAD, so KDF parameters cannot be
 * altered without failing decryption. Each envelope carries its own
 * parameters, so changing the configured cost does not strand older keys.
 */

#pragma once

#include "cga/crypto/secure_buffer.h"

#include <cstdint>
#include <string>

namespace cga::crypto {

struct KdfParams {
    uint8_t logN = 15;
    uint32_t r = 8;
    uint32_t p = 1;
};

/**
 * @brief Encrypt plaintext key material under a passphrase
 * @return Base64 envelope
 * @throws common::CryptoException on KDF/cipher failure or empty passphrase
 * @throws common::KeyGenerationException if the entropy source fails
 */
std::string sealPrivateKey(const SecureBuffer& plaintext,
                           const std::string& passphrase,
                           const KdfParams& params = KdfParams{});

/**
 * @brief Decrypt an envelope produced by sealPrivateKey
 * @throws common::CryptoException on malformed envelope or wrong passphrase
 */
SecureBuffer openPrivateKey(const std::string& envelope, const std::string& passphrase);

} // namespace cga::crypto

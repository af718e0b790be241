/**
 * @file key_pair.h
 * @brief Asymmetric signing key pair (Ed25519 / ECDSA P-256)
 *
 * RAII owner of an OpenSSL EVP_PKEY. Signatures are raw bytes:
 *   - Ed25519: 64-byte PureEdDSA signature over the message
 *   - ES256:   DER-encoded ECDSA signature over SHA-256(message)
 *
 * Memory ownership: KeyPair owns its EVP_PKEY and frees it on destruction.
 */

#pragma once

#include "cga/crypto/secure_buffer.h"

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <openssl/evp.h>

namespace cga::crypto {

enum class SignatureAlgorithm {
    ED25519,
    ES256
};

/**
 * @brief Algorithm name as persisted ("Ed25519" / "ES256")
 */
std::string signatureAlgorithmToString(SignatureAlgorithm alg);

/**
 * @brief Parse algorithm name (case-insensitive)
 * @return Algorithm, or std::nullopt if unsupported
 */
std::optional<SignatureAlgorithm> parseSignatureAlgorithm(const std::string& name);

class KeyPair {
public:
    /**
     * @brief Generate a fresh key pair
     * @throws common::KeyGenerationException on entropy or keygen failure
     */
    static KeyPair generate(SignatureAlgorithm alg);

    /**
     * @brief Load a private key from PKCS#8 PEM
     * @throws common::CryptoException if the PEM cannot be parsed or the key type is unsupported
     */
    static KeyPair fromPrivatePem(const SecureBuffer& pem);

    /**
     * @brief Load a verify-only key from SubjectPublicKeyInfo PEM
     * @throws common::CryptoException if the PEM cannot be parsed or the key type is unsupported
     */
    static KeyPair fromPublicPem(const std::string& pem);

    KeyPair(KeyPair&&) noexcept = default;
    KeyPair& operator=(KeyPair&&) noexcept = default;

    SignatureAlgorithm algorithm() const { return algorithm_; }
    bool hasPrivateKey() const { return hasPrivate_; }

    std::string publicKeyPem() const;

    /**
     * @brief Serialize the private key as unencrypted PKCS#8 PEM
     *
     * The PEM is written through OpenSSL secure memory and returned in a
     * SecureBuffer that wipes itself.
     */
    SecureBuffer privateKeyPem() const;

    /**
     * @throws common::CryptoException if this is a verify-only key or signing fails
     */
    std::vector<uint8_t> sign(const std::string& message) const;

    /**
     * @return true if the signature is valid for message; false otherwise
     */
    bool verify(const std::string& message, const std::vector<uint8_t>& signature) const;

private:
    struct PKeyDeleter { void operator()(EVP_PKEY* p) { EVP_PKEY_free(p); } };
    using UniqueKey = std::unique_ptr<EVP_PKEY, PKeyDeleter>;

    KeyPair(UniqueKey key, SignatureAlgorithm alg, bool hasPrivate)
        : key_(std::move(key)), algorithm_(alg), hasPrivate_(hasPrivate) {}

    static SignatureAlgorithm detectAlgorithm(EVP_PKEY* key);

    UniqueKey key_;
    SignatureAlgorithm algorithm_;
    bool hasPrivate_;
};

} // namespace cga::crypto

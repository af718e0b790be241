/**
 * @file key_pair.cpp
 * @brief KeyPair implementation on OpenSSL 3 EVP APIs
 */

#include "cga/crypto/key_pair.h"
#include "exceptions.h"

#include <cga/utils/string_utils.h>
#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <openssl/ec.h>
#include <openssl/err.h>
#include <openssl/obj_mac.h>
#include <openssl/pem.h>
#include <cstring>

namespace cga::crypto {

namespace {

struct BioDeleter { void operator()(BIO* b) { BIO_free_all(b); } };
using UniqueBio = std::unique_ptr<BIO, BioDeleter>;

struct PKeyCtxDeleter { void operator()(EVP_PKEY_CTX* c) { EVP_PKEY_CTX_free(c); } };
using UniquePKeyCtx = std::unique_ptr<EVP_PKEY_CTX, PKeyCtxDeleter>;

struct MdCtxDeleter { void operator()(EVP_MD_CTX* c) { EVP_MD_CTX_free(c); } };
using UniqueMdCtx = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

/**
 * @brief Drain the OpenSSL error queue into a printable string
 */
std::string opensslError() {
    std::string out;
    unsigned long code;
    char buf[256];
    while ((code = ERR_get_error()) != 0) {
        ERR_error_string_n(code, buf, sizeof(buf));
        if (!out.empty()) out += "; ";
        out += buf;
    }
    return out.empty() ? "unknown OpenSSL error" : out;
}

/// Ed25519 signs the message directly; ECDSA hashes with SHA-256 first
const EVP_MD* digestFor(SignatureAlgorithm alg) {
    return alg == SignatureAlgorithm::ES256 ? EVP_sha256() : nullptr;
}

} // anonymous namespace

// =============================================================================
// Algorithm names
// =============================================================================

std::string signatureAlgorithmToString(SignatureAlgorithm alg) {
    switch (alg) {
        case SignatureAlgorithm::ED25519: return "Ed25519";
        case SignatureAlgorithm::ES256: return "ES256";
    }
    return "Ed25519";
}

std::optional<SignatureAlgorithm> parseSignatureAlgorithm(const std::string& name) {
    std::string lower = cga::utils::toLower(cga::utils::trim(name));
    if (lower == "ed25519" || lower == "eddsa") {
        return SignatureAlgorithm::ED25519;
    }
    if (lower == "es256" || lower == "ecdsa-p256" || lower == "p-256") {
        return SignatureAlgorithm::ES256;
    }
    return std::nullopt;
}

// =============================================================================
// Construction
// =============================================================================

KeyPair KeyPair::generate(SignatureAlgorithm alg) {
    int id = (alg == SignatureAlgorithm::ED25519) ? EVP_PKEY_ED25519 : EVP_PKEY_EC;

    UniquePKeyCtx ctx(EVP_PKEY_CTX_new_id(id, nullptr));
    if (!ctx || EVP_PKEY_keygen_init(ctx.get()) <= 0) {
        throw common::KeyGenerationException("keygen init failed: " + opensslError());
    }

    if (alg == SignatureAlgorithm::ES256 &&
        EVP_PKEY_CTX_set_ec_paramgen_curve_nid(ctx.get(), NID_X9_62_prime256v1) <= 0) {
        throw common::KeyGenerationException("P-256 curve selection failed: " + opensslError());
    }

    EVP_PKEY* raw = nullptr;
    if (EVP_PKEY_keygen(ctx.get(), &raw) <= 0 || !raw) {
        throw common::KeyGenerationException(
            signatureAlgorithmToString(alg) + " keygen failed: " + opensslError());
    }

    return KeyPair(UniqueKey(raw), alg, true);
}

KeyPair KeyPair::fromPrivatePem(const SecureBuffer& pem) {
    if (pem.empty()) {
        throw common::CryptoException("Private key PEM is empty");
    }

    UniqueBio bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    if (!bio) {
        throw common::CryptoException("BIO allocation failed", opensslError());
    }

    EVP_PKEY* raw = PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr);
    if (!raw) {
        throw common::CryptoException("Failed to parse private key PEM", opensslError());
    }

    UniqueKey key(raw);
    SignatureAlgorithm alg = detectAlgorithm(key.get());
    return KeyPair(std::move(key), alg, true);
}

KeyPair KeyPair::fromPublicPem(const std::string& pem) {
    UniqueBio bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    if (!bio) {
        throw common::CryptoException("BIO allocation failed", opensslError());
    }

    EVP_PKEY* raw = PEM_read_bio_PUBKEY(bio.get(), nullptr, nullptr, nullptr);
    if (!raw) {
        throw common::CryptoException("Failed to parse public key PEM", opensslError());
    }

    UniqueKey key(raw);
    SignatureAlgorithm alg = detectAlgorithm(key.get());
    return KeyPair(std::move(key), alg, false);
}

SignatureAlgorithm KeyPair::detectAlgorithm(EVP_PKEY* key) {
    int id = EVP_PKEY_get_base_id(key);
    if (id == EVP_PKEY_ED25519) {
        return SignatureAlgorithm::ED25519;
    }
    if (id == EVP_PKEY_EC) {
        char group[64] = {0};
        size_t len = 0;
        if (EVP_PKEY_get_group_name(key, group, sizeof(group), &len) == 1 &&
            std::strcmp(group, "prime256v1") == 0) {
            return SignatureAlgorithm::ES256;
        }
        throw common::CryptoException("Unsupported EC curve", group);
    }
    throw common::CryptoException("Unsupported key type", std::to_string(id));
}

// =============================================================================
// Serialization
// =============================================================================

std::string KeyPair::publicKeyPem() const {
    UniqueBio bio(BIO_new(BIO_s_mem()));
    if (!bio || PEM_write_bio_PUBKEY(bio.get(), key_.get()) != 1) {
        throw common::CryptoException("Failed to encode public key", opensslError());
    }

    BUF_MEM* mem = nullptr;
    BIO_get_mem_ptr(bio.get(), &mem);
    return std::string(mem->data, mem->length);
}

SecureBuffer KeyPair::privateKeyPem() const {
    if (!hasPrivate_) {
        throw common::CryptoException("Key pair has no private key");
    }

    // Secure-heap BIO is cleansed when freed
    UniqueBio bio(BIO_new(BIO_s_secmem()));
    if (!bio || PEM_write_bio_PKCS8PrivateKey(bio.get(), key_.get(),
                                              nullptr, nullptr, 0, nullptr, nullptr) != 1) {
        throw common::CryptoException("Failed to encode private key", opensslError());
    }

    BUF_MEM* mem = nullptr;
    BIO_get_mem_ptr(bio.get(), &mem);
    return SecureBuffer(reinterpret_cast<const uint8_t*>(mem->data), mem->length);
}

// =============================================================================
// Sign / Verify
// =============================================================================

std::vector<uint8_t> KeyPair::sign(const std::string& message) const {
    if (!hasPrivate_) {
        throw common::CryptoException("Cannot sign with a verify-only key");
    }

    UniqueMdCtx ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestSignInit(ctx.get(), nullptr, digestFor(algorithm_), nullptr, key_.get()) != 1) {
        throw common::CryptoException("Signature init failed", opensslError());
    }

    const auto* msg = reinterpret_cast<const unsigned char*>(message.data());
    size_t sigLen = 0;
    if (EVP_DigestSign(ctx.get(), nullptr, &sigLen, msg, message.size()) != 1) {
        throw common::CryptoException("Signature length query failed", opensslError());
    }

    std::vector<uint8_t> sig(sigLen);
    if (EVP_DigestSign(ctx.get(), sig.data(), &sigLen, msg, message.size()) != 1) {
        throw common::CryptoException("Signing failed", opensslError());
    }
    sig.resize(sigLen);
    return sig;
}

bool KeyPair::verify(const std::string& message, const std::vector<uint8_t>& signature) const {
    if (signature.empty()) {
        return false;
    }

    UniqueMdCtx ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestVerifyInit(ctx.get(), nullptr, digestFor(algorithm_), nullptr, key_.get()) != 1) {
        throw common::CryptoException("Verification init failed", opensslError());
    }

    int rc = EVP_DigestVerify(ctx.get(), signature.data(), signature.size(),
                              reinterpret_cast<const unsigned char*>(message.data()), message.size());
    if (rc != 1) {
        // Malformed signatures leave entries in the error queue
        ERR_clear_error();
        return false;
    }
    return true;
}

} // namespace cga::crypto

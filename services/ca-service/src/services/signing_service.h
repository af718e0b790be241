/**
 * @file signing_service.h
 * @brief CA key management and certificate signing
 *
 * Owns the CA signing key lifecycle (generate, encrypt at rest, rotate) and
 * issues certificates. Private keys are decrypted per call into wiped
 * buffers and never cached.
 *
 * @author SmartCore Inc.
 * @date 2026-02-04
 */

#pragma once

#include "../common/clock.h"
#include "../domain/models/audit_log.h"
#include "../domain/models/certificate.h"
#include "../domain/models/signing_request.h"
#include "../repositories/certificate_registry.h"

#include <cga/crypto/key_envelope.h>
#include <cga/crypto/key_pair.h>

#include <string>
#include <json/json.h>

namespace services {

struct SigningConfig {
    std::string issuerId = "cga.aigos.io";
    std::string issuerName = "AIGOS CGA Certificate Authority";
    cga::crypto::SignatureAlgorithm algorithm = cga::crypto::SignatureAlgorithm::ED25519;
    cga::crypto::KdfParams kdf;
};

struct KeyGenerationResult {
    std::string keyId;
    std::string algorithm;
    std::string publicKey;
};

/**
 * @brief Detached signature over arbitrary bytes
 */
struct DocumentSignature {
    std::string keyId;
    std::string algorithm;
    std::string signature;  // base64
};

/**
 * @brief Public CA identity and active key
 */
struct PublicKeyInfo {
    std::string issuerId;
    std::string issuerName;
    std::string keyId;
    std::string algorithm;
    std::string publicKey;
    int64_t certificatesSigned = 0;

    Json::Value toJson() const;
};

class SigningService {
public:
    /**
     * @param registry Certificate registry (non-owning)
     * @param keyPassword Passphrase protecting CA private keys at rest
     * @param config Issuer identity, key algorithm and KDF parameters
     * @param clock Time source
     * @throws std::invalid_argument if registry is nullptr or keyPassword is empty
     */
    SigningService(repositories::ICertificateRegistry* registry,
                   std::string keyPassword,
                   SigningConfig config = SigningConfig(),
                   common::Clock clock = common::systemClock());

    ~SigningService();

    SigningService(const SigningService&) = delete;
    SigningService& operator=(const SigningService&) = delete;

    // =========================================================================
    // Key management
    // =========================================================================

    /**
     * @brief Generate a CA key sealed under `passphrase` and make it active
     *
     * Any previously active key is marked rotated in the same atomic unit.
     *
     * @throws common::KeyGenerationException entropy or keygen failure
     * @throws common::CryptoException passphrase differs from the configured key password
     */
    KeyGenerationResult generateKey(const std::string& passphrase,
                                    const domain::models::AuditActor& actor = domain::models::AuditActor::system());

    /**
     * @brief Replace the active key with a fresh one sealed under the configured passphrase
     */
    KeyGenerationResult rotateKey(const domain::models::AuditActor& actor = domain::models::AuditActor::system());

    PublicKeyInfo getPublicKeyInfo();

    // =========================================================================
    // Certificates
    // =========================================================================

    /**
     * @brief Issue and persist a signed certificate
     *
     * @throws common::ValidationException malformed request
     * @throws common::KeyUnavailableException no active CA key
     * @throws common::ConflictException identity already holds a live certificate
     * @throws common::CryptoException signing or key decryption failure
     */
    domain::models::CertificateRecord sign(
        const domain::models::SigningRequest& request,
        const domain::models::AuditActor& actor = domain::models::AuditActor::system());

    /**
     * @brief Verify content hash and CA signature of a certificate
     *
     * Any retained key may verify, so certificates signed before a rotation
     * stay valid.
     *
     * @return true on success
     * @throws common::CryptoException hash mismatch or bad signature
     * @throws common::KeyUnavailableException signing key not retained
     */
    bool verifySignature(const domain::models::CertificateRecord& cert);

    // =========================================================================
    // Detached signatures
    // =========================================================================

    /**
     * @brief Sign arbitrary bytes with the active key
     * @throws common::KeyUnavailableException no active CA key
     */
    DocumentSignature signDocument(const std::string& bytes);

    /**
     * @brief Verify a detached signature against a retained key
     * @return false on a bad or malformed signature
     * @throws common::KeyUnavailableException key not retained
     */
    bool verifyDocument(const std::string& bytes, const std::string& keyId, const std::string& signature);

    const SigningConfig& config() const { return config_; }

private:
    KeyGenerationResult createAndActivateKey(const std::string& passphrase,
                                             const domain::models::AuditActor& actor,
                                             const std::string& action);

    domain::models::CaKeyRecord requireActiveKey();

    /**
     * @brief Decrypt a key record for one signing operation
     */
    cga::crypto::KeyPair unsealKey(const domain::models::CaKeyRecord& key);

    static std::string generateKeyId(const domain::models::TimePoint& now);

    repositories::ICertificateRegistry* registry_;
    std::string keyPassword_;
    SigningConfig config_;
    common::Clock clock_;
};

} // namespace services

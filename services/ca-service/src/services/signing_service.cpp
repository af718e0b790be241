/**
 * @file signing_service.cpp
 * @brief SigningService implementation
 */

#include "signing_service.h"
#include "../domain/models/certificate_content.h"
#include "exceptions.h"

#include <cga/crypto/digest.h>
#include <cga/utils/string_utils.h>

#include <openssl/crypto.h>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace services {

using namespace domain::models;
using cga::crypto::KeyPair;
using cga::crypto::SecureBuffer;

Json::Value PublicKeyInfo::toJson() const {
    Json::Value json;
    json["issuer"]["id"] = issuerId;
    json["issuer"]["name"] = issuerName;
    json["keyId"] = keyId;
    json["algorithm"] = algorithm;
    json["publicKey"] = publicKey;
    json["certificatesSigned"] = Json::Int64(certificatesSigned);
    return json;
}

SigningService::SigningService(repositories::ICertificateRegistry* registry,
                               std::string keyPassword,
                               SigningConfig config,
                               common::Clock clock)
    : registry_(registry)
    , keyPassword_(std::move(keyPassword))
    , config_(std::move(config))
    , clock_(std::move(clock))
{
    if (!registry_) {
        throw std::invalid_argument("SigningService: registry cannot be nullptr");
    }
    if (keyPassword_.empty()) {
        throw std::invalid_argument("SigningService: keyPassword cannot be empty");
    }
    spdlog::debug("[SigningService] Initialized (issuer={}, algorithm={})",
                  config_.issuerId, cga::crypto::signatureAlgorithmToString(config_.algorithm));
}

SigningService::~SigningService() {
    if (!keyPassword_.empty()) {
        OPENSSL_cleanse(&keyPassword_[0], keyPassword_.size());
    }
}

// =============================================================================
// Key management
// =============================================================================

std::string SigningService::generateKeyId(const TimePoint& now) {
    return "cga-ca-" + std::to_string(cga::utils::toUnixMillis(now)) + "-" + cga::utils::randomHex(4);
}

KeyGenerationResult SigningService::generateKey(const std::string& passphrase, const AuditActor& actor) {
    return createAndActivateKey(passphrase, actor, "key_generated");
}

KeyGenerationResult SigningService::rotateKey(const AuditActor& actor) {
    return createAndActivateKey(keyPassword_, actor, "key_rotated");
}

KeyGenerationResult SigningService::createAndActivateKey(const std::string& passphrase,
                                                         const AuditActor& actor,
                                                         const std::string& action) {
    if (passphrase.empty()) {
        throw common::ValidationException("passphrase", "key passphrase cannot be empty");
    }
    // Active keys are unsealed with keyPassword_
    if (!cga::crypto::constantTimeEquals(passphrase, keyPassword_)) {
        spdlog::error("[SigningService] Key generation refused: passphrase does not match the configured key password");
        throw common::CryptoException("Key passphrase does not match the configured CA key password");
    }

    auto previous = registry_->getActiveKey();

    KeyPair keyPair = KeyPair::generate(config_.algorithm);

    CaKeyRecord record;
    record.createdAt = clock_();
    record.id = generateKeyId(record.createdAt);
    record.algorithm = cga::crypto::signatureAlgorithmToString(keyPair.algorithm());
    record.publicKey = keyPair.publicKeyPem();
    {
        SecureBuffer pem = keyPair.privateKeyPem();
        record.encryptedPrivateKey = cga::crypto::sealPrivateKey(pem, passphrase, config_.kdf);
    }
    record.status = KeyStatus::ACTIVE;

    AuditEntry audit;
    audit.actor = actor;
    audit.action = action;
    audit.resourceType = "ca_key";
    audit.resourceId = record.id;
    audit.details["algorithm"] = record.algorithm;
    audit.details["newKeyId"] = record.id;
    if (previous) {
        audit.details["previousKeyId"] = previous->id;
    }

    registry_->activateKey(record, audit);

    if (previous) {
        spdlog::info("[SigningService] CA key {} activated, {} rotated ({})",
                     record.id, previous->id, record.algorithm);
    } else {
        spdlog::info("[SigningService] CA key {} activated ({})", record.id, record.algorithm);
    }

    return KeyGenerationResult{record.id, record.algorithm, record.publicKey};
}

CaKeyRecord SigningService::requireActiveKey() {
    auto key = registry_->getActiveKey();
    if (!key) {
        throw common::KeyUnavailableException("no active CA key; run key generation first");
    }
    return *key;
}

KeyPair SigningService::unsealKey(const CaKeyRecord& key) {
    SecureBuffer pem = cga::crypto::openPrivateKey(key.encryptedPrivateKey, keyPassword_);
    return KeyPair::fromPrivatePem(pem);
}

PublicKeyInfo SigningService::getPublicKeyInfo() {
    CaKeyRecord key = requireActiveKey();

    PublicKeyInfo info;
    info.issuerId = config_.issuerId;
    info.issuerName = config_.issuerName;
    info.keyId = key.id;
    info.algorithm = key.algorithm;
    info.publicKey = key.publicKey;
    info.certificatesSigned = key.certificatesSigned;
    return info;
}

// =============================================================================
// Certificates
// =============================================================================

CertificateRecord SigningService::sign(const SigningRequest& request, const AuditActor& actor) {
    request.validate();

    CaKeyRecord key = requireActiveKey();
    const CertificateIdentity identity{request.agentId, request.agentVersion, request.orgId};

    // Early rejection; the registry re-checks inside its atomic insert
    auto live = registry_->findLiveCertificate(identity);
    if (live && (!request.supersedesId || live->id != *request.supersedesId)) {
        throw common::ConflictException("A live certificate already exists for this identity",
                                        identity.toString() + " -> " + live->id);
    }

    int version = 1;
    if (request.supersedesId) {
        auto prior = registry_->findCertificate(*request.supersedesId);
        if (!prior) {
            throw common::NotFoundException("Certificate", *request.supersedesId);
        }
        auto priorContent = CertificateContent::parse(prior->certificateContent);
        version = (priorContent ? priorContent->version : 1) + 1;
    }

    const TimePoint now = clock_();

    CertificateContent content;
    content.id = "cga-" + cga::utils::generateUuid();
    content.version = version;
    content.agentId = request.agentId;
    content.agentVersion = request.agentVersion;
    content.orgId = request.orgId;
    content.orgName = request.orgName;
    content.orgDomain = request.orgDomain;
    content.attestation = request.attestation;
    content.level = request.level;
    content.issuedAt = now;
    content.expiresAt = cga::utils::addDays(now, request.effectiveValidityDays());
    content.issuerId = config_.issuerId;
    content.issuerName = config_.issuerName;
    content.supersedesId = request.supersedesId;

    const std::string canonical = content.toCanonicalJson();

    std::vector<uint8_t> signature;
    std::string algorithm;
    {
        KeyPair signer = unsealKey(key);
        signature = signer.sign(canonical);
        algorithm = cga::crypto::signatureAlgorithmToString(signer.algorithm());
    }

    CertificateRecord record;
    record.id = content.id;
    record.agentId = request.agentId;
    record.agentVersion = request.agentVersion;
    record.orgId = request.orgId;
    record.orgName = request.orgName;
    record.orgDomain = request.orgDomain;
    record.level = request.level;
    record.goldenThreadHash = cga::crypto::goldenThreadHash(canonical);
    record.issuedAt = content.issuedAt;
    record.expiresAt = content.expiresAt;
    record.certificateContent = canonical;
    record.signatureAlgorithm = algorithm;
    record.signatureKeyId = key.id;
    record.signatureValue = cga::utils::toBase64(signature);
    record.status = CertificateStatus::ACTIVE;
    record.supersedesId = request.supersedesId;
    record.createdAt = now;
    record.updatedAt = now;

    AuditEntry audit;
    audit.actor = actor;
    audit.action = "certificate_issued";
    audit.resourceType = "certificate";
    audit.resourceId = record.id;
    audit.details["agentId"] = record.agentId;
    audit.details["agentVersion"] = record.agentVersion;
    audit.details["orgId"] = record.orgId;
    audit.details["level"] = certificateLevelToString(record.level);
    audit.details["keyId"] = key.id;
    audit.details["expiresAt"] = cga::utils::formatIso8601(record.expiresAt);
    if (request.supersedesId) {
        audit.details["supersedes"] = *request.supersedesId;
    }

    registry_->issueCertificate(record, request.supersedesId, audit);

    spdlog::info("[SigningService] Issued {} for {} (level={}, key={}, expires={})",
                 record.id, identity.toString(), certificateLevelToString(record.level),
                 key.id, cga::utils::formatIso8601(record.expiresAt));
    return record;
}

bool SigningService::verifySignature(const CertificateRecord& cert) {
    const std::string recomputed = cga::crypto::goldenThreadHash(cert.certificateContent);
    if (!cga::crypto::constantTimeEquals(recomputed, cert.goldenThreadHash)) {
        spdlog::warn("[SigningService] Golden thread hash mismatch for {}", cert.id);
        throw common::CryptoException("Certificate content does not match its golden thread hash", cert.id);
    }

    auto key = registry_->findKey(cert.signatureKeyId);
    if (!key) {
        throw common::KeyUnavailableException("signing key not retained: " + cert.signatureKeyId);
    }

    if (key->algorithm != cert.signatureAlgorithm) {
        throw common::CryptoException("Signature algorithm does not match signing key",
                                      cert.signatureAlgorithm + " vs " + key->algorithm);
    }

    auto signature = cga::utils::fromBase64(cert.signatureValue);
    if (!signature) {
        throw common::CryptoException("Malformed certificate signature encoding", cert.id);
    }

    KeyPair verifier = KeyPair::fromPublicPem(key->publicKey);
    if (!verifier.verify(cert.certificateContent, *signature)) {
        spdlog::warn("[SigningService] Signature verification failed for {} (key {})", cert.id, key->id);
        throw common::CryptoException("Certificate signature verification failed", cert.id);
    }
    return true;
}

// =============================================================================
// Detached signatures
// =============================================================================

DocumentSignature SigningService::signDocument(const std::string& bytes) {
    CaKeyRecord key = requireActiveKey();
    KeyPair signer = unsealKey(key);

    DocumentSignature out;
    out.keyId = key.id;
    out.algorithm = cga::crypto::signatureAlgorithmToString(signer.algorithm());
    out.signature = cga::utils::toBase64(signer.sign(bytes));
    return out;
}

bool SigningService::verifyDocument(const std::string& bytes, const std::string& keyId,
                                    const std::string& signature) {
    auto key = registry_->findKey(keyId);
    if (!key) {
        throw common::KeyUnavailableException("signing key not retained: " + keyId);
    }

    auto raw = cga::utils::fromBase64(signature);
    if (!raw) {
        return false;
    }
    return KeyPair::fromPublicPem(key->publicKey).verify(bytes, *raw);
}

} // namespace services

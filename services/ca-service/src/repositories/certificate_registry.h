/**
 * @file certificate_registry.h
 * @brief Certificate registry interface
 *
 * Durable store shared by every CA component. Implementations:
 *   - PgCertificateRegistry: PostgreSQL via libpq (production)
 *   - MemoryCertificateRegistry: in-process maps (development, unit tests)
 *
 * The composite commands (issueCertificate, revokeCertificate, activateKey)
 * run read-validate-write as one atomic unit. Either every write they make
 * is visible afterwards or none is.
 *
 * @author SmartCore Inc.
 * @date 2026-02-03
 */

#pragma once

#include "../domain/models/audit_log.h"
#include "../domain/models/ca_key.h"
#include "../domain/models/certificate.h"
#include "../domain/models/ocsp.h"
#include "../domain/models/revocation.h"
#include "../domain/models/verification.h"

#include <optional>
#include <string>
#include <vector>

namespace repositories {

class ICertificateRegistry {
public:
    virtual ~ICertificateRegistry() = default;

    // =========================================================================
    // Schema
    // =========================================================================

    /**
     * @brief Create the schema and apply pending additive migrations
     * @throws common::StorageException
     */
    virtual void initialize() = 0;

    /**
     * @brief Highest applied schema version (0 before initialize)
     */
    virtual int schemaVersion() = 0;

    // =========================================================================
    // Atomic commands
    // =========================================================================

    /**
     * @brief Insert a signed certificate
     *
     * If supersedesId is set, the referenced record must be active and carry
     * the same identity; it is marked superseded in the same unit.
     * certificatesSigned of record.signatureKeyId is incremented.
     *
     * @throws common::ConflictException live identity exists, or supersede target not eligible
     * @throws common::NotFoundException supersede target or signing key unknown
     */
    virtual void issueCertificate(const domain::models::CertificateRecord& record,
                                  const std::optional<std::string>& supersedesId,
                                  const domain::models::AuditEntry& audit) = 0;

    /**
     * @brief Revoke a certificate (idempotent)
     *
     * On first revoke: status -> revoked, RevocationRecord inserted, OCSP cache
     * row deleted, audit appended. On repeat: existing record returned with
     * created=false and nothing written.
     *
     * @throws common::NotFoundException unknown certificate id
     */
    virtual domain::models::RevocationResult revokeCertificate(
        const domain::models::RevocationRecord& revocation,
        const domain::models::AuditEntry& audit) = 0;

    /**
     * @brief Make `key` the single active key
     *
     * The previous active key (if any) becomes rotated with
     * rotatedAt = key.createdAt.
     */
    virtual void activateKey(const domain::models::CaKeyRecord& key,
                             const domain::models::AuditEntry& audit) = 0;

    // =========================================================================
    // Certificates
    // =========================================================================

    virtual std::optional<domain::models::CertificateRecord> findCertificate(const std::string& id) = 0;

    /**
     * @brief Non-superseded record for an identity
     */
    virtual std::optional<domain::models::CertificateRecord> findLiveCertificate(
        const domain::models::CertificateIdentity& identity) = 0;

    virtual std::vector<domain::models::CertificateRecord> listByAgent(const std::string& agentId) = 0;

    virtual std::vector<domain::models::CertificateRecord> listByOrg(const std::string& orgId) = 0;

    /**
     * @brief Active records with from <= expiresAt < to, oldest expiry first
     */
    virtual std::vector<domain::models::CertificateRecord> findActiveExpiringBetween(
        const domain::models::TimePoint& from,
        const domain::models::TimePoint& to) = 0;

    // =========================================================================
    // Revocations
    // =========================================================================

    virtual std::optional<domain::models::RevocationRecord> findRevocation(const std::string& certificateId) = 0;

    /**
     * @brief Every revocation, ordered by revokedAt
     */
    virtual std::vector<domain::models::RevocationRecord> listRevocations() = 0;

    // =========================================================================
    // CA keys
    // =========================================================================

    virtual std::optional<domain::models::CaKeyRecord> getActiveKey() = 0;

    virtual std::optional<domain::models::CaKeyRecord> findKey(const std::string& id) = 0;

    virtual std::vector<domain::models::CaKeyRecord> listKeys() = 0;

    // =========================================================================
    // OCSP cache (one row per certificate, last write wins)
    // =========================================================================

    virtual std::optional<domain::models::OcspCacheEntry> findOcspCache(const std::string& certificateId) = 0;

    virtual void upsertOcspCache(const domain::models::OcspCacheEntry& entry) = 0;

    virtual void deleteOcspCache(const std::string& certificateId) = 0;

    // =========================================================================
    // Append-only logs
    // =========================================================================

    /**
     * @return Assigned history id
     */
    virtual int64_t appendVerification(const domain::models::VerificationHistoryRecord& record) = 0;

    /**
     * @brief Most recent history rows for a certificate, newest first
     */
    virtual std::vector<domain::models::VerificationHistoryRecord> listVerifications(
        const std::string& certificateId, int limit = 100) = 0;

    /**
     * @return Assigned audit id
     * @throws common::StorageException never swallowed
     */
    virtual int64_t recordAudit(const domain::models::AuditEntry& entry) = 0;

    /**
     * @brief Most recent audit rows, optionally for one resource, newest first
     */
    virtual std::vector<domain::models::AuditLogRecord> listAudit(
        const std::optional<std::string>& resourceId, int limit = 100) = 0;
};

} // namespace repositories

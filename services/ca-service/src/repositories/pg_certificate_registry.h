/**
 * @file pg_certificate_registry.h
 * @brief PostgreSQL-backed certificate registry
 *
 * Composite commands run in one PgTransaction with SELECT ... FOR UPDATE row
 * locks. The partial unique index on (agent_id, agent_version, org_id)
 * backs the live-identity check, so concurrent issuers racing past the read
 * still surface a ConflictException from the INSERT.
 *
 * Thread-safe: each call acquires its own pooled connection.
 *
 * @author SmartCore Inc.
 * @date 2026-02-04
 */

#pragma once

#include "certificate_registry.h"
#include "db_connection_pool.h"
#include "pg_transaction.h"

namespace repositories {

class PgCertificateRegistry : public ICertificateRegistry {
public:
    /**
     * @param dbPool Connection pool (non-owning)
     * @throws std::invalid_argument if dbPool is nullptr
     */
    explicit PgCertificateRegistry(common::DbConnectionPool* dbPool);
    ~PgCertificateRegistry() override = default;

    PgCertificateRegistry(const PgCertificateRegistry&) = delete;
    PgCertificateRegistry& operator=(const PgCertificateRegistry&) = delete;

    void initialize() override;
    int schemaVersion() override;

    void issueCertificate(const domain::models::CertificateRecord& record,
                          const std::optional<std::string>& supersedesId,
                          const domain::models::AuditEntry& audit) override;

    domain::models::RevocationResult revokeCertificate(
        const domain::models::RevocationRecord& revocation,
        const domain::models::AuditEntry& audit) override;

    void activateKey(const domain::models::CaKeyRecord& key,
                     const domain::models::AuditEntry& audit) override;

    std::optional<domain::models::CertificateRecord> findCertificate(const std::string& id) override;
    std::optional<domain::models::CertificateRecord> findLiveCertificate(
        const domain::models::CertificateIdentity& identity) override;
    std::vector<domain::models::CertificateRecord> listByAgent(const std::string& agentId) override;
    std::vector<domain::models::CertificateRecord> listByOrg(const std::string& orgId) override;
    std::vector<domain::models::CertificateRecord> findActiveExpiringBetween(
        const domain::models::TimePoint& from,
        const domain::models::TimePoint& to) override;

    std::optional<domain::models::RevocationRecord> findRevocation(const std::string& certificateId) override;
    std::vector<domain::models::RevocationRecord> listRevocations() override;

    std::optional<domain::models::CaKeyRecord> getActiveKey() override;
    std::optional<domain::models::CaKeyRecord> findKey(const std::string& id) override;
    std::vector<domain::models::CaKeyRecord> listKeys() override;

    std::optional<domain::models::OcspCacheEntry> findOcspCache(const std::string& certificateId) override;
    void upsertOcspCache(const domain::models::OcspCacheEntry& entry) override;
    void deleteOcspCache(const std::string& certificateId) override;

    int64_t appendVerification(const domain::models::VerificationHistoryRecord& record) override;
    std::vector<domain::models::VerificationHistoryRecord> listVerifications(
        const std::string& certificateId, int limit = 100) override;

    int64_t recordAudit(const domain::models::AuditEntry& entry) override;
    std::vector<domain::models::AuditLogRecord> listAudit(
        const std::optional<std::string>& resourceId, int limit = 100) override;

private:
    /**
     * @brief Run a read-only statement in its own transaction
     */
    Json::Value readRows(const std::string& sql, const std::vector<std::string>& params = {});

    static int64_t insertAudit(common::PgTransaction& tx, const domain::models::AuditEntry& entry);

    static domain::models::CertificateRecord rowToCertificate(const Json::Value& row);
    static domain::models::RevocationRecord rowToRevocation(const Json::Value& row);
    static domain::models::CaKeyRecord rowToKey(const Json::Value& row);
    static domain::models::OcspCacheEntry rowToOcspCache(const Json::Value& row);
    static domain::models::VerificationHistoryRecord rowToVerification(const Json::Value& row);
    static domain::models::AuditLogRecord rowToAudit(const Json::Value& row);

    common::DbConnectionPool* dbPool_;
};

} // namespace repositories

/**
 * @file memory_certificate_registry.h
 * @brief In-process certificate registry
 *
 * All state lives in mutex-guarded maps. Each composite command runs as a
 * single critical section which validates everything before the first write,
 * so a rejected command leaves no partial state behind.
 *
 * Used for CA_STORAGE=memory and unit tests. Nothing is persisted.
 */

#pragma once

#include "certificate_registry.h"
#include "../common/clock.h"

#include <map>
#include <mutex>

namespace repositories {

class MemoryCertificateRegistry : public ICertificateRegistry {
public:
    /**
     * @param clock Source of audit timestamps (defaults to the system clock)
     */
    explicit MemoryCertificateRegistry(common::Clock clock = common::systemClock());
    ~MemoryCertificateRegistry() override = default;

    MemoryCertificateRegistry(const MemoryCertificateRegistry&) = delete;
    MemoryCertificateRegistry& operator=(const MemoryCertificateRegistry&) = delete;

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
    int64_t appendAuditLocked(const domain::models::AuditEntry& entry);

    std::vector<domain::models::CertificateRecord> selectLocked(
        const std::function<bool(const domain::models::CertificateRecord&)>& pred) const;

    common::Clock clock_;
    mutable std::mutex mutex_;

    int schemaVersion_ = 0;

    std::map<std::string, domain::models::CertificateRecord> certificates_;
    std::map<domain::models::CertificateIdentity, std::string> liveIndex_;  // identity -> non-superseded id
    std::map<std::string, domain::models::RevocationRecord> revocations_;
    std::map<std::string, domain::models::CaKeyRecord> keys_;
    std::map<std::string, domain::models::OcspCacheEntry> ocspCache_;

    std::vector<domain::models::VerificationHistoryRecord> verifications_;
    std::vector<domain::models::AuditLogRecord> audit_;
    int64_t nextVerificationId_ = 1;
    int64_t nextAuditId_ = 1;
};

} // namespace repositories

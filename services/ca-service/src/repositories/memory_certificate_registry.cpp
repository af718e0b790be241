/**
 * @file memory_certificate_registry.cpp
 * @brief MemoryCertificateRegistry implementation
 */

#include "memory_certificate_registry.h"
#include "registry_schema.h"
#include "exceptions.h"

#include <spdlog/spdlog.h>
#include <algorithm>

namespace repositories {

using namespace domain::models;

MemoryCertificateRegistry::MemoryCertificateRegistry(common::Clock clock)
    : clock_(std::move(clock))
{
    if (!clock_) {
        throw std::invalid_argument("MemoryCertificateRegistry: clock cannot be empty");
    }
}

// =============================================================================
// Schema
// =============================================================================

void MemoryCertificateRegistry::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);
    schemaVersion_ = latestSchemaVersion();
    spdlog::info("[MemoryCertificateRegistry] Initialized (schema version {}, not persistent)",
                 schemaVersion_);
}

int MemoryCertificateRegistry::schemaVersion() {
    std::lock_guard<std::mutex> lock(mutex_);
    return schemaVersion_;
}

// =============================================================================
// Atomic commands
// =============================================================================

void MemoryCertificateRegistry::issueCertificate(const CertificateRecord& record,
                                                 const std::optional<std::string>& supersedesId,
                                                 const AuditEntry& audit) {
    std::lock_guard<std::mutex> lock(mutex_);

    // Validate everything before the first write
    if (certificates_.count(record.id)) {
        throw common::ConflictException("Certificate id already exists", record.id);
    }

    auto keyIt = keys_.find(record.signatureKeyId);
    if (keyIt == keys_.end()) {
        throw common::NotFoundException("CA key", record.signatureKeyId);
    }

    const CertificateIdentity identity = record.identity();
    CertificateRecord* prior = nullptr;

    if (supersedesId) {
        auto priorIt = certificates_.find(*supersedesId);
        if (priorIt == certificates_.end()) {
            throw common::NotFoundException("Certificate", *supersedesId);
        }
        prior = &priorIt->second;
        if (prior->status != CertificateStatus::ACTIVE) {
            throw common::ConflictException(
                "Superseded certificate is not active",
                *supersedesId + " is " + certificateStatusToString(prior->status));
        }
        if (!(prior->identity() == identity)) {
            throw common::ConflictException(
                "Superseded certificate belongs to a different identity",
                prior->identity().toString() + " != " + identity.toString());
        }
    }

    auto liveIt = liveIndex_.find(identity);
    if (liveIt != liveIndex_.end() && (!supersedesId || liveIt->second != *supersedesId)) {
        throw common::ConflictException("A live certificate already exists for this identity",
                                        identity.toString() + " -> " + liveIt->second);
    }

    // Writes
    if (prior) {
        prior->status = CertificateStatus::SUPERSEDED;
        prior->updatedAt = record.createdAt;
        liveIndex_.erase(identity);
    }

    certificates_[record.id] = record;
    if (record.status != CertificateStatus::SUPERSEDED) {
        liveIndex_[identity] = record.id;
    }
    keyIt->second.certificatesSigned++;

    appendAuditLocked(audit);
}

RevocationResult MemoryCertificateRegistry::revokeCertificate(const RevocationRecord& revocation,
                                                              const AuditEntry& audit) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto certIt = certificates_.find(revocation.certificateId);
    if (certIt == certificates_.end()) {
        throw common::NotFoundException("Certificate", revocation.certificateId);
    }

    auto existing = revocations_.find(revocation.certificateId);
    if (existing != revocations_.end()) {
        return RevocationResult{existing->second, false};
    }

    CertificateRecord& cert = certIt->second;
    // A superseded record stays superseded so its successor keeps the identity
    if (cert.status != CertificateStatus::SUPERSEDED) {
        cert.status = CertificateStatus::REVOKED;
    }
    cert.revokedAt = revocation.revokedAt;
    cert.revocationReason = revocation.reason;
    cert.updatedAt = revocation.revokedAt;

    revocations_[revocation.certificateId] = revocation;
    ocspCache_.erase(revocation.certificateId);
    appendAuditLocked(audit);

    return RevocationResult{revocation, true};
}

void MemoryCertificateRegistry::activateKey(const CaKeyRecord& key, const AuditEntry& audit) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (keys_.count(key.id)) {
        throw common::ConflictException("CA key id already exists", key.id);
    }

    for (auto& entry : keys_) {
        if (entry.second.status == KeyStatus::ACTIVE) {
            entry.second.status = KeyStatus::ROTATED;
            entry.second.rotatedAt = key.createdAt;
        }
    }

    CaKeyRecord active = key;
    active.status = KeyStatus::ACTIVE;
    keys_[active.id] = active;

    appendAuditLocked(audit);
}

// =============================================================================
// Certificates
// =============================================================================

std::optional<CertificateRecord> MemoryCertificateRegistry::findCertificate(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = certificates_.find(id);
    if (it == certificates_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<CertificateRecord> MemoryCertificateRegistry::findLiveCertificate(
    const CertificateIdentity& identity) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = liveIndex_.find(identity);
    if (it == liveIndex_.end()) {
        return std::nullopt;
    }
    return certificates_.at(it->second);
}

std::vector<CertificateRecord> MemoryCertificateRegistry::selectLocked(
    const std::function<bool(const CertificateRecord&)>& pred) const {
    std::vector<CertificateRecord> out;
    for (const auto& entry : certificates_) {
        if (pred(entry.second)) {
            out.push_back(entry.second);
        }
    }
    return out;
}

std::vector<CertificateRecord> MemoryCertificateRegistry::listByAgent(const std::string& agentId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto out = selectLocked([&](const CertificateRecord& c) { return c.agentId == agentId; });
    std::sort(out.begin(), out.end(), [](const CertificateRecord& a, const CertificateRecord& b) {
        return a.issuedAt > b.issuedAt;
    });
    return out;
}

std::vector<CertificateRecord> MemoryCertificateRegistry::listByOrg(const std::string& orgId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto out = selectLocked([&](const CertificateRecord& c) { return c.orgId == orgId; });
    std::sort(out.begin(), out.end(), [](const CertificateRecord& a, const CertificateRecord& b) {
        return a.issuedAt > b.issuedAt;
    });
    return out;
}

std::vector<CertificateRecord> MemoryCertificateRegistry::findActiveExpiringBetween(
    const TimePoint& from, const TimePoint& to) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto out = selectLocked([&](const CertificateRecord& c) {
        return c.status == CertificateStatus::ACTIVE && c.expiresAt >= from && c.expiresAt < to;
    });
    std::sort(out.begin(), out.end(), [](const CertificateRecord& a, const CertificateRecord& b) {
        return a.expiresAt < b.expiresAt;
    });
    return out;
}

// =============================================================================
// Revocations
// =============================================================================

std::optional<RevocationRecord> MemoryCertificateRegistry::findRevocation(const std::string& certificateId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = revocations_.find(certificateId);
    if (it == revocations_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<RevocationRecord> MemoryCertificateRegistry::listRevocations() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<RevocationRecord> out;
    out.reserve(revocations_.size());
    for (const auto& entry : revocations_) {
        out.push_back(entry.second);
    }
    std::sort(out.begin(), out.end(), [](const RevocationRecord& a, const RevocationRecord& b) {
        return a.revokedAt < b.revokedAt;
    });
    return out;
}

// =============================================================================
// CA keys
// =============================================================================

std::optional<CaKeyRecord> MemoryCertificateRegistry::getActiveKey() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& entry : keys_) {
        if (entry.second.status == KeyStatus::ACTIVE) {
            return entry.second;
        }
    }
    return std::nullopt;
}

std::optional<CaKeyRecord> MemoryCertificateRegistry::findKey(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = keys_.find(id);
    if (it == keys_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<CaKeyRecord> MemoryCertificateRegistry::listKeys() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<CaKeyRecord> out;
    for (const auto& entry : keys_) {
        out.push_back(entry.second);
    }
    std::sort(out.begin(), out.end(), [](const CaKeyRecord& a, const CaKeyRecord& b) {
        return a.createdAt < b.createdAt;
    });
    return out;
}

// =============================================================================
// OCSP cache
// =============================================================================

std::optional<OcspCacheEntry> MemoryCertificateRegistry::findOcspCache(const std::string& certificateId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = ocspCache_.find(certificateId);
    if (it == ocspCache_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void MemoryCertificateRegistry::upsertOcspCache(const OcspCacheEntry& entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    ocspCache_[entry.certificateId] = entry;
}

void MemoryCertificateRegistry::deleteOcspCache(const std::string& certificateId) {
    std::lock_guard<std::mutex> lock(mutex_);
    ocspCache_.erase(certificateId);
}

// =============================================================================
// Append-only logs
// =============================================================================

int64_t MemoryCertificateRegistry::appendVerification(const VerificationHistoryRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    VerificationHistoryRecord stored = record;
    stored.id = nextVerificationId_++;
    verifications_.push_back(stored);
    return stored.id;
}

std::vector<VerificationHistoryRecord> MemoryCertificateRegistry::listVerifications(
    const std::string& certificateId, int limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<VerificationHistoryRecord> out;
    for (auto it = verifications_.rbegin(); it != verifications_.rend(); ++it) {
        if (static_cast<int>(out.size()) >= limit) break;
        if (it->certificateId && *it->certificateId == certificateId) {
            out.push_back(*it);
        }
    }
    return out;
}

int64_t MemoryCertificateRegistry::recordAudit(const AuditEntry& entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    return appendAuditLocked(entry);
}

int64_t MemoryCertificateRegistry::appendAuditLocked(const AuditEntry& entry) {
    AuditLogRecord record;
    record.id = nextAuditId_++;
    record.timestamp = clock_();
    record.entry = entry;
    audit_.push_back(record);
    return record.id;
}

std::vector<AuditLogRecord> MemoryCertificateRegistry::listAudit(
    const std::optional<std::string>& resourceId, int limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<AuditLogRecord> out;
    for (auto it = audit_.rbegin(); it != audit_.rend(); ++it) {
        if (static_cast<int>(out.size()) >= limit) break;
        if (!resourceId || it->entry.resourceId == resourceId) {
            out.push_back(*it);
        }
    }
    return out;
}

} // namespace repositories

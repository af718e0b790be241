/**
 * @file certificate.h
 * @brief Domain model for CGA certificate records
 *
 * A CertificateRecord is the persisted form of a signed CGA certificate.
 * Timestamps are held at millisecond precision so they survive the
 * ISO 8601 round trip through storage unchanged.
 *
 * @author SmartCore Inc.
 * @date 2026-02-01
 */

#pragma once

#include <cga/utils/time_utils.h>

#include <optional>
#include <string>
#include <json/json.h>

namespace domain {
namespace models {

using cga::utils::TimePoint;

enum class CertificateLevel {
    BRONZE,
    SILVER,
    GOLD,
    PLATINUM
};

enum class CertificateStatus {
    ACTIVE,
    REVOKED,
    EXPIRED,
    SUPERSEDED
};

std::string certificateLevelToString(CertificateLevel level);

/**
 * @brief Parse level name (case-insensitive)
 */
std::optional<CertificateLevel> parseCertificateLevel(const std::string& name);

/**
 * @brief Ordering BRONZE < SILVER < GOLD < PLATINUM
 */
inline int levelRank(CertificateLevel level) {
    return static_cast<int>(level);
}

/**
 * @brief Default validity period in days for a level
 *
 * BRONZE 30, SILVER 90, GOLD 180, PLATINUM 365
 */
int defaultValidityDays(CertificateLevel level);

std::string certificateStatusToString(CertificateStatus status);

std::optional<CertificateStatus> parseCertificateStatus(const std::string& name);

/**
 * @brief (agentId, agentVersion, orgId): unique among non-superseded certificates
 */
struct CertificateIdentity {
    std::string agentId;
    std::string agentVersion;
    std::string orgId;

    bool operator==(const CertificateIdentity& other) const {
        return agentId == other.agentId && agentVersion == other.agentVersion && orgId == other.orgId;
    }

    bool operator<(const CertificateIdentity& other) const {
        if (agentId != other.agentId) return agentId < other.agentId;
        if (agentVersion != other.agentVersion) return agentVersion < other.agentVersion;
        return orgId < other.orgId;
    }

    std::string toString() const {
        return agentId + "@" + agentVersion + "/" + orgId;
    }
};

struct CertificateRecord {
    std::string id;  // "cga-" + UUID

    // Subject
    std::string agentId;
    std::string agentVersion;
    std::string orgId;
    std::string orgName;
    std::optional<std::string> orgDomain;

    CertificateLevel level = CertificateLevel::BRONZE;

    // Content integrity anchor: "sha256:<hex>" of certificateContent
    std::string goldenThreadHash;
    std::string goldenThreadAlgorithm = "SHA-256";

    TimePoint issuedAt;
    TimePoint expiresAt;

    // Canonical JSON document that was signed
    std::string certificateContent;

    std::string signatureAlgorithm;
    std::string signatureKeyId;
    std::string signatureValue;  // base64

    CertificateStatus status = CertificateStatus::ACTIVE;
    std::optional<TimePoint> revokedAt;
    std::optional<std::string> revocationReason;

    // Renewal lineage
    std::optional<std::string> supersedesId;

    TimePoint createdAt;
    TimePoint updatedAt;

    CertificateIdentity identity() const {
        return CertificateIdentity{agentId, agentVersion, orgId};
    }

    bool isExpiredAt(const TimePoint& now) const {
        return now >= expiresAt;
    }

    Json::Value toJson() const;
};

} // namespace models
} // namespace domain

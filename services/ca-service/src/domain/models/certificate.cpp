/**
 * @file certificate.cpp
 * @brief Implementation of CertificateRecord domain model
 */

#include "certificate.h"

#include <cga/utils/string_utils.h>

namespace domain {
namespace models {

std::string certificateLevelToString(CertificateLevel level) {
    switch (level) {
        case CertificateLevel::BRONZE: return "BRONZE";
        case CertificateLevel::SILVER: return "SILVER";
        case CertificateLevel::GOLD: return "GOLD";
        case CertificateLevel::PLATINUM: return "PLATINUM";
    }
    return "BRONZE";
}

std::optional<CertificateLevel> parseCertificateLevel(const std::string& name) {
    std::string upper = cga::utils::toUpper(cga::utils::trim(name));
    if (upper == "BRONZE") return CertificateLevel::BRONZE;
    if (upper == "SILVER") return CertificateLevel::SILVER;
    if (upper == "GOLD") return CertificateLevel::GOLD;
    if (upper == "PLATINUM") return CertificateLevel::PLATINUM;
    return std::nullopt;
}

int defaultValidityDays(CertificateLevel level) {
    switch (level) {
        case CertificateLevel::BRONZE: return 30;
        case CertificateLevel::SILVER: return 90;
        case CertificateLevel::GOLD: return 180;
        case CertificateLevel::PLATINUM: return 365;
    }
    return 30;
}

std::string certificateStatusToString(CertificateStatus status) {
    switch (status) {
        case CertificateStatus::ACTIVE: return "active";
        case CertificateStatus::REVOKED: return "revoked";
        case CertificateStatus::EXPIRED: return "expired";
        case CertificateStatus::SUPERSEDED: return "superseded";
    }
    return "active";
}

std::optional<CertificateStatus> parseCertificateStatus(const std::string& name) {
    if (name == "active") return CertificateStatus::ACTIVE;
    if (name == "revoked") return CertificateStatus::REVOKED;
    if (name == "expired") return CertificateStatus::EXPIRED;
    if (name == "superseded") return CertificateStatus::SUPERSEDED;
    return std::nullopt;
}

Json::Value CertificateRecord::toJson() const {
    using cga::utils::formatIso8601;

    Json::Value json;
    json["id"] = id;

    // Subject
    json["agentId"] = agentId;
    json["agentVersion"] = agentVersion;
    json["orgId"] = orgId;
    json["orgName"] = orgName;
    if (orgDomain) json["orgDomain"] = *orgDomain;

    json["level"] = certificateLevelToString(level);
    json["goldenThreadHash"] = goldenThreadHash;
    json["goldenThreadAlgorithm"] = goldenThreadAlgorithm;
    json["issuedAt"] = formatIso8601(issuedAt);
    json["expiresAt"] = formatIso8601(expiresAt);
    json["certificateContent"] = certificateContent;

    // Signature
    json["signatureAlgorithm"] = signatureAlgorithm;
    json["signatureKeyId"] = signatureKeyId;
    json["signatureValue"] = signatureValue;

    json["status"] = certificateStatusToString(status);
    if (revokedAt) json["revokedAt"] = formatIso8601(*revokedAt);
    if (revocationReason) json["revocationReason"] = *revocationReason;
    if (supersedesId) json["supersedesId"] = *supersedesId;

    json["createdAt"] = formatIso8601(createdAt);
    json["updatedAt"] = formatIso8601(updatedAt);

    return json;
}

} // namespace models
} // namespace domain

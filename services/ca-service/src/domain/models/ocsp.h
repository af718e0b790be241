/**
 * @file ocsp.h
 * @brief Domain model for OCSP-style status responses
 *
 * Wire encoding belongs to the transport layer; these types carry the
 * response semantics and a canonical JSON form used for signing and caching.
 *
 * @author SmartCore Inc.
 * @date 2026-02-03
 */

#pragma once

#include "revocation.h"

#include <cga/utils/time_utils.h>

#include <optional>
#include <string>
#include <vector>
#include <json/json.h>

namespace domain {
namespace models {

using cga::utils::TimePoint;

/**
 * @brief Per-certificate status, highest precedence first:
 *        REVOKED > EXPIRED > UNKNOWN > GOOD
 */
enum class CertStatus {
    GOOD,
    REVOKED,
    EXPIRED,
    UNKNOWN
};

std::string certStatusToString(CertStatus status);

std::optional<CertStatus> parseCertStatus(const std::string& name);

enum class OcspResponseStatus {
    SUCCESSFUL = 0,
    MALFORMED_REQUEST = 1,
    INTERNAL_ERROR = 2
};

std::string ocspResponseStatusToString(OcspResponseStatus status);

struct SingleResponse {
    std::string certificateId;
    CertStatus certStatus = CertStatus::UNKNOWN;
    TimePoint thisUpdate;
    TimePoint nextUpdate;
    std::optional<TimePoint> revocationTime;
    std::optional<std::string> revocationReason;

    bool operator==(const SingleResponse& other) const {
        return certificateId == other.certificateId && certStatus == other.certStatus &&
               thisUpdate == other.thisUpdate && nextUpdate == other.nextUpdate &&
               revocationTime == other.revocationTime && revocationReason == other.revocationReason;
    }

    Json::Value toJson() const;

    /**
     * @brief Rebuild from toJson() output (used for cached response bytes)
     * @return std::nullopt if required fields are missing or malformed
     */
    static std::optional<SingleResponse> fromJson(const Json::Value& json);
};

/**
 * @brief Single cached response per certificate
 *
 * Valid only while thisUpdate <= now < nextUpdate.
 */
struct OcspCacheEntry {
    std::string certificateId;
    std::string responseBytes;  // compact JSON of a SingleResponse
    TimePoint producedAt;
    TimePoint thisUpdate;
    TimePoint nextUpdate;

    bool isValidAt(const TimePoint& now) const {
        return thisUpdate <= now && now < nextUpdate;
    }
};

/**
 * @brief Signed batch response
 */
struct OcspResponse {
    OcspResponseStatus responseStatus = OcspResponseStatus::SUCCESSFUL;
    TimePoint producedAt;
    std::vector<SingleResponse> responses;
    std::string signatureAlgorithm;
    std::string signatureKeyId;
    std::string signature;  // base64, empty when unsigned (malformed request)

    /**
     * @brief Canonical bytes covered by the signature:
     *        compact JSON of {producedAt, responseStatus, responses}
     */
    std::string signedPayload() const;

    Json::Value toJson() const;
};

/**
 * @brief CRL-style listing of every revoked certificate
 */
struct RevocationList {
    std::string issuerId;
    std::string issuerKeyId;  // signing key, not covered by the signature
    TimePoint thisUpdate;
    TimePoint nextUpdate;
    std::vector<RevocationRecord> revokedCertificates;
    std::string signatureAlgorithm;
    std::string signature;

    /**
     * @brief Canonical bytes covered by the signature
     */
    std::string signedPayload() const;

    Json::Value toJson() const;
};

} // namespace models
} // namespace domain

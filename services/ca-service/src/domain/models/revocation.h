/**
 * @file revocation.h
 * @brief Domain model for certificate revocations
 */

#pragma once

#include <cga/utils/time_utils.h>

#include <optional>
#include <string>
#include <json/json.h>

namespace domain {
namespace models {

using cga::utils::TimePoint;

/**
 * @brief One revocation per certificate (1:1 with the revoked record)
 */
struct RevocationRecord {
    std::string certificateId;
    TimePoint revokedAt;
    std::string reason;
    std::string revokedBy;  // actor spec, e.g. "admin:alice"
    std::optional<std::string> incidentId;

    bool operator==(const RevocationRecord& other) const {
        return certificateId == other.certificateId && revokedAt == other.revokedAt &&
               reason == other.reason && revokedBy == other.revokedBy &&
               incidentId == other.incidentId;
    }

    Json::Value toJson() const;
};

/**
 * @brief Outcome of an idempotent revoke
 *
 * created=false means the certificate was already revoked and `record`
 * is the existing, unchanged RevocationRecord.
 */
struct RevocationResult {
    RevocationRecord record;
    bool created = false;
};

} // namespace models
} // namespace domain

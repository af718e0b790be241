/**
 * @file revocation.cpp
 * @brief Implementation of RevocationRecord domain model
 */

#include "revocation.h"

namespace domain {
namespace models {

Json::Value RevocationRecord::toJson() const {
    Json::Value json;
    json["certificateId"] = certificateId;
    json["revokedAt"] = cga::utils::formatIso8601(revokedAt);
    json["reason"] = reason;
    json["revokedBy"] = revokedBy;
    if (incidentId) json["incidentId"] = *incidentId;
    return json;
}

} // namespace models
} // namespace domain

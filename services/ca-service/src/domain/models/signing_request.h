/**
 * @file signing_request.h
 * @brief Certificate signing request payload
 *
 * @author SmartCore Inc.
 * @date 2026-02-03
 */

#pragma once

#include "certificate.h"

#include <optional>
#include <string>
#include <json/json.h>

namespace domain {
namespace models {

struct SigningRequest {
    std::string agentId;
    std::string agentVersion;
    std::string orgId;
    std::string orgName;
    std::optional<std::string> orgDomain;

    CertificateLevel level = CertificateLevel::BRONZE;

    // Attested governance document, embedded verbatim in the certificate
    Json::Value attestation;

    // Falls back to defaultValidityDays(level)
    std::optional<int> validityDays;

    // Set only when renewing: id of the live record being replaced
    std::optional<std::string> supersedesId;

    /**
     * @brief Check request shape
     * @throws common::ValidationException naming the first offending field
     */
    void validate() const;

    int effectiveValidityDays() const {
        return validityDays ? *validityDays : defaultValidityDays(level);
    }

    /**
     * @brief Parse a request body
     *
     * Expected members: agentId, agentVersion, orgId, orgName, level,
     * attestation; optional orgDomain, validityDays, supersedesId.
     *
     * @throws common::ValidationException on missing or ill-typed members
     */
    static SigningRequest fromJson(const Json::Value& json);

    Json::Value toJson() const;
};

} // namespace models
} // namespace domain

/**
 * @file revocation_manager.h
 * @brief Certificate revocation
 *
 * @author SmartCore Inc.
 * @date 2026-02-04
 */

#pragma once

#include "../common/clock.h"
#include "../domain/models/revocation.h"
#include "../repositories/certificate_registry.h"

#include <optional>
#include <string>
#include <vector>
#include <json/json.h>

namespace services {

struct RevocationRequest {
    std::string certificateId;
    std::string reason;
    std::string revokedBy;  // actor spec, e.g. "admin:alice"
    std::optional<std::string> incidentId;
};

struct RevocationOutcome {
    std::string certificateId;
    bool success = false;
    bool created = false;
    std::optional<domain::models::RevocationRecord> record;
    std::string error;

    Json::Value toJson() const;
};

struct RevocationBatchResult {
    std::vector<RevocationOutcome> items;
    int succeeded = 0;
    int failed = 0;

    Json::Value toJson() const;
};

/**
 * @brief Marks certificates revoked
 *
 * Revocation is terminal and idempotent: revoking an already-revoked
 * certificate returns the original RevocationRecord unchanged. Superseded
 * and expired certificates may still be revoked.
 */
class RevocationManager {
public:
    /**
     * @param registry Certificate registry (non-owning)
     * @throws std::invalid_argument if registry is nullptr
     */
    explicit RevocationManager(repositories::ICertificateRegistry* registry,
                               common::Clock clock = common::systemClock());

    /**
     * @throws common::ValidationException empty id, reason or actor
     * @throws common::NotFoundException unknown certificate
     */
    domain::models::RevocationResult revoke(const std::string& certificateId,
                                            const std::string& reason,
                                            const std::string& revokedBy,
                                            const std::optional<std::string>& incidentId = std::nullopt);

    domain::models::RevocationResult revoke(const RevocationRequest& request) {
        return revoke(request.certificateId, request.reason, request.revokedBy, request.incidentId);
    }

    /**
     * @brief Revoke each item independently; one failure never blocks the rest
     */
    RevocationBatchResult revokeBatch(const std::vector<RevocationRequest>& items);

private:
    repositories::ICertificateRegistry* registry_;
    common::Clock clock_;
};

} // namespace services

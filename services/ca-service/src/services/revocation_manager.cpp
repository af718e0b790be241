/**
 * @file revocation_manager.cpp
 * @brief RevocationManager implementation
 */

#include "revocation_manager.h"
#include "../domain/models/audit_log.h"
#include "exceptions.h"

#include <cga/utils/string_utils.h>

#include <spdlog/spdlog.h>
#include <stdexcept>

namespace services {

using namespace domain::models;

Json::Value RevocationOutcome::toJson() const {
    Json::Value json;
    json["certificateId"] = certificateId;
    json["success"] = success;
    if (success) {
        json["created"] = created;
        if (record) json["revocation"] = record->toJson();
    } else {
        json["error"] = error;
    }
    return json;
}

Json::Value RevocationBatchResult::toJson() const {
    Json::Value json;
    json["succeeded"] = succeeded;
    json["failed"] = failed;
    json["items"] = Json::Value(Json::arrayValue);
    for (const auto& item : items) {
        json["items"].append(item.toJson());
    }
    return json;
}

RevocationManager::RevocationManager(repositories::ICertificateRegistry* registry, common::Clock clock)
    : registry_(registry)
    , clock_(std::move(clock))
{
    if (!registry_) {
        throw std::invalid_argument("RevocationManager: registry cannot be nullptr");
    }
}

RevocationResult RevocationManager::revoke(const std::string& certificateId,
                                           const std::string& reason,
                                           const std::string& revokedBy,
                                           const std::optional<std::string>& incidentId) {
    if (cga::utils::trim(certificateId).empty()) {
        throw common::ValidationException("certificateId", "certificateId is required");
    }
    if (cga::utils::trim(reason).empty()) {
        throw common::ValidationException("reason", "revocation reason is required");
    }
    if (cga::utils::trim(revokedBy).empty()) {
        throw common::ValidationException("revokedBy", "revoking actor is required");
    }

    RevocationRecord revocation;
    revocation.certificateId = certificateId;
    revocation.revokedAt = clock_();
    revocation.reason = reason;
    revocation.revokedBy = revokedBy;
    if (incidentId && !incidentId->empty()) {
        revocation.incidentId = incidentId;
    }

    AuditEntry audit;
    audit.actor = AuditActor::parse(revokedBy);
    audit.action = "certificate_revoked";
    audit.resourceType = "certificate";
    audit.resourceId = certificateId;
    audit.details["reason"] = reason;
    if (revocation.incidentId) {
        audit.details["incidentId"] = *revocation.incidentId;
    }

    RevocationResult result = registry_->revokeCertificate(revocation, audit);

    if (result.created) {
        spdlog::info("[RevocationManager] Revoked {} (reason={}, by={})", certificateId, reason, revokedBy);
    } else {
        spdlog::info("[RevocationManager] {} already revoked at {}; returning existing record",
                     certificateId, cga::utils::formatIso8601(result.record.revokedAt));
    }
    return result;
}

RevocationBatchResult RevocationManager::revokeBatch(const std::vector<RevocationRequest>& items) {
    RevocationBatchResult batch;

    for (const auto& item : items) {
        RevocationOutcome outcome;
        outcome.certificateId = item.certificateId;
        try {
            RevocationResult result = revoke(item);
            outcome.success = true;
            outcome.created = result.created;
            outcome.record = result.record;
            batch.succeeded++;
        } catch (const std::exception& e) {
            spdlog::error("[RevocationManager] Batch revoke of {} failed: {}", item.certificateId, e.what());
            outcome.error = e.what();
            batch.failed++;
        }
        batch.items.push_back(outcome);
    }

    spdlog::info("[RevocationManager] Batch revoke: {} succeeded, {} failed", batch.succeeded, batch.failed);
    return batch;
}

} // namespace services

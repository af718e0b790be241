/**
 * @file verification.cpp
 * @brief Implementation of verification history domain model
 */

#include "verification.h"

namespace domain {
namespace models {

std::string verificationResultToString(VerificationResult result) {
    switch (result) {
        case VerificationResult::VALID: return "valid";
        case VerificationResult::INVALID: return "invalid";
        case VerificationResult::REVOKED: return "revoked";
        case VerificationResult::EXPIRED: return "expired";
        case VerificationResult::UNKNOWN: return "unknown";
    }
    return "unknown";
}

std::optional<VerificationResult> parseVerificationResult(const std::string& name) {
    if (name == "valid") return VerificationResult::VALID;
    if (name == "invalid") return VerificationResult::INVALID;
    if (name == "revoked") return VerificationResult::REVOKED;
    if (name == "expired") return VerificationResult::EXPIRED;
    if (name == "unknown") return VerificationResult::UNKNOWN;
    return std::nullopt;
}

Json::Value VerificationHistoryRecord::toJson() const {
    Json::Value json;
    json["id"] = Json::Int64(id);
    if (certificateId) json["certificateId"] = *certificateId;
    json["agentId"] = agentId;
    if (context.requestId) json["requestId"] = *context.requestId;
    if (context.requestIp) json["requestIp"] = *context.requestIp;
    if (context.requestAction) json["requestAction"] = *context.requestAction;
    json["requestTimestamp"] = cga::utils::formatIso8601(requestTimestamp);
    json["result"] = verificationResultToString(result);
    json["resultDetails"] = resultDetails;
    json["durationMs"] = Json::Int64(durationMs);
    return json;
}

} // namespace models
} // namespace domain

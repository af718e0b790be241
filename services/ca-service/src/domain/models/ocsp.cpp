/**
 * @file ocsp.cpp
 * @brief Implementation of OCSP response domain model
 */

#include "ocsp.h"
#include "../../common/json_utils.h"

namespace domain {
namespace models {

using cga::utils::formatIso8601;
using cga::utils::parseIso8601;

std::string certStatusToString(CertStatus status) {
    switch (status) {
        case CertStatus::GOOD: return "good";
        case CertStatus::REVOKED: return "revoked";
        case CertStatus::EXPIRED: return "expired";
        case CertStatus::UNKNOWN: return "unknown";
    }
    return "unknown";
}

std::optional<CertStatus> parseCertStatus(const std::string& name) {
    if (name == "good") return CertStatus::GOOD;
    if (name == "revoked") return CertStatus::REVOKED;
    if (name == "expired") return CertStatus::EXPIRED;
    if (name == "unknown") return CertStatus::UNKNOWN;
    return std::nullopt;
}

std::string ocspResponseStatusToString(OcspResponseStatus status) {
    switch (status) {
        case OcspResponseStatus::SUCCESSFUL: return "successful";
        case OcspResponseStatus::MALFORMED_REQUEST: return "malformedRequest";
        case OcspResponseStatus::INTERNAL_ERROR: return "internalError";
    }
    return "internalError";
}

// =============================================================================
// SingleResponse
// =============================================================================

Json::Value SingleResponse::toJson() const {
    Json::Value json;
    json["certificateId"] = certificateId;
    json["certStatus"] = certStatusToString(certStatus);
    json["thisUpdate"] = formatIso8601(thisUpdate);
    json["nextUpdate"] = formatIso8601(nextUpdate);
    if (revocationTime) json["revocationTime"] = formatIso8601(*revocationTime);
    if (revocationReason) json["revocationReason"] = *revocationReason;
    return json;
}

std::optional<SingleResponse> SingleResponse::fromJson(const Json::Value& json) {
    if (!json.isObject() || !json["certificateId"].isString() || !json["certStatus"].isString() ||
        !json["thisUpdate"].isString() || !json["nextUpdate"].isString()) {
        return std::nullopt;
    }

    auto status = parseCertStatus(json["certStatus"].asString());
    auto thisUpdate = parseIso8601(json["thisUpdate"].asString());
    auto nextUpdate = parseIso8601(json["nextUpdate"].asString());
    if (!status || !thisUpdate || !nextUpdate) {
        return std::nullopt;
    }

    SingleResponse sr;
    sr.certificateId = json["certificateId"].asString();
    sr.certStatus = *status;
    sr.thisUpdate = *thisUpdate;
    sr.nextUpdate = *nextUpdate;

    if (json["revocationTime"].isString()) {
        sr.revocationTime = parseIso8601(json["revocationTime"].asString());
        if (!sr.revocationTime) {
            return std::nullopt;
        }
    }
    if (json["revocationReason"].isString()) {
        sr.revocationReason = json["revocationReason"].asString();
    }
    return sr;
}

// =============================================================================
// OcspResponse
// =============================================================================

std::string OcspResponse::signedPayload() const {
    Json::Value payload;
    payload["producedAt"] = formatIso8601(producedAt);
    payload["responseStatus"] = ocspResponseStatusToString(responseStatus);
    payload["responses"] = Json::Value(Json::arrayValue);
    for (const auto& r : responses) {
        payload["responses"].append(r.toJson());
    }
    return common::toCompactJson(payload);
}

Json::Value OcspResponse::toJson() const {
    Json::Value json;
    json["responseStatus"] = ocspResponseStatusToString(responseStatus);
    json["producedAt"] = formatIso8601(producedAt);
    json["responses"] = Json::Value(Json::arrayValue);
    for (const auto& r : responses) {
        json["responses"].append(r.toJson());
    }
    if (!signature.empty()) {
        json["signatureAlgorithm"] = signatureAlgorithm;
        json["signatureKeyId"] = signatureKeyId;
        json["signature"] = signature;
    }
    return json;
}

// =============================================================================
// RevocationList
// =============================================================================

std::string RevocationList::signedPayload() const {
    Json::Value payload;
    payload["issuerId"] = issuerId;
    payload["thisUpdate"] = formatIso8601(thisUpdate);
    payload["nextUpdate"] = formatIso8601(nextUpdate);
    payload["revokedCertificates"] = Json::Value(Json::arrayValue);
    for (const auto& r : revokedCertificates) {
        payload["revokedCertificates"].append(r.toJson());
    }
    return common::toCompactJson(payload);
}

Json::Value RevocationList::toJson() const {
    auto json = common::parseJson(signedPayload()).value_or(Json::Value(Json::objectValue));
    json["issuerKeyId"] = issuerKeyId;
    json["signatureAlgorithm"] = signatureAlgorithm;
    json["signature"] = signature;
    return json;
}

} // namespace models
} // namespace domain

/**
 * @file signing_request.cpp
 * @brief SigningRequest parsing and validation
 */

#include "signing_request.h"
#include "exceptions.h"

#include <cga/utils/string_utils.h>

namespace domain {
namespace models {

namespace {

void requireNonEmpty(const std::string& value, const std::string& field) {
    if (cga::utils::trim(value).empty()) {
        throw common::ValidationException(field, field + " is required");
    }
}

std::string requireString(const Json::Value& json, const std::string& field) {
    if (!json.isMember(field)) {
        throw common::ValidationException(field, field + " is required");
    }
    if (!json[field].isString()) {
        throw common::ValidationException(field, field + " must be a string");
    }
    return json[field].asString();
}

std::optional<std::string> optionalString(const Json::Value& json, const std::string& field) {
    if (!json.isMember(field) || json[field].isNull()) {
        return std::nullopt;
    }
    if (!json[field].isString()) {
        throw common::ValidationException(field, field + " must be a string");
    }
    return json[field].asString();
}

bool isEmptyDocument(const Json::Value& doc) {
    if (doc.isNull()) return true;
    if (doc.isString()) return doc.asString().empty();
    if (doc.isObject() || doc.isArray()) return doc.empty();
    return false;
}

} // anonymous namespace

void SigningRequest::validate() const {
    requireNonEmpty(agentId, "agentId");
    requireNonEmpty(agentVersion, "agentVersion");
    requireNonEmpty(orgId, "orgId");
    requireNonEmpty(orgName, "orgName");

    if (isEmptyDocument(attestation)) {
        throw common::ValidationException("attestation", "attestation document is empty");
    }
    if (validityDays && *validityDays <= 0) {
        throw common::ValidationException("validityDays", "validityDays must be positive");
    }
    if (supersedesId && supersedesId->empty()) {
        throw common::ValidationException("supersedesId", "supersedesId must not be empty");
    }
}

SigningRequest SigningRequest::fromJson(const Json::Value& json) {
    if (!json.isObject()) {
        throw common::ValidationException("body", "request body must be a JSON object");
    }

    SigningRequest req;
    req.agentId = requireString(json, "agentId");
    req.agentVersion = requireString(json, "agentVersion");
    req.orgId = requireString(json, "orgId");
    req.orgName = requireString(json, "orgName");
    req.orgDomain = optionalString(json, "orgDomain");

    std::string levelName = requireString(json, "level");
    auto level = parseCertificateLevel(levelName);
    if (!level) {
        throw common::ValidationException("level", "unknown certification level: " + levelName);
    }
    req.level = *level;

    if (!json.isMember("attestation")) {
        throw common::ValidationException("attestation", "attestation is required");
    }
    req.attestation = json["attestation"];

    if (json.isMember("validityDays") && !json["validityDays"].isNull()) {
        if (!json["validityDays"].isInt()) {
            throw common::ValidationException("validityDays", "validityDays must be an integer");
        }
        req.validityDays = json["validityDays"].asInt();
    }
    req.supersedesId = optionalString(json, "supersedesId");

    req.validate();
    return req;
}

Json::Value SigningRequest::toJson() const {
    Json::Value json;
    json["agentId"] = agentId;
    json["agentVersion"] = agentVersion;
    json["orgId"] = orgId;
    json["orgName"] = orgName;
    if (orgDomain) json["orgDomain"] = *orgDomain;
    json["level"] = certificateLevelToString(level);
    json["attestation"] = attestation;
    if (validityDays) json["validityDays"] = *validityDays;
    if (supersedesId) json["supersedesId"] = *supersedesId;
    return json;
}

} // namespace models
} // namespace domain

/**
 * @file certificate_content.cpp
 * @brief Canonical certificate document serialization
 */

#include "certificate_content.h"
#include "../../common/json_utils.h"

namespace domain {
namespace models {

using cga::utils::formatIso8601;
using cga::utils::parseIso8601;

Json::Value CertificateContent::toJson() const {
    Json::Value doc;
    doc["apiVersion"] = CGA_API_VERSION;
    doc["kind"] = CGA_CERTIFICATE_KIND;

    doc["metadata"]["id"] = id;
    doc["metadata"]["version"] = version;

    Json::Value& agent = doc["spec"]["agent"];
    agent["id"] = agentId;
    agent["version"] = agentVersion;
    agent["organization"]["id"] = orgId;
    agent["organization"]["name"] = orgName;
    if (orgDomain) {
        agent["organization"]["domain"] = *orgDomain;
    }

    doc["spec"]["attestation"]["document"] = attestation;

    Json::Value& certification = doc["spec"]["certification"];
    certification["level"] = certificateLevelToString(level);
    certification["issued_at"] = formatIso8601(issuedAt);
    certification["expires_at"] = formatIso8601(expiresAt);
    certification["issuer"]["id"] = issuerId;
    certification["issuer"]["name"] = issuerName;
    if (supersedesId) {
        certification["renewal"]["supersedes"] = *supersedesId;
    }

    return doc;
}

std::string CertificateContent::toCanonicalJson() const {
    return common::toCompactJson(toJson());
}

std::optional<CertificateContent> CertificateContent::parse(const std::string& canonical) {
    auto parsed = common::parseJson(canonical);
    if (!parsed || !parsed->isObject()) {
        return std::nullopt;
    }
    const Json::Value& doc = *parsed;
    if (doc["apiVersion"].asString() != CGA_API_VERSION || doc["kind"].asString() != CGA_CERTIFICATE_KIND) {
        return std::nullopt;
    }

    const Json::Value& agent = doc["spec"]["agent"];
    const Json::Value& certification = doc["spec"]["certification"];

    auto level = parseCertificateLevel(certification["level"].asString());
    auto issuedAt = parseIso8601(certification["issued_at"].asString());
    auto expiresAt = parseIso8601(certification["expires_at"].asString());
    if (!level || !issuedAt || !expiresAt) {
        return std::nullopt;
    }

    CertificateContent content;
    content.id = doc["metadata"]["id"].asString();
    content.version = doc["metadata"]["version"].isInt() ? doc["metadata"]["version"].asInt() : 1;
    content.agentId = agent["id"].asString();
    content.agentVersion = agent["version"].asString();
    content.orgId = agent["organization"]["id"].asString();
    content.orgName = agent["organization"]["name"].asString();
    if (agent["organization"]["domain"].isString()) {
        content.orgDomain = agent["organization"]["domain"].asString();
    }
    content.attestation = doc["spec"]["attestation"]["document"];
    content.level = *level;
    content.issuedAt = *issuedAt;
    content.expiresAt = *expiresAt;
    content.issuerId = certification["issuer"]["id"].asString();
    content.issuerName = certification["issuer"]["name"].asString();
    if (certification["renewal"]["supersedes"].isString()) {
        content.supersedesId = certification["renewal"]["supersedes"].asString();
    }
    return content;
}

} // namespace models
} // namespace domain

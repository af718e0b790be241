/**
 * @file certificate_content.h
 * @brief Canonical CGA certificate document
 *
 * The canonical form is compact JSON with object keys in lexicographic
 * order. Its SHA-256 is the golden thread hash and its bytes are what the
 * CA signs, so two builds of the same content must serialize identically.
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

constexpr const char* CGA_API_VERSION = "aigos.io/v1";
constexpr const char* CGA_CERTIFICATE_KIND = "CGACertificate";

struct CertificateContent {
    std::string id;
    int version = 1;

    std::string agentId;
    std::string agentVersion;
    std::string orgId;
    std::string orgName;
    std::optional<std::string> orgDomain;

    Json::Value attestation;

    CertificateLevel level = CertificateLevel::BRONZE;
    TimePoint issuedAt;
    TimePoint expiresAt;
    std::string issuerId;
    std::string issuerName;

    std::optional<std::string> supersedesId;

    Json::Value toJson() const;

    std::string toCanonicalJson() const;

    /**
     * @brief Read back a canonical document
     * @return std::nullopt if the document is not a CGA certificate
     */
    static std::optional<CertificateContent> parse(const std::string& canonical);
};

} // namespace models
} // namespace domain

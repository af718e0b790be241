/**
 * @file certificate_authority.h
 * @brief Core-facing CA contract
 *
 * Thin facade over the lifecycle components. Transport layers call this and
 * nothing below it.
 *
 * @author SmartCore Inc.
 * @date 2026-02-06
 */

#pragma once

#include "ocsp_responder.h"
#include "revocation_manager.h"
#include "signing_service.h"
#include "../domain/models/certificate.h"
#include "../domain/models/ocsp.h"
#include "../domain/models/signing_request.h"
#include "../repositories/certificate_registry.h"

#include <optional>
#include <string>
#include <vector>
#include <json/json.h>

namespace services {

class CertificateAuthority {
public:
    /**
     * @throws std::invalid_argument if any dependency is nullptr
     */
    CertificateAuthority(repositories::ICertificateRegistry* registry,
                         SigningService* signingService,
                         RevocationManager* revocationManager,
                         OcspResponder* ocspResponder);

    /**
     * @brief Issue a certificate
     * @throws common::ValidationException / ConflictException / KeyUnavailableException
     */
    domain::models::CertificateRecord submitSigningRequest(
        const domain::models::SigningRequest& request,
        const domain::models::AuditActor& actor = domain::models::AuditActor::system());

    /**
     * @brief Issue a certificate from a JSON request body
     */
    domain::models::CertificateRecord submitSigningRequest(
        const Json::Value& payload,
        const domain::models::AuditActor& actor = domain::models::AuditActor::system());

    std::vector<domain::models::SingleResponse> queryStatus(const std::vector<std::string>& certificateIds);

    domain::models::OcspResponse respond(const std::vector<std::string>& certificateIds);

    domain::models::RevocationRecord revoke(const std::string& certificateId,
                                            const std::string& reason,
                                            const std::string& actor,
                                            const std::optional<std::string>& incidentId = std::nullopt);

    std::optional<domain::models::CertificateRecord> getCertificate(const std::string& id);

    std::vector<domain::models::CertificateRecord> listByAgent(const std::string& agentId);

    std::vector<domain::models::CertificateRecord> listByOrg(const std::string& orgId);

    bool verifySignature(const domain::models::CertificateRecord& cert);

    /**
     * @brief Issuer identity and active key
     */
    PublicKeyInfo caInfo();

private:
    repositories::ICertificateRegistry* registry_;
    SigningService* signingService_;
    RevocationManager* revocationManager_;
    OcspResponder* ocspResponder_;
};

} // namespace services

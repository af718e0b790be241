/**
 * @file certificate_authority.cpp
 * @brief CertificateAuthority facade implementation
 */

#include "certificate_authority.h"

#include <stdexcept>

namespace services {

using namespace domain::models;

CertificateAuthority::CertificateAuthority(repositories::ICertificateRegistry* registry,
                                           SigningService* signingService,
                                           RevocationManager* revocationManager,
                                           OcspResponder* ocspResponder)
    : registry_(registry)
    , signingService_(signingService)
    , revocationManager_(revocationManager)
    , ocspResponder_(ocspResponder)
{
    if (!registry_ || !signingService_ || !revocationManager_ || !ocspResponder_) {
        throw std::invalid_argument("CertificateAuthority: dependencies cannot be nullptr");
    }
}

CertificateRecord CertificateAuthority::submitSigningRequest(const SigningRequest& request,
                                                             const AuditActor& actor) {
    return signingService_->sign(request, actor);
}

CertificateRecord CertificateAuthority::submitSigningRequest(const Json::Value& payload,
                                                             const AuditActor& actor) {
    return signingService_->sign(SigningRequest::fromJson(payload), actor);
}

std::vector<SingleResponse> CertificateAuthority::queryStatus(const std::vector<std::string>& certificateIds) {
    return ocspResponder_->queryStatus(certificateIds);
}

OcspResponse CertificateAuthority::respond(const std::vector<std::string>& certificateIds) {
    return ocspResponder_->respond(certificateIds);
}

RevocationRecord CertificateAuthority::revoke(const std::string& certificateId,
                                              const std::string& reason,
                                              const std::string& actor,
                                              const std::optional<std::string>& incidentId) {
    return revocationManager_->revoke(certificateId, reason, actor, incidentId).record;
}

std::optional<CertificateRecord> CertificateAuthority::getCertificate(const std::string& id) {
    return registry_->findCertificate(id);
}

std::vector<CertificateRecord> CertificateAuthority::listByAgent(const std::string& agentId) {
    return registry_->listByAgent(agentId);
}

std::vector<CertificateRecord> CertificateAuthority::listByOrg(const std::string& orgId) {
    return registry_->listByOrg(orgId);
}

bool CertificateAuthority::verifySignature(const CertificateRecord& cert) {
    return signingService_->verifySignature(cert);
}

PublicKeyInfo CertificateAuthority::caInfo() {
    return signingService_->getPublicKeyInfo();
}

} // namespace services

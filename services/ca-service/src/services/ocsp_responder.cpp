/**
 * @file ocsp_responder.cpp
 * @brief OcspResponder implementation
 */

#include "ocsp_responder.h"
#include "../common/json_utils.h"
#include "exceptions.h"

#include <spdlog/spdlog.h>
#include <stdexcept>

namespace services {

using namespace domain::models;

OcspResponder::OcspResponder(repositories::ICertificateRegistry* registry,
                             SigningService* signingService,
                             OcspConfig config,
                             common::Clock clock)
    : registry_(registry)
    , signingService_(signingService)
    , config_(config)
    , clock_(std::move(clock))
{
    if (!registry_ || !signingService_) {
        throw std::invalid_argument("OcspResponder: dependencies cannot be nullptr");
    }
    if (config_.responseValiditySeconds <= 0) {
        throw std::invalid_argument("OcspResponder: responseValiditySeconds must be positive");
    }
    spdlog::debug("[OcspResponder] Initialized (validity={}s, cache={})",
                  config_.responseValiditySeconds, config_.cacheEnabled ? "on" : "off");
}

bool OcspResponder::isMalformed(const std::vector<std::string>& ids) {
    if (ids.empty()) {
        return true;
    }
    for (const auto& id : ids) {
        if (id.empty()) return true;
    }
    return false;
}

// =============================================================================
// Status resolution
// =============================================================================

CertStatus OcspResponder::computeStatus(const std::string& certificateId,
                                        const TimePoint& now,
                                        std::optional<RevocationRecord>& revocation) {
    revocation = registry_->findRevocation(certificateId);
    if (revocation) {
        return CertStatus::REVOKED;
    }

    auto cert = registry_->findCertificate(certificateId);
    if (!cert) {
        return CertStatus::UNKNOWN;
    }
    if (cert->isExpiredAt(now)) {
        return CertStatus::EXPIRED;
    }
    return CertStatus::GOOD;
}

SingleResponse OcspResponder::resolve(const std::string& certificateId, const TimePoint& now) {
    std::optional<RevocationRecord> revocation;
    const CertStatus status = computeStatus(certificateId, now, revocation);
    const bool cacheable = config_.cacheEnabled && status != CertStatus::UNKNOWN;

    if (cacheable) {
        auto cached = registry_->findOcspCache(certificateId);
        if (cached && cached->isValidAt(now)) {
            auto parsed = common::parseJson(cached->responseBytes);
            std::optional<SingleResponse> single;
            if (parsed) {
                single = SingleResponse::fromJson(*parsed);
            }
            if (single && single->certificateId == certificateId && single->certStatus == status) {
                spdlog::debug("[OcspResponder] Cache hit for {} ({})", certificateId, certStatusToString(status));
                return *single;
            }
            spdlog::debug("[OcspResponder] Cached response for {} is stale", certificateId);
        }
    }

    SingleResponse fresh;
    fresh.certificateId = certificateId;
    fresh.certStatus = status;
    fresh.thisUpdate = now;
    fresh.nextUpdate = cga::utils::addSeconds(now, config_.responseValiditySeconds);
    if (revocation) {
        fresh.revocationTime = revocation->revokedAt;
        fresh.revocationReason = revocation->reason;
    }

    if (cacheable) {
        OcspCacheEntry entry;
        entry.certificateId = certificateId;
        entry.responseBytes = common::toCompactJson(fresh.toJson());
        entry.producedAt = now;
        entry.thisUpdate = fresh.thisUpdate;
        entry.nextUpdate = fresh.nextUpdate;
        registry_->upsertOcspCache(entry);
    }

    return fresh;
}

std::vector<SingleResponse> OcspResponder::resolveAll(const std::vector<std::string>& ids, const TimePoint& now) {
    std::vector<SingleResponse> responses;
    responses.reserve(ids.size());
    for (const auto& id : ids) {
        responses.push_back(resolve(id, now));
    }
    return responses;
}

// =============================================================================
// Public operations
// =============================================================================

std::vector<SingleResponse> OcspResponder::queryStatus(const std::vector<std::string>& certificateIds) {
    if (isMalformed(certificateIds)) {
        throw common::ValidationException("certificateIds", "at least one non-empty certificate id is required");
    }
    return resolveAll(certificateIds, clock_());
}

OcspResponse OcspResponder::respond(const std::vector<std::string>& certificateIds) {
    const TimePoint now = clock_();

    OcspResponse response;
    response.producedAt = now;

    if (isMalformed(certificateIds)) {
        spdlog::warn("[OcspResponder] Malformed request ({} ids)", certificateIds.size());
        response.responseStatus = OcspResponseStatus::MALFORMED_REQUEST;
        return response;
    }

    response.responseStatus = OcspResponseStatus::SUCCESSFUL;
    response.responses = resolveAll(certificateIds, now);

    DocumentSignature signature = signingService_->signDocument(response.signedPayload());
    response.signatureAlgorithm = signature.algorithm;
    response.signatureKeyId = signature.keyId;
    response.signature = signature.signature;

    spdlog::debug("[OcspResponder] Signed response for {} certificate(s) with {}",
                  response.responses.size(), signature.keyId);
    return response;
}

bool OcspResponder::verifyResponse(const OcspResponse& response) {
    if (response.signature.empty() || response.signatureKeyId.empty()) {
        return false;
    }
    return signingService_->verifyDocument(response.signedPayload(), response.signatureKeyId,
                                           response.signature);
}

RevocationList OcspResponder::getRevocationList() {
    const TimePoint now = clock_();

    RevocationList list;
    list.issuerId = signingService_->config().issuerId;
    list.thisUpdate = now;
    list.nextUpdate = cga::utils::addSeconds(now, config_.responseValiditySeconds);
    list.revokedCertificates = registry_->listRevocations();

    DocumentSignature signature = signingService_->signDocument(list.signedPayload());
    list.issuerKeyId = signature.keyId;
    list.signatureAlgorithm = signature.algorithm;
    list.signature = signature.signature;

    spdlog::info("[OcspResponder] Revocation list generated ({} entries)", list.revokedCertificates.size());
    return list;
}

bool OcspResponder::verifyRevocationList(const RevocationList& list) {
    if (list.signature.empty() || list.issuerKeyId.empty()) {
        return false;
    }
    return signingService_->verifyDocument(list.signedPayload(), list.issuerKeyId, list.signature);
}

} // namespace services

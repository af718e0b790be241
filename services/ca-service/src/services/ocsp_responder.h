/**
 * @file ocsp_responder.h
 * @brief OCSP-style certificate status responder
 *
 * Status is recomputed on every query and the cache is only consulted for a
 * response with the same status, so a cached "good" is never served once
 * the certificate is revoked or has expired.
 *
 * @author SmartCore Inc.
 * @date 2026-02-05
 */

#pragma once

#include "signing_service.h"
#include "../common/clock.h"
#include "../domain/models/ocsp.h"
#include "../repositories/certificate_registry.h"

#include <string>
#include <vector>

namespace services {

struct OcspConfig {
    int responseValiditySeconds = 3600;
    bool cacheEnabled = true;
};

class OcspResponder {
public:
    /**
     * @param registry Certificate registry (non-owning)
     * @param signingService Signs response batches (non-owning)
     * @throws std::invalid_argument if a dependency is nullptr or validity is not positive
     */
    OcspResponder(repositories::ICertificateRegistry* registry,
                  SigningService* signingService,
                  OcspConfig config = OcspConfig(),
                  common::Clock clock = common::systemClock());

    /**
     * @brief Current status of each certificate, unsigned
     * @throws common::ValidationException empty list or empty id
     */
    std::vector<domain::models::SingleResponse> queryStatus(const std::vector<std::string>& certificateIds);

    /**
     * @brief Signed batch response
     *
     * An empty list or empty id yields responseStatus=malformedRequest with
     * no responses and no signature.
     *
     * @throws common::KeyUnavailableException no active CA key
     */
    domain::models::OcspResponse respond(const std::vector<std::string>& certificateIds);

    /**
     * @brief Check a response signature against the retained key that produced it
     */
    bool verifyResponse(const domain::models::OcspResponse& response);

    /**
     * @brief Signed list of every revoked certificate
     */
    domain::models::RevocationList getRevocationList();

    bool verifyRevocationList(const domain::models::RevocationList& list);

    const OcspConfig& config() const { return config_; }

private:
    std::vector<domain::models::SingleResponse> resolveAll(const std::vector<std::string>& ids,
                                                           const domain::models::TimePoint& now);

    domain::models::SingleResponse resolve(const std::string& certificateId,
                                           const domain::models::TimePoint& now);

    domain::models::CertStatus computeStatus(const std::string& certificateId,
                                             const domain::models::TimePoint& now,
                                             std::optional<domain::models::RevocationRecord>& revocation);

    static bool isMalformed(const std::vector<std::string>& ids);

    repositories::ICertificateRegistry* registry_;
    SigningService* signingService_;
    OcspConfig config_;
    common::Clock clock_;
};

} // namespace services

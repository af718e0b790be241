/**
 * @file live_verification_service.h
 * @brief Cross-check of an agent's live attested state against the registry
 *
 * Every attempt, whatever its outcome, appends one verification history row.
 * Repeated live failures of one certificate lead to its revocation.
 *
 * @author SmartCore Inc.
 * @date 2026-02-06
 */

#pragma once

#include "revocation_manager.h"
#include "../common/clock.h"
#include "../domain/models/certificate.h"
#include "../domain/models/verification.h"
#include "../repositories/certificate_registry.h"

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <json/json.h>

namespace services {

struct VerificationTarget {
    std::string agentId;
    std::string agentVersion;
    std::string orgId;
    std::optional<std::string> endpoint;

    domain::models::CertificateIdentity identity() const {
        return domain::models::CertificateIdentity{agentId, agentVersion, orgId};
    }
};

/**
 * @brief What a running agent presents about itself
 */
struct AttestationState {
    bool reachable = true;
    std::string goldenThreadHash;
    std::optional<std::string> reportedStatus;  // e.g. "running", "halted"
};

/**
 * @brief Fetches live attested state from a running agent
 *
 * Implementations may throw on transport failure; the service records that
 * as an invalid verification.
 */
class IAttestationProbe {
public:
    virtual ~IAttestationProbe() = default;

    virtual AttestationState probe(const VerificationTarget& target) = 0;
};

enum class LiveVerificationOutcome {
    VALID,
    INVALID,
    REVOKED,
    EXPIRED,
    MISMATCH
};

std::string liveVerificationOutcomeToString(LiveVerificationOutcome outcome);

struct LiveVerificationResult {
    LiveVerificationOutcome outcome = LiveVerificationOutcome::INVALID;
    std::optional<std::string> certificateId;
    std::string agentId;
    std::string reason;
    domain::models::TimePoint timestamp;
    int64_t durationMs = 0;
    int consecutiveFailures = 0;
    bool autoRevoked = false;

    Json::Value toJson() const;
};

struct StatusCheckResult {
    std::string certificateId;
    domain::models::VerificationResult result = domain::models::VerificationResult::UNKNOWN;
    std::optional<domain::models::CertificateRecord> certificate;

    Json::Value toJson() const;
};

struct LiveVerificationConfig {
    // Consecutive live failures before automatic revocation; 0 disables
    int maxConsecutiveFailures = 3;
};

class LiveVerificationService {
public:
    /**
     * @param registry Certificate registry (non-owning)
     * @param probe Live attestation source (non-owning)
     * @param revocationManager Used for automatic revocation (non-owning)
     * @throws std::invalid_argument if a dependency is nullptr
     */
    LiveVerificationService(repositories::ICertificateRegistry* registry,
                            IAttestationProbe* probe,
                            RevocationManager* revocationManager,
                            LiveVerificationConfig config = LiveVerificationConfig(),
                            common::Clock clock = common::systemClock());

    /**
     * @brief Verify an agent's live state against its certificate
     * @throws common::ValidationException empty target identity
     */
    LiveVerificationResult verify(const VerificationTarget& target,
                                  const domain::models::RequestContext& context = {});

    /**
     * @brief Verify each target independently
     */
    std::vector<LiveVerificationResult> verifyBatch(const std::vector<VerificationTarget>& targets,
                                                    const domain::models::RequestContext& context = {});

    /**
     * @brief Registry-only status check (no live probe)
     */
    StatusCheckResult checkStatus(const std::string& certificateId,
                                  const domain::models::RequestContext& context = {});

    int failureCount(const std::string& certificateId) const;

private:
    LiveVerificationResult evaluate(const VerificationTarget& target,
                                    const std::optional<domain::models::CertificateRecord>& cert,
                                    Json::Value& details);

    int recordOutcome(const std::string& certificateId, LiveVerificationOutcome outcome);

    void resetFailures(const std::string& certificateId);

    repositories::ICertificateRegistry* registry_;
    IAttestationProbe* probe_;
    RevocationManager* revocationManager_;
    LiveVerificationConfig config_;
    common::Clock clock_;

    mutable std::mutex failuresMutex_;
    std::map<std::string, int> consecutiveFailures_;
};

} // namespace services

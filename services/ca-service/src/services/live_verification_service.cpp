/**
 * @file live_verification_service.cpp
 * @brief LiveVerificationService implementation
 */

#include "live_verification_service.h"
#include "exceptions.h"

#include <cga/crypto/digest.h>
#include <cga/utils/string_utils.h>

#include <spdlog/spdlog.h>
#include <stdexcept>

namespace services {

using namespace domain::models;

namespace {

constexpr const char* AUTO_REVOKE_REASON = "live-verification-failed";
constexpr const char* AUTO_REVOKE_ACTOR = "system";

VerificationResult toHistoryResult(LiveVerificationOutcome outcome, bool hasCertificate) {
    switch (outcome) {
        case LiveVerificationOutcome::VALID: return VerificationResult::VALID;
        case LiveVerificationOutcome::REVOKED: return VerificationResult::REVOKED;
        case LiveVerificationOutcome::EXPIRED: return VerificationResult::EXPIRED;
        case LiveVerificationOutcome::MISMATCH: return VerificationResult::INVALID;
        case LiveVerificationOutcome::INVALID:
            return hasCertificate ? VerificationResult::INVALID : VerificationResult::UNKNOWN;
    }
    return VerificationResult::UNKNOWN;
}

bool isHaltedStatus(const std::optional<std::string>& status) {
    if (!status) return false;
    std::string s = cga::utils::toLower(*status);
    return s == "halted" || s == "terminated" || s == "stopped";
}

} // anonymous namespace

std::string liveVerificationOutcomeToString(LiveVerificationOutcome outcome) {
    switch (outcome) {
        case LiveVerificationOutcome::VALID: return "valid";
        case LiveVerificationOutcome::INVALID: return "invalid";
        case LiveVerificationOutcome::REVOKED: return "revoked";
        case LiveVerificationOutcome::EXPIRED: return "expired";
        case LiveVerificationOutcome::MISMATCH: return "mismatch";
    }
    return "invalid";
}

Json::Value LiveVerificationResult::toJson() const {
    Json::Value json;
    json["outcome"] = liveVerificationOutcomeToString(outcome);
    if (certificateId) json["certificateId"] = *certificateId;
    json["agentId"] = agentId;
    json["reason"] = reason;
    json["timestamp"] = cga::utils::formatIso8601(timestamp);
    json["durationMs"] = Json::Int64(durationMs);
    json["consecutiveFailures"] = consecutiveFailures;
    json["autoRevoked"] = autoRevoked;
    return json;
}

Json::Value StatusCheckResult::toJson() const {
    Json::Value json;
    json["certificateId"] = certificateId;
    json["result"] = verificationResultToString(result);
    if (certificate) {
        json["agentId"] = certificate->agentId;
        json["level"] = certificateLevelToString(certificate->level);
        json["expiresAt"] = cga::utils::formatIso8601(certificate->expiresAt);
    }
    return json;
}

LiveVerificationService::LiveVerificationService(repositories::ICertificateRegistry* registry,
                                                 IAttestationProbe* probe,
                                                 RevocationManager* revocationManager,
                                                 LiveVerificationConfig config,
                                                 common::Clock clock)
    : registry_(registry)
    , probe_(probe)
    , revocationManager_(revocationManager)
    , config_(config)
    , clock_(std::move(clock))
{
    if (!registry_ || !probe_ || !revocationManager_) {
        throw std::invalid_argument("LiveVerificationService: dependencies cannot be nullptr");
    }
}

// =============================================================================
// Live verification
// =============================================================================

LiveVerificationResult LiveVerificationService::evaluate(const VerificationTarget& target,
                                                         const std::optional<CertificateRecord>& cert,
                                                         Json::Value& details) {
    LiveVerificationResult result;
    result.agentId = target.agentId;

    if (!cert) {
        result.outcome = LiveVerificationOutcome::INVALID;
        result.reason = "no certificate for " + target.identity().toString();
        return result;
    }
    result.certificateId = cert->id;
    details["expectedHash"] = cert->goldenThreadHash;

    AttestationState state;
    try {
        state = probe_->probe(target);
    } catch (const std::exception& e) {
        spdlog::warn("[LiveVerificationService] Probe of {} failed: {}", target.agentId, e.what());
        result.outcome = LiveVerificationOutcome::INVALID;
        result.reason = std::string("probe failed: ") + e.what();
        return result;
    }

    details["presentedHash"] = state.goldenThreadHash;
    if (state.reportedStatus) details["reportedStatus"] = *state.reportedStatus;

    if (!state.reachable) {
        result.outcome = LiveVerificationOutcome::INVALID;
        result.reason = "agent unreachable";
        return result;
    }
    if (isHaltedStatus(state.reportedStatus)) {
        result.outcome = LiveVerificationOutcome::INVALID;
        result.reason = "agent reports status " + *state.reportedStatus;
        return result;
    }

    if (cert->status == CertificateStatus::REVOKED) {
        result.outcome = LiveVerificationOutcome::REVOKED;
        result.reason = "certificate revoked";
        return result;
    }
    if (cert->isExpiredAt(clock_())) {
        result.outcome = LiveVerificationOutcome::EXPIRED;
        result.reason = "certificate expired at " + cga::utils::formatIso8601(cert->expiresAt);
        return result;
    }
    if (!cga::crypto::constantTimeEquals(state.goldenThreadHash, cert->goldenThreadHash)) {
        result.outcome = LiveVerificationOutcome::MISMATCH;
        result.reason = "presented golden thread hash does not match the certificate";
        return result;
    }

    result.outcome = LiveVerificationOutcome::VALID;
    result.reason = "live state matches certificate";
    return result;
}

LiveVerificationResult LiveVerificationService::verify(const VerificationTarget& target,
                                                       const RequestContext& context) {
    if (target.agentId.empty() || target.agentVersion.empty() || target.orgId.empty()) {
        throw common::ValidationException("target", "agentId, agentVersion and orgId are required");
    }

    common::OperationTimer timer;
    const TimePoint startedAt = clock_();

    auto cert = registry_->findLiveCertificate(target.identity());

    Json::Value details(Json::objectValue);
    if (target.endpoint) details["endpoint"] = *target.endpoint;

    LiveVerificationResult result = evaluate(target, cert, details);
    result.timestamp = startedAt;

    bool revokeNow = false;
    if (result.certificateId) {
        result.consecutiveFailures = recordOutcome(*result.certificateId, result.outcome);
        revokeNow = config_.maxConsecutiveFailures > 0 &&
                    result.consecutiveFailures >= config_.maxConsecutiveFailures;
    }

    details["outcome"] = liveVerificationOutcomeToString(result.outcome);
    details["reason"] = result.reason;
    details["consecutiveFailures"] = result.consecutiveFailures;
    if (revokeNow) details["autoRevoke"] = true;

    VerificationHistoryRecord history;
    history.certificateId = result.certificateId;
    history.agentId = target.agentId;
    history.context = context;
    if (!history.context.requestAction) {
        history.context.requestAction = "live_verification";
    }
    history.requestTimestamp = startedAt;
    history.result = toHistoryResult(result.outcome, cert.has_value());
    history.resultDetails = details;
    result.durationMs = timer.getDurationMs();
    history.durationMs = result.durationMs;
    registry_->appendVerification(history);

    if (revokeNow) {
        spdlog::warn("[LiveVerificationService] {} failed {} consecutive live verifications; revoking",
                     *result.certificateId, result.consecutiveFailures);
        revocationManager_->revoke(*result.certificateId, AUTO_REVOKE_REASON, AUTO_REVOKE_ACTOR);
        resetFailures(*result.certificateId);
        result.autoRevoked = true;
    }

    spdlog::info("[LiveVerificationService] {} -> {} ({}ms)", target.identity().toString(),
                 liveVerificationOutcomeToString(result.outcome), result.durationMs);
    return result;
}

std::vector<LiveVerificationResult> LiveVerificationService::verifyBatch(
    const std::vector<VerificationTarget>& targets, const RequestContext& context) {
    std::vector<LiveVerificationResult> results;
    results.reserve(targets.size());

    for (const auto& target : targets) {
        try {
            results.push_back(verify(target, context));
        } catch (const std::exception& e) {
            spdlog::error("[LiveVerificationService] Verification of {} failed: {}",
                          target.identity().toString(), e.what());
            LiveVerificationResult failed;
            failed.outcome = LiveVerificationOutcome::INVALID;
            failed.agentId = target.agentId;
            failed.reason = std::string("verification error: ") + e.what();
            failed.timestamp = clock_();
            results.push_back(failed);
        }
    }
    return results;
}

// =============================================================================
// Registry-only check
// =============================================================================

StatusCheckResult LiveVerificationService::checkStatus(const std::string& certificateId,
                                                       const RequestContext& context) {
    if (certificateId.empty()) {
        throw common::ValidationException("certificateId", "certificateId is required");
    }

    common::OperationTimer timer;
    const TimePoint now = clock_();

    StatusCheckResult out;
    out.certificateId = certificateId;
    out.certificate = registry_->findCertificate(certificateId);

    if (registry_->findRevocation(certificateId)) {
        out.result = VerificationResult::REVOKED;
    } else if (!out.certificate) {
        out.result = VerificationResult::UNKNOWN;
    } else if (out.certificate->isExpiredAt(now)) {
        out.result = VerificationResult::EXPIRED;
    } else {
        out.result = VerificationResult::VALID;
    }

    VerificationHistoryRecord history;
    if (out.certificate) {
        history.certificateId = certificateId;
        history.agentId = out.certificate->agentId;
    } else {
        history.agentId = "unknown";
        history.resultDetails["requestedCertificateId"] = certificateId;
    }
    history.context = context;
    if (!history.context.requestAction) {
        history.context.requestAction = "status_check";
    }
    history.requestTimestamp = now;
    history.result = out.result;
    history.durationMs = timer.getDurationMs();
    registry_->appendVerification(history);

    return out;
}

// =============================================================================
// Failure tracking
// =============================================================================

int LiveVerificationService::recordOutcome(const std::string& certificateId, LiveVerificationOutcome outcome) {
    std::lock_guard<std::mutex> lock(failuresMutex_);

    // Only live-state failures count toward automatic revocation
    if (outcome == LiveVerificationOutcome::INVALID || outcome == LiveVerificationOutcome::MISMATCH) {
        return ++consecutiveFailures_[certificateId];
    }
    consecutiveFailures_.erase(certificateId);
    return 0;
}

void LiveVerificationService::resetFailures(const std::string& certificateId) {
    std::lock_guard<std::mutex> lock(failuresMutex_);
    consecutiveFailures_.erase(certificateId);
}

int LiveVerificationService::failureCount(const std::string& certificateId) const {
    std::lock_guard<std::mutex> lock(failuresMutex_);
    auto it = consecutiveFailures_.find(certificateId);
    return it == consecutiveFailures_.end() ? 0 : it->second;
}

} // namespace services

/**
 * @file renewal_scheduler.cpp
 * @brief RenewalScheduler implementation
 */

#include "renewal_scheduler.h"
#include "../domain/models/certificate_content.h"
#include "../domain/models/signing_request.h"
#include "exceptions.h"

#include <spdlog/spdlog.h>
#include <stdexcept>

namespace services {

using namespace domain::models;

std::string renewalOutcomeToString(RenewalOutcome outcome) {
    switch (outcome) {
        case RenewalOutcome::RENEWED: return "renewed";
        case RenewalOutcome::FAILED: return "failed";
        case RenewalOutcome::SKIPPED: return "skipped";
    }
    return "skipped";
}

std::string renewalEventToString(RenewalEvent event) {
    switch (event) {
        case RenewalEvent::EXPIRING_SOON: return "cga.certificate.expiring_soon";
        case RenewalEvent::RENEWED: return "cga.certificate.renewed";
        case RenewalEvent::VERIFICATION_REQUIRED: return "cga.certificate.verification_required";
    }
    return "cga.certificate.expiring_soon";
}

Json::Value RenewalNotification::toJson() const {
    Json::Value json;
    json["event"] = renewalEventToString(event);
    json["timestamp"] = cga::utils::formatIso8601(timestamp);
    json["certificate"]["id"] = certificate.id;
    json["certificate"]["agentId"] = certificate.agentId;
    json["certificate"]["level"] = certificateLevelToString(certificate.level);
    json["certificate"]["expiresAt"] = cga::utils::formatIso8601(certificate.expiresAt);
    json["certificate"]["orgId"] = certificate.orgId;
    if (newCertificateId) json["newCertificateId"] = *newCertificateId;
    return json;
}

Json::Value RenewalItemResult::toJson() const {
    Json::Value json;
    json["certificateId"] = certificateId;
    json["outcome"] = renewalOutcomeToString(outcome);
    if (newCertificateId) json["newCertificateId"] = *newCertificateId;
    if (requiresVerification) json["requiresVerification"] = true;
    if (!message.empty()) json["message"] = message;
    return json;
}

Json::Value RenewalReport::toJson() const {
    Json::Value json;
    json["candidates"] = candidates;
    json["succeeded"] = succeeded;
    json["failed"] = failed;
    json["skipped"] = skipped;
    json["items"] = Json::Value(Json::arrayValue);
    for (const auto& item : items) {
        json["items"].append(item.toJson());
    }
    return json;
}

RenewalScheduler::RenewalScheduler(repositories::ICertificateRegistry* registry,
                                   SigningService* signingService,
                                   RenewalConfig config,
                                   common::Clock clock)
    : registry_(registry)
    , signingService_(signingService)
    , config_(config)
    , clock_(std::move(clock))
    , running_(false)
{
    if (!registry_ || !signingService_) {
        throw std::invalid_argument("RenewalScheduler: dependencies cannot be nullptr");
    }
    if (config_.renewalWindowDays <= 0) {
        throw std::invalid_argument("RenewalScheduler: renewalWindowDays must be positive");
    }
}

RenewalScheduler::~RenewalScheduler() {
    stop();
}

// =============================================================================
// Sweep
// =============================================================================

std::vector<CertificateRecord> RenewalScheduler::computeRenewalCandidates(int windowDays) {
    const TimePoint now = clock_();
    return registry_->findActiveExpiringBetween(now, cga::utils::addDays(now, windowDays));
}

RenewalReport RenewalScheduler::runOnce() {
    RenewalReport report;
    auto candidates = computeRenewalCandidates();
    report.candidates = static_cast<int>(candidates.size());

    spdlog::info("[RenewalScheduler] Renewal sweep: {} candidate(s) within {} day(s)",
                 report.candidates, config_.renewalWindowDays);

    for (const auto& cert : candidates) {
        RenewalItemResult item = renewOne(cert);
        switch (item.outcome) {
            case RenewalOutcome::RENEWED: report.succeeded++; break;
            case RenewalOutcome::FAILED: report.failed++; break;
            case RenewalOutcome::SKIPPED: report.skipped++; break;
        }
        report.items.push_back(item);
    }

    if (report.failed > 0) {
        spdlog::warn("[RenewalScheduler] Sweep finished: {} renewed, {} failed, {} skipped",
                     report.succeeded, report.failed, report.skipped);
    } else {
        spdlog::info("[RenewalScheduler] Sweep finished: {} renewed, {} skipped",
                     report.succeeded, report.skipped);
    }
    return report;
}

RenewalItemResult RenewalScheduler::renewOne(const CertificateRecord& cert) {
    RenewalItemResult item;
    item.certificateId = cert.id;

    if (levelRank(cert.level) > levelRank(config_.maxAutoRenewLevel)) {
        item.outcome = RenewalOutcome::SKIPPED;
        item.requiresVerification = true;
        item.message = "level " + certificateLevelToString(cert.level) + " requires re-verification";
        spdlog::info("[RenewalScheduler] {} skipped: {}", cert.id, item.message);
        sendNotification(RenewalEvent::VERIFICATION_REQUIRED, cert);
        return item;
    }

    if (!config_.autoRenewEnabled) {
        item.outcome = RenewalOutcome::SKIPPED;
        item.message = "auto-renewal disabled";
        spdlog::info("[RenewalScheduler] {} expiring at {} (auto-renewal disabled)",
                     cert.id, cga::utils::formatIso8601(cert.expiresAt));
        sendNotification(RenewalEvent::EXPIRING_SOON, cert);
        return item;
    }

    CertificateRecord renewed;
    try {
        auto content = CertificateContent::parse(cert.certificateContent);
        if (!content) {
            throw common::ValidationException("certificateContent", "stored certificate content is unreadable");
        }

        SigningRequest request;
        request.agentId = cert.agentId;
        request.agentVersion = cert.agentVersion;
        request.orgId = cert.orgId;
        request.orgName = cert.orgName;
        request.orgDomain = cert.orgDomain;
        request.level = cert.level;
        request.attestation = content->attestation;
        request.supersedesId = cert.id;

        renewed = signingService_->sign(request);

    } catch (const std::exception& e) {
        item.outcome = RenewalOutcome::FAILED;
        item.message = e.what();
        spdlog::error("[RenewalScheduler] Renewal of {} failed: {}", cert.id, e.what());

        AuditEntry audit;
        audit.actor = AuditActor::system();
        audit.action = "certificate_renewal_failed";
        audit.resourceType = "certificate";
        audit.resourceId = cert.id;
        audit.details["error"] = e.what();
        writeAudit(audit);
        return item;
    }

    // The successor is committed from here on
    item.outcome = RenewalOutcome::RENEWED;
    item.newCertificateId = renewed.id;
    spdlog::info("[RenewalScheduler] Renewed {} -> {}", cert.id, renewed.id);

    AuditEntry audit;
    audit.actor = AuditActor::system();
    audit.action = "certificate_renewed";
    audit.resourceType = "certificate";
    audit.resourceId = renewed.id;
    audit.details["previousCertificateId"] = cert.id;
    audit.details["newCertificateId"] = renewed.id;
    audit.details["level"] = certificateLevelToString(renewed.level);
    writeAudit(audit);

    sendNotification(RenewalEvent::RENEWED, cert, renewed.id);
    return item;
}

void RenewalScheduler::sendNotification(RenewalEvent event,
                                        const CertificateRecord& cert,
                                        const std::optional<std::string>& newCertificateId) {
    if (!notifier_) {
        return;
    }

    RenewalNotification notification;
    notification.event = event;
    notification.timestamp = clock_();
    notification.certificate = cert;
    notification.newCertificateId = newCertificateId;

    try {
        notifier_->notify(notification);
    } catch (const std::exception& e) {
        spdlog::error("[RenewalScheduler] Failed to send {} notification for {}: {}",
                      renewalEventToString(event), cert.id, e.what());
    }
}

void RenewalScheduler::writeAudit(const AuditEntry& audit) {
    try {
        registry_->recordAudit(audit);
    } catch (const std::exception& e) {
        spdlog::error("[RenewalScheduler] Failed to record {} audit for {}: {}",
                      audit.action, audit.resourceId.value_or("-"), e.what());
    }
}

ManualRenewalTicket RenewalScheduler::requestManualRenewal(const std::string& certificateId,
                                                           const AuditActor& actor) {
    auto cert = registry_->findCertificate(certificateId);
    if (!cert) {
        throw common::NotFoundException("Certificate", certificateId);
    }

    ManualRenewalTicket ticket;
    ticket.certificateId = certificateId;
    ticket.verificationUrl = "https://" + signingService_->config().issuerId + "/renew/" + certificateId;

    AuditEntry audit;
    audit.actor = actor;
    audit.action = "manual_renewal_requested";
    audit.resourceType = "certificate";
    audit.resourceId = certificateId;
    audit.details["level"] = certificateLevelToString(cert->level);
    audit.details["verificationUrl"] = ticket.verificationUrl;
    registry_->recordAudit(audit);

    spdlog::info("[RenewalScheduler] Manual renewal requested for {}", certificateId);
    return ticket;
}

// =============================================================================
// Background thread
// =============================================================================

void RenewalScheduler::setReportFn(ReportFn fn) {
    reportFn_ = std::move(fn);
}

void RenewalScheduler::setNotifier(IRenewalNotifier* notifier) {
    notifier_ = notifier;
}

void RenewalScheduler::start() {
    if (running_.exchange(true)) {
        return;
    }
    thread_ = std::thread([this]() { schedulerLoop(); });
}

void RenewalScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
    }
    cv_.notify_all();

    if (thread_.joinable()) {
        thread_.join();
    }
}

void RenewalScheduler::triggerNow() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        forceRun_ = true;
    }
    cv_.notify_all();
}

void RenewalScheduler::schedulerLoop() {
    spdlog::info("[RenewalScheduler] Scheduler started (every {} min, window {} days)",
                 config_.interval.count(), config_.renewalWindowDays);

    while (running_) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait_for(lock, config_.interval, [this]() { return !running_ || forceRun_; });
            if (!running_) break;
            forceRun_ = false;
        }

        try {
            RenewalReport report = runOnce();
            if (reportFn_) {
                reportFn_(report);
            }
        } catch (const std::exception& e) {
            spdlog::error("[RenewalScheduler] Renewal sweep failed: {}", e.what());
        }
    }

    spdlog::info("[RenewalScheduler] Scheduler stopped");
}

} // namespace services

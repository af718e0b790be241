/**
 * @file renewal_scheduler.h
 * @brief Periodic renewal of near-expiry certificates
 *
 * A sweep reissues each active certificate whose expiry falls inside the
 * renewal window and supersedes the old record atomically. Candidates are
 * processed independently; a failing candidate is counted and audited and
 * the sweep continues.
 *
 * @author SmartCore Inc.
 * @date 2026-02-05
 */

#pragma once

#include "signing_service.h"
#include "../common/clock.h"
#include "../domain/models/certificate.h"
#include "../repositories/certificate_registry.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <json/json.h>

namespace services {

struct RenewalConfig {
    int renewalWindowDays = 14;
    bool autoRenewEnabled = true;
    // Higher levels need re-verification and are skipped
    domain::models::CertificateLevel maxAutoRenewLevel = domain::models::CertificateLevel::GOLD;
    std::chrono::minutes interval{60};
};

enum class RenewalOutcome {
    RENEWED,
    FAILED,
    SKIPPED
};

std::string renewalOutcomeToString(RenewalOutcome outcome);

struct RenewalItemResult {
    std::string certificateId;
    RenewalOutcome outcome = RenewalOutcome::SKIPPED;
    std::optional<std::string> newCertificateId;
    bool requiresVerification = false;
    std::string message;

    Json::Value toJson() const;
};

struct RenewalReport {
    int candidates = 0;
    int succeeded = 0;
    int failed = 0;
    int skipped = 0;
    std::vector<RenewalItemResult> items;

    /**
     * @brief Process exit code for a one-shot sweep: non-zero iff any candidate failed
     */
    int exitCode() const { return failed > 0 ? 1 : 0; }

    Json::Value toJson() const;
};

enum class RenewalEvent {
    EXPIRING_SOON,
    RENEWED,
    VERIFICATION_REQUIRED
};

/** @brief Wire name, e.g. "cga.certificate.renewed" */
std::string renewalEventToString(RenewalEvent event);

struct RenewalNotification {
    RenewalEvent event = RenewalEvent::EXPIRING_SOON;
    domain::models::TimePoint timestamp;
    domain::models::CertificateRecord certificate;
    std::optional<std::string> newCertificateId;

    Json::Value toJson() const;
};

/**
 * @brief Receives renewal events (webhook, mail, queue)
 *
 * Delivery failures may throw; the scheduler logs them and carries on.
 */
class IRenewalNotifier {
public:
    virtual ~IRenewalNotifier() = default;

    virtual void notify(const RenewalNotification& notification) = 0;
};

struct ManualRenewalTicket {
    std::string certificateId;
    std::string verificationUrl;
};

class RenewalScheduler {
public:
    using ReportFn = std::function<void(const RenewalReport&)>;

    /**
     * @param registry Certificate registry (non-owning)
     * @param signingService Issues the renewed certificates (non-owning)
     * @throws std::invalid_argument if a dependency is nullptr or the window is not positive
     */
    RenewalScheduler(repositories::ICertificateRegistry* registry,
                     SigningService* signingService,
                     RenewalConfig config = RenewalConfig(),
                     common::Clock clock = common::systemClock());

    /** @brief Stops the background thread if running */
    ~RenewalScheduler();

    RenewalScheduler(const RenewalScheduler&) = delete;
    RenewalScheduler& operator=(const RenewalScheduler&) = delete;

    /**
     * @brief Active certificates with now <= expiresAt < now + window
     */
    std::vector<domain::models::CertificateRecord> computeRenewalCandidates(int windowDays);

    std::vector<domain::models::CertificateRecord> computeRenewalCandidates() {
        return computeRenewalCandidates(config_.renewalWindowDays);
    }

    /**
     * @brief One renewal sweep over the current candidates
     */
    RenewalReport runOnce();

    /**
     * @brief Audit a request to renew a certificate through re-verification
     * @throws common::NotFoundException unknown certificate
     */
    ManualRenewalTicket requestManualRenewal(
        const std::string& certificateId,
        const domain::models::AuditActor& actor = domain::models::AuditActor::system());

    /** @brief Called with every report produced by the background thread */
    void setReportFn(ReportFn fn);

    /** @brief Optional event sink (non-owning); set before start() */
    void setNotifier(IRenewalNotifier* notifier);

    /** @brief Start the background sweep thread */
    void start();

    /** @brief Stop the background thread and join it */
    void stop();

    /** @brief Run a sweep on the background thread as soon as possible */
    void triggerNow();

    bool isRunning() const { return running_; }

    const RenewalConfig& config() const { return config_; }

private:
    RenewalItemResult renewOne(const domain::models::CertificateRecord& cert);

    void sendNotification(RenewalEvent event,
                          const domain::models::CertificateRecord& cert,
                          const std::optional<std::string>& newCertificateId = std::nullopt);

    /** @brief Record an audit entry; a storage failure is logged, never thrown */
    void writeAudit(const domain::models::AuditEntry& audit);

    void schedulerLoop();

    repositories::ICertificateRegistry* registry_;
    SigningService* signingService_;
    RenewalConfig config_;
    common::Clock clock_;

    ReportFn reportFn_;
    IRenewalNotifier* notifier_ = nullptr;

    // Threading
    std::atomic<bool> running_;
    bool forceRun_ = false;
    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable cv_;
};

} // namespace services

/**
 * @file renewal_scheduler_test.cpp
 * @brief Unit tests for RenewalScheduler sweeps and the background thread
 */

#include <gtest/gtest.h>
#include "services/renewal_scheduler.h"
#include "domain/models/certificate_content.h"
#include "exceptions.h"
#include "test_helpers.h"

#include <condition_variable>
#include <mutex>
#include <set>
#include <stdexcept>
#include <vector>

using namespace domain::models;
using services::RenewalConfig;
using services::RenewalEvent;
using services::RenewalOutcome;
using services::RenewalReport;
using services::RenewalScheduler;

namespace {

/// Registry that refuses to store certificates for selected agents
class FlakyRegistry : public repositories::MemoryCertificateRegistry {
public:
    using MemoryCertificateRegistry::MemoryCertificateRegistry;

    std::set<std::string> failAgents;
    bool auditDown = false;

    int64_t recordAudit(const AuditEntry& entry) override {
        if (auditDown) {
            throw common::StorageException("audit log unavailable");
        }
        return MemoryCertificateRegistry::recordAudit(entry);
    }

    void issueCertificate(const CertificateRecord& record,
                          const std::optional<std::string>& supersedesId,
                          const AuditEntry& audit) override {
        if (failAgents.count(record.agentId)) {
            throw common::StorageException("simulated write failure for " + record.agentId);
        }
        MemoryCertificateRegistry::issueCertificate(record, supersedesId, audit);
    }
};

/// Notifier that keeps every event it receives
class RecordingNotifier : public services::IRenewalNotifier {
public:
    std::vector<services::RenewalNotification> received;
    bool fail = false;

    void notify(const services::RenewalNotification& notification) override {
        if (fail) {
            throw std::runtime_error("webhook endpoint unreachable");
        }
        received.push_back(notification);
    }
};

class RenewalSchedulerTest : public test_helpers::CaFixture {
protected:
    FlakyRegistry* flaky_ = nullptr;

    void SetUp() override {
        auto registry = std::make_unique<FlakyRegistry>(clock_.clock());
        flaky_ = registry.get();
        registry_ = std::move(registry);
        registry_->initialize();
        signing_ = std::make_unique<services::SigningService>(registry_.get(), test_helpers::KEY_PASSWORD,
                                                              test_helpers::fastSigningConfig(), clock_.clock());
        signing_->generateKey(test_helpers::KEY_PASSWORD);
    }

    std::unique_ptr<RenewalScheduler> makeScheduler(RenewalConfig config = RenewalConfig()) {
        return std::make_unique<RenewalScheduler>(registry_.get(), signing_.get(), config, clock_.clock());
    }

    int countAudit(const std::string& action) {
        int n = 0;
        for (const auto& entry : registry_->listAudit(std::nullopt, 1000)) {
            if (entry.entry.action == action) ++n;
        }
        return n;
    }
};

// --- Candidates ---

TEST_F(RenewalSchedulerTest, Candidates_OnlyActiveInsideWindow) {
    auto soon = issue("agent-soon", "1.0.0", CertificateLevel::BRONZE);          // 30 days
    issue("agent-later", "1.0.0", CertificateLevel::GOLD);                         // 180 days
    issue("agent-lapsed", "1.0.0", CertificateLevel::BRONZE, 5);
    auto revoked = issue("agent-revoked", "1.0.0", CertificateLevel::BRONZE);
    signing_->sign([&] {
        auto req = test_helpers::makeRequest("agent-edge", "1.0.0", "org-42", CertificateLevel::SILVER);
        req.validityDays = 34;
        return req;
    }());

    RevocationRecord rev;
    rev.certificateId = revoked.id;
    rev.revokedAt = clock_.now();
    rev.reason = "policy-violation";
    rev.revokedBy = "admin:alice";
    AuditEntry audit;
    audit.action = "certificate_revoked";
    audit.resourceType = "certificate";
    audit.resourceId = revoked.id;
    registry_->revokeCertificate(rev, audit);

    clock_.advanceDays(20);
    auto scheduler = makeScheduler();
    auto candidates = scheduler->computeRenewalCandidates();

    // agent-edge expires exactly at now + 14 days, outside the half-open window
    ASSERT_EQ(candidates.size(), 1u);
    EXPECT_EQ(candidates[0].id, soon.id);
    EXPECT_EQ(scheduler->computeRenewalCandidates(15).size(), 2u);
}

// --- Sweep ---

TEST_F(RenewalSchedulerTest, RunOnce_RenewsAndSupersedes) {
    auto cert = issue("agent-7", "1.0.0", CertificateLevel::SILVER);
    clock_.advanceDays(80);

    auto report = makeScheduler()->runOnce();

    EXPECT_EQ(report.candidates, 1);
    EXPECT_EQ(report.succeeded, 1);
    EXPECT_EQ(report.exitCode(), 0);
    ASSERT_EQ(report.items.size(), 1u);
    ASSERT_TRUE(report.items[0].newCertificateId.has_value());

    auto renewed = registry_->findCertificate(*report.items[0].newCertificateId);
    ASSERT_TRUE(renewed.has_value());
    EXPECT_EQ(renewed->supersedesId, std::optional<std::string>(cert.id));
    EXPECT_EQ(renewed->level, CertificateLevel::SILVER);
    EXPECT_EQ(renewed->issuedAt, clock_.now());
    EXPECT_TRUE(signing_->verifySignature(*renewed));
    EXPECT_EQ(CertificateContent::parse(renewed->certificateContent)->attestation,
              CertificateContent::parse(cert.certificateContent)->attestation);
    EXPECT_EQ(registry_->findCertificate(cert.id)->status, CertificateStatus::SUPERSEDED);
    EXPECT_EQ(countAudit("certificate_renewed"), 1);

    // The renewed certificate is out of the window, so a second sweep is a no-op
    auto again = makeScheduler()->runOnce();
    EXPECT_EQ(again.candidates, 0);
}

TEST_F(RenewalSchedulerTest, RunOnce_FailureDoesNotAbortSweep) {
    auto a = issue("agent-a", "1.0.0", CertificateLevel::BRONZE);
    issue("agent-b", "1.0.0", CertificateLevel::BRONZE);
    auto c = issue("agent-c", "1.0.0", CertificateLevel::BRONZE);
    flaky_->failAgents.insert("agent-b");
    clock_.advanceDays(25);

    auto report = makeScheduler()->runOnce();

    EXPECT_EQ(report.candidates, 3);
    EXPECT_EQ(report.succeeded, 2);
    EXPECT_EQ(report.failed, 1);
    EXPECT_EQ(report.exitCode(), 1);
    EXPECT_EQ(registry_->findCertificate(a.id)->status, CertificateStatus::SUPERSEDED);
    EXPECT_EQ(registry_->findCertificate(c.id)->status, CertificateStatus::SUPERSEDED);
    EXPECT_EQ(registry_->listByAgent("agent-b").size(), 1u);
    EXPECT_EQ(countAudit("certificate_renewal_failed"), 1);

    Json::Value json = report.toJson();
    EXPECT_EQ(json["failed"].asInt(), 1);
    EXPECT_EQ(json["items"].size(), 3u);
}

TEST_F(RenewalSchedulerTest, RunOnce_AuditOutageStillCountsRenewals) {
    auto a = issue("agent-a", "1.0.0", CertificateLevel::BRONZE);
    auto b = issue("agent-b", "1.0.0", CertificateLevel::BRONZE);
    clock_.advanceDays(25);
    flaky_->auditDown = true;

    RenewalReport report;
    ASSERT_NO_THROW(report = makeScheduler()->runOnce());

    EXPECT_EQ(report.candidates, 2);
    EXPECT_EQ(report.succeeded, 2);
    EXPECT_EQ(report.failed, 0);
    for (const auto& item : report.items) {
        EXPECT_EQ(item.outcome, RenewalOutcome::RENEWED);
        EXPECT_TRUE(item.newCertificateId.has_value());
    }
    EXPECT_EQ(registry_->findCertificate(a.id)->status, CertificateStatus::SUPERSEDED);
    EXPECT_EQ(registry_->findCertificate(b.id)->status, CertificateStatus::SUPERSEDED);
    EXPECT_EQ(countAudit("certificate_renewed"), 0);
}

TEST_F(RenewalSchedulerTest, RunOnce_AuditOutageDuringFailureKeepsSweeping) {
    issue("agent-a", "1.0.0", CertificateLevel::BRONZE);
    auto b = issue("agent-b", "1.0.0", CertificateLevel::BRONZE);
    clock_.advanceDays(25);
    flaky_->failAgents.insert("agent-a");
    flaky_->auditDown = true;

    RenewalReport report;
    ASSERT_NO_THROW(report = makeScheduler()->runOnce());

    EXPECT_EQ(report.candidates, 2);
    EXPECT_EQ(report.failed, 1);
    EXPECT_EQ(report.succeeded, 1);
    EXPECT_EQ(report.exitCode(), 1);
    EXPECT_EQ(registry_->findCertificate(b.id)->status, CertificateStatus::SUPERSEDED);
    EXPECT_EQ(registry_->listByAgent("agent-a").size(), 1u);
}

TEST_F(RenewalSchedulerTest, RunOnce_PlatinumRequiresVerification) {
    auto cert = issue("agent-p", "1.0.0", CertificateLevel::PLATINUM, 10);
    clock_.advanceDays(1);

    auto report = makeScheduler()->runOnce();

    EXPECT_EQ(report.skipped, 1);
    ASSERT_EQ(report.items.size(), 1u);
    EXPECT_EQ(report.items[0].outcome, RenewalOutcome::SKIPPED);
    EXPECT_TRUE(report.items[0].requiresVerification);
    EXPECT_EQ(registry_->findCertificate(cert.id)->status, CertificateStatus::ACTIVE);
}

TEST_F(RenewalSchedulerTest, RunOnce_AutoRenewDisabledOnlyReports) {
    auto cert = issue("agent-7", "1.0.0", CertificateLevel::BRONZE);
    clock_.advanceDays(25);

    RenewalConfig config;
    config.autoRenewEnabled = false;
    auto report = makeScheduler(config)->runOnce();

    EXPECT_EQ(report.candidates, 1);
    EXPECT_EQ(report.skipped, 1);
    EXPECT_FALSE(report.items[0].requiresVerification);
    EXPECT_EQ(registry_->findCertificate(cert.id)->status, CertificateStatus::ACTIVE);
    EXPECT_EQ(registry_->listByAgent("agent-7").size(), 1u);
}

// --- Notifications ---

TEST_F(RenewalSchedulerTest, Notify_RenewedCarriesSuccessor) {
    auto cert = issue("agent-7", "1.0.0", CertificateLevel::SILVER);
    clock_.advanceDays(80);
    RecordingNotifier notifier;
    auto scheduler = makeScheduler();
    scheduler->setNotifier(&notifier);

    auto report = scheduler->runOnce();

    ASSERT_EQ(notifier.received.size(), 1u);
    const auto& sent = notifier.received[0];
    EXPECT_EQ(sent.event, RenewalEvent::RENEWED);
    EXPECT_EQ(sent.certificate.id, cert.id);
    EXPECT_EQ(sent.newCertificateId, report.items[0].newCertificateId);
    EXPECT_EQ(sent.timestamp, clock_.now());

    Json::Value json = sent.toJson();
    EXPECT_EQ(json["event"].asString(), "cga.certificate.renewed");
    EXPECT_EQ(json["certificate"]["id"].asString(), cert.id);
    EXPECT_EQ(json["certificate"]["agentId"].asString(), "agent-7");
    EXPECT_EQ(json["newCertificateId"].asString(), *report.items[0].newCertificateId);
}

TEST_F(RenewalSchedulerTest, Notify_SkippedCandidatesAnnounced) {
    auto platinum = issue("agent-p", "1.0.0", CertificateLevel::PLATINUM, 10);
    auto bronze = issue("agent-b", "1.0.0", CertificateLevel::BRONZE, 10);
    clock_.advanceDays(1);
    RecordingNotifier notifier;

    RenewalConfig config;
    config.autoRenewEnabled = false;
    auto scheduler = makeScheduler(config);
    scheduler->setNotifier(&notifier);
    scheduler->runOnce();

    ASSERT_EQ(notifier.received.size(), 2u);
    for (const auto& sent : notifier.received) {
        EXPECT_FALSE(sent.newCertificateId.has_value());
        if (sent.certificate.id == platinum.id) {
            EXPECT_EQ(sent.event, RenewalEvent::VERIFICATION_REQUIRED);
            EXPECT_EQ(sent.toJson()["event"].asString(), "cga.certificate.verification_required");
        } else {
            EXPECT_EQ(sent.certificate.id, bronze.id);
            EXPECT_EQ(sent.event, RenewalEvent::EXPIRING_SOON);
            EXPECT_EQ(sent.toJson()["event"].asString(), "cga.certificate.expiring_soon");
        }
    }
}

TEST_F(RenewalSchedulerTest, Notify_DeliveryFailureDoesNotAffectRenewal) {
    auto cert = issue("agent-7", "1.0.0", CertificateLevel::BRONZE);
    clock_.advanceDays(25);
    RecordingNotifier notifier;
    notifier.fail = true;
    auto scheduler = makeScheduler();
    scheduler->setNotifier(&notifier);

    auto report = scheduler->runOnce();

    EXPECT_EQ(report.succeeded, 1);
    EXPECT_EQ(registry_->findCertificate(cert.id)->status, CertificateStatus::SUPERSEDED);
    EXPECT_EQ(countAudit("certificate_renewed"), 1);
}

// --- Manual renewal ---

TEST_F(RenewalSchedulerTest, ManualRenewal_ReturnsVerificationUrl) {
    auto cert = issue("agent-p", "1.0.0", CertificateLevel::PLATINUM);
    auto ticket = makeScheduler()->requestManualRenewal(cert.id, AuditActor::parse("admin:alice"));

    EXPECT_EQ(ticket.certificateId, cert.id);
    EXPECT_EQ(ticket.verificationUrl, "https://cga.aigos.io/renew/" + cert.id);

    auto audit = registry_->listAudit(cert.id);
    ASSERT_FALSE(audit.empty());
    EXPECT_EQ(audit.front().entry.action, "manual_renewal_requested");
    EXPECT_EQ(audit.front().entry.actor.type, ActorType::ADMIN);

    EXPECT_THROW(makeScheduler()->requestManualRenewal("cga-missing"), common::NotFoundException);
}

// --- Background thread ---

TEST_F(RenewalSchedulerTest, Background_TriggerNowDeliversReport) {
    issue("agent-7", "1.0.0", CertificateLevel::BRONZE);
    clock_.advanceDays(25);

    RenewalConfig config;
    config.interval = std::chrono::minutes(60);
    auto scheduler = makeScheduler(config);

    std::mutex mutex;
    std::condition_variable cv;
    std::optional<RenewalReport> received;
    scheduler->setReportFn([&](const RenewalReport& report) {
        std::lock_guard<std::mutex> lock(mutex);
        received = report;
        cv.notify_all();
    });

    scheduler->start();
    EXPECT_TRUE(scheduler->isRunning());
    scheduler->triggerNow();

    {
        std::unique_lock<std::mutex> lock(mutex);
        ASSERT_TRUE(cv.wait_for(lock, std::chrono::seconds(10), [&]() { return received.has_value(); }));
        EXPECT_EQ(received->succeeded, 1);
    }

    scheduler->stop();
    EXPECT_FALSE(scheduler->isRunning());
}

TEST_F(RenewalSchedulerTest, Constructor_RejectsBadConfig) {
    RenewalConfig config;
    config.renewalWindowDays = 0;
    EXPECT_THROW(makeScheduler(config), std::invalid_argument);
    EXPECT_THROW(RenewalScheduler(nullptr, signing_.get()), std::invalid_argument);
}

} // anonymous namespace

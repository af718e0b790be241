/**
 * @file revocation_manager_test.cpp
 * @brief Unit tests for RevocationManager
 */

#include <gtest/gtest.h>
#include "services/revocation_manager.h"
#include "exceptions.h"
#include "test_helpers.h"

using namespace domain::models;
using services::RevocationManager;
using services::RevocationRequest;

namespace {

class RevocationManagerTest : public test_helpers::CaFixture {
protected:
    std::unique_ptr<RevocationManager> manager_;

    void SetUp() override {
        CaFixture::SetUp();
        manager_ = std::make_unique<RevocationManager>(registry_.get(), clock_.clock());
    }
};

TEST_F(RevocationManagerTest, Revoke_RecordsReasonActorAndTime) {
    auto cert = issue("agent-7");
    clock_.advanceSeconds(60);

    auto result = manager_->revoke(cert.id, "policy-violation", "admin:alice", std::string("INC-1042"));

    EXPECT_TRUE(result.created);
    EXPECT_EQ(result.record.certificateId, cert.id);
    EXPECT_EQ(result.record.reason, "policy-violation");
    EXPECT_EQ(result.record.revokedBy, "admin:alice");
    EXPECT_EQ(result.record.revokedAt, clock_.now());
    EXPECT_EQ(result.record.incidentId, std::optional<std::string>("INC-1042"));

    auto stored = registry_->findCertificate(cert.id);
    EXPECT_EQ(stored->status, CertificateStatus::REVOKED);
    EXPECT_EQ(stored->revocationReason, std::optional<std::string>("policy-violation"));
}

TEST_F(RevocationManagerTest, Revoke_SecondCallReturnsIdenticalRecord) {
    auto cert = issue("agent-7");
    auto first = manager_->revoke(cert.id, "policy-violation", "admin:alice");
    clock_.advanceSeconds(300);
    auto second = manager_->revoke(cert.id, "duplicate-report", "admin:bob");

    EXPECT_TRUE(first.created);
    EXPECT_FALSE(second.created);
    EXPECT_TRUE(first.record == second.record);
    EXPECT_EQ(registry_->listRevocations().size(), 1u);

    int revokeAudits = 0;
    for (const auto& entry : registry_->listAudit(cert.id)) {
        if (entry.entry.action == "certificate_revoked") ++revokeAudits;
    }
    EXPECT_EQ(revokeAudits, 1);
}

TEST_F(RevocationManagerTest, Revoke_AuditCarriesParsedActor) {
    auto cert = issue("agent-7");
    manager_->revoke(cert.id, "key-compromise", "admin:alice", std::string("INC-7"));

    auto audit = registry_->listAudit(cert.id);
    ASSERT_FALSE(audit.empty());
    const auto& entry = audit.front().entry;
    EXPECT_EQ(entry.action, "certificate_revoked");
    EXPECT_EQ(entry.actor.type, ActorType::ADMIN);
    EXPECT_EQ(entry.actor.id, std::optional<std::string>("alice"));
    EXPECT_EQ(entry.details["reason"].asString(), "key-compromise");
    EXPECT_EQ(entry.details["incidentId"].asString(), "INC-7");
}

TEST_F(RevocationManagerTest, Revoke_MissingFieldsRejected) {
    auto cert = issue("agent-7");
    EXPECT_THROW(manager_->revoke("", "reason", "admin:alice"), common::ValidationException);
    EXPECT_THROW(manager_->revoke(cert.id, " ", "admin:alice"), common::ValidationException);
    EXPECT_THROW(manager_->revoke(cert.id, "reason", ""), common::ValidationException);
    EXPECT_EQ(registry_->findCertificate(cert.id)->status, CertificateStatus::ACTIVE);
}

TEST_F(RevocationManagerTest, Revoke_UnknownCertificateNotFound) {
    EXPECT_THROW(manager_->revoke("cga-does-not-exist", "reason", "admin:alice"), common::NotFoundException);
}

TEST_F(RevocationManagerTest, Revoke_ExpiredCertificateStillRevocable) {
    auto cert = issue("agent-7", "1.0.0", CertificateLevel::BRONZE, 1);
    clock_.advanceDays(3);
    auto result = manager_->revoke(cert.id, "post-expiry-finding", "system");
    EXPECT_TRUE(result.created);
}

TEST_F(RevocationManagerTest, Revoke_SupersededCertificateKeepsSuccessorLive) {
    auto original = issue("agent-7");
    clock_.advanceDays(170);
    auto req = test_helpers::makeRequest("agent-7");
    req.supersedesId = original.id;
    auto renewed = signing_->sign(req);

    auto result = manager_->revoke(original.id, "key-compromise", "admin:alice");
    EXPECT_TRUE(result.created);

    auto old = registry_->findCertificate(original.id);
    EXPECT_EQ(old->status, CertificateStatus::SUPERSEDED);
    EXPECT_EQ(old->revocationReason, std::optional<std::string>("key-compromise"));
    EXPECT_TRUE(registry_->findRevocation(original.id).has_value());

    auto live = registry_->findLiveCertificate(original.identity());
    ASSERT_TRUE(live.has_value());
    EXPECT_EQ(live->id, renewed.id);
    EXPECT_EQ(live->status, CertificateStatus::ACTIVE);

    int nonSuperseded = 0;
    for (const auto& cert : registry_->listByAgent("agent-7")) {
        if (cert.status != CertificateStatus::SUPERSEDED) ++nonSuperseded;
    }
    EXPECT_EQ(nonSuperseded, 1);
}

TEST_F(RevocationManagerTest, Batch_IsolatesFailures) {
    auto a = issue("agent-1");
    auto b = issue("agent-2");

    std::vector<RevocationRequest> items = {
        {a.id, "policy-violation", "admin:alice", std::nullopt},
        {"cga-missing", "policy-violation", "admin:alice", std::nullopt},
        {b.id, "", "admin:alice", std::nullopt},
        {b.id, "policy-violation", "admin:alice", std::string("INC-9")},
    };
    auto batch = manager_->revokeBatch(items);

    EXPECT_EQ(batch.succeeded, 2);
    EXPECT_EQ(batch.failed, 2);
    ASSERT_EQ(batch.items.size(), 4u);
    EXPECT_TRUE(batch.items[0].success);
    EXPECT_FALSE(batch.items[1].success);
    EXPECT_FALSE(batch.items[1].error.empty());
    EXPECT_FALSE(batch.items[2].success);
    EXPECT_TRUE(batch.items[3].success);
    EXPECT_EQ(registry_->findCertificate(b.id)->status, CertificateStatus::REVOKED);

    Json::Value json = batch.toJson();
    EXPECT_EQ(json["items"].size(), 4u);
    EXPECT_EQ(json["items"][1]["success"].asBool(), false);
    EXPECT_TRUE(json["items"][0].isMember("revocation"));
}

TEST_F(RevocationManagerTest, Constructor_RejectsNullRegistry) {
    EXPECT_THROW(RevocationManager(nullptr), std::invalid_argument);
}

} // anonymous namespace

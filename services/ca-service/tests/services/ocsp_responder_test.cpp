/**
 * @file ocsp_responder_test.cpp
 * @brief Unit tests for OcspResponder status resolution, caching and signing
 */

#include <gtest/gtest.h>
#include "services/ocsp_responder.h"
#include "services/revocation_manager.h"
#include "common/json_utils.h"
#include "exceptions.h"
#include "test_helpers.h"

using namespace domain::models;
using services::OcspConfig;
using services::OcspResponder;
using services::RevocationManager;

namespace {

class OcspResponderTest : public test_helpers::CaFixture {
protected:
    std::unique_ptr<OcspResponder> responder_;
    std::unique_ptr<RevocationManager> revocations_;

    void SetUp() override {
        CaFixture::SetUp();
        OcspConfig config;
        config.responseValiditySeconds = 3600;
        responder_ = std::make_unique<OcspResponder>(registry_.get(), signing_.get(), config, clock_.clock());
        revocations_ = std::make_unique<RevocationManager>(registry_.get(), clock_.clock());
    }

    SingleResponse query(const std::string& id) {
        auto responses = responder_->queryStatus({id});
        EXPECT_EQ(responses.size(), 1u);
        return responses.front();
    }
};

// --- Status ---

TEST_F(OcspResponderTest, Status_GoodForActiveCertificate) {
    auto cert = issue("agent-7");
    auto sr = query(cert.id);
    EXPECT_EQ(sr.certStatus, CertStatus::GOOD);
    EXPECT_EQ(sr.thisUpdate, clock_.now());
    EXPECT_EQ(sr.nextUpdate, clock_.now() + std::chrono::seconds(3600));
    EXPECT_FALSE(sr.revocationTime.has_value());
}

TEST_F(OcspResponderTest, Status_UnknownIsNotCached) {
    auto sr = query("cga-never-issued");
    EXPECT_EQ(sr.certStatus, CertStatus::UNKNOWN);
    EXPECT_FALSE(registry_->findOcspCache("cga-never-issued").has_value());
}

TEST_F(OcspResponderTest, Status_ExpiredAfterValidity) {
    auto cert = issue("agent-7", "1.0.0", CertificateLevel::BRONZE, 1);
    clock_.advanceDays(2);
    EXPECT_EQ(query(cert.id).certStatus, CertStatus::EXPIRED);
}

TEST_F(OcspResponderTest, Status_RevokedBeatsExpired) {
    auto cert = issue("agent-7", "1.0.0", CertificateLevel::BRONZE, 1);
    revocations_->revoke(cert.id, "key-compromise", "admin:alice");
    clock_.advanceDays(2);

    auto sr = query(cert.id);
    EXPECT_EQ(sr.certStatus, CertStatus::REVOKED);
    ASSERT_TRUE(sr.revocationReason.has_value());
    EXPECT_EQ(*sr.revocationReason, "key-compromise");
}

TEST_F(OcspResponderTest, Status_SupersededReportsGood) {
    auto original = issue("agent-7");
    auto req = test_helpers::makeRequest("agent-7");
    req.supersedesId = original.id;
    signing_->sign(req);

    EXPECT_EQ(registry_->findCertificate(original.id)->status, CertificateStatus::SUPERSEDED);
    EXPECT_EQ(query(original.id).certStatus, CertStatus::GOOD);
}

TEST_F(OcspResponderTest, Status_RevokedSupersededReportsRevoked) {
    auto original = issue("agent-7");
    auto req = test_helpers::makeRequest("agent-7");
    req.supersedesId = original.id;
    auto renewed = signing_->sign(req);

    revocations_->revoke(original.id, "key-compromise", "admin:alice");

    EXPECT_EQ(query(original.id).certStatus, CertStatus::REVOKED);
    EXPECT_EQ(query(renewed.id).certStatus, CertStatus::GOOD);
}

// --- Cache ---

TEST_F(OcspResponderTest, Cache_SameThisUpdateWithinWindow) {
    auto cert = issue("agent-7");
    auto first = query(cert.id);
    clock_.advanceSeconds(1800);
    auto second = query(cert.id);

    EXPECT_EQ(second.thisUpdate, first.thisUpdate);
    EXPECT_TRUE(second == first);
}

TEST_F(OcspResponderTest, Cache_RefreshedAfterWindow) {
    auto cert = issue("agent-7");
    auto first = query(cert.id);
    clock_.advanceSeconds(3600);
    auto second = query(cert.id);

    EXPECT_GT(second.thisUpdate, first.thisUpdate);
    EXPECT_EQ(second.thisUpdate, clock_.now());
    EXPECT_EQ(registry_->findOcspCache(cert.id)->thisUpdate, second.thisUpdate);
}

TEST_F(OcspResponderTest, Cache_StaleGoodNeverServedAfterExpiry) {
    auto cert = issue("agent-7", "1.0.0", CertificateLevel::BRONZE, 1);
    clock_.advanceSeconds(86400 - 600);
    EXPECT_EQ(query(cert.id).certStatus, CertStatus::GOOD);

    // Cached "good" is still inside its window, but the certificate lapsed
    clock_.advanceSeconds(900);
    EXPECT_EQ(query(cert.id).certStatus, CertStatus::EXPIRED);
}

TEST_F(OcspResponderTest, Cache_StatusMismatchIgnoresEntry) {
    auto cert = issue("agent-7");
    revocations_->revoke(cert.id, "policy-violation", "admin:alice");

    // Plant a "good" entry that a stale writer could have left behind
    SingleResponse forged;
    forged.certificateId = cert.id;
    forged.certStatus = CertStatus::GOOD;
    forged.thisUpdate = clock_.now();
    forged.nextUpdate = clock_.now() + std::chrono::hours(1);
    OcspCacheEntry entry;
    entry.certificateId = cert.id;
    entry.responseBytes = common::toCompactJson(forged.toJson());
    entry.producedAt = forged.thisUpdate;
    entry.thisUpdate = forged.thisUpdate;
    entry.nextUpdate = forged.nextUpdate;
    registry_->upsertOcspCache(entry);

    EXPECT_EQ(query(cert.id).certStatus, CertStatus::REVOKED);
}

TEST_F(OcspResponderTest, Cache_DisabledAlwaysFresh) {
    OcspConfig config;
    config.cacheEnabled = false;
    OcspResponder uncached(registry_.get(), signing_.get(), config, clock_.clock());

    auto cert = issue("agent-7");
    auto first = uncached.queryStatus({cert.id}).front();
    clock_.advanceSeconds(10);
    auto second = uncached.queryStatus({cert.id}).front();

    EXPECT_GT(second.thisUpdate, first.thisUpdate);
    EXPECT_FALSE(registry_->findOcspCache(cert.id).has_value());
}

// --- Signed responses ---

TEST_F(OcspResponderTest, Respond_SignedBatchVerifies) {
    auto a = issue("agent-1");
    auto b = issue("agent-2");
    revocations_->revoke(b.id, "policy-violation", "admin:alice");

    auto response = responder_->respond({a.id, b.id, "cga-unknown"});

    EXPECT_EQ(response.responseStatus, OcspResponseStatus::SUCCESSFUL);
    ASSERT_EQ(response.responses.size(), 3u);
    EXPECT_EQ(response.responses[0].certStatus, CertStatus::GOOD);
    EXPECT_EQ(response.responses[1].certStatus, CertStatus::REVOKED);
    EXPECT_EQ(response.responses[2].certStatus, CertStatus::UNKNOWN);
    EXPECT_EQ(response.signatureKeyId, registry_->getActiveKey()->id);
    EXPECT_TRUE(responder_->verifyResponse(response));

    response.responses[1].certStatus = CertStatus::GOOD;
    EXPECT_FALSE(responder_->verifyResponse(response));
}

TEST_F(OcspResponderTest, Respond_MalformedRequestUnsigned) {
    auto empty = responder_->respond({});
    EXPECT_EQ(empty.responseStatus, OcspResponseStatus::MALFORMED_REQUEST);
    EXPECT_TRUE(empty.responses.empty());
    EXPECT_TRUE(empty.signature.empty());
    EXPECT_FALSE(responder_->verifyResponse(empty));

    auto blank = responder_->respond({"cga-1", ""});
    EXPECT_EQ(blank.responseStatus, OcspResponseStatus::MALFORMED_REQUEST);

    EXPECT_THROW(responder_->queryStatus({}), common::ValidationException);
}

TEST_F(OcspResponderTest, Respond_VerifiesAcrossKeyRotation) {
    auto cert = issue("agent-7");
    auto response = responder_->respond({cert.id});
    clock_.advanceSeconds(1);
    signing_->rotateKey();
    EXPECT_TRUE(responder_->verifyResponse(response));
}

// --- Scenario ---

TEST_F(OcspResponderTest, Scenario_RevocationReplacesGoodResponse) {
    auto req = test_helpers::makeRequest("agent-7", "1.0.0", "org-42", CertificateLevel::GOLD);
    auto cert = signing_->sign(req);

    auto before = responder_->respond({cert.id});
    ASSERT_EQ(before.responses.size(), 1u);
    EXPECT_EQ(before.responses[0].certStatus, CertStatus::GOOD);

    clock_.advanceSeconds(120);
    auto revoked = revocations_->revoke(cert.id, "policy-violation", "admin:alice");

    clock_.advanceSeconds(1);
    auto after = responder_->respond({cert.id});
    ASSERT_EQ(after.responses.size(), 1u);
    const auto& sr = after.responses[0];
    EXPECT_EQ(sr.certStatus, CertStatus::REVOKED);
    ASSERT_TRUE(sr.revocationTime.has_value());
    EXPECT_EQ(*sr.revocationTime, revoked.record.revokedAt);
    EXPECT_EQ(sr.revocationReason, std::optional<std::string>("policy-violation"));
    EXPECT_GT(sr.thisUpdate, before.responses[0].thisUpdate);
    EXPECT_TRUE(responder_->verifyResponse(after));
}

// --- Revocation list ---

TEST_F(OcspResponderTest, RevocationList_SignedAndComplete) {
    auto a = issue("agent-1");
    auto b = issue("agent-2");
    issue("agent-3");
    revocations_->revoke(a.id, "policy-violation", "admin:alice");
    clock_.advanceSeconds(5);
    revocations_->revoke(b.id, "key-compromise", "system");

    auto list = responder_->getRevocationList();
    EXPECT_EQ(list.issuerId, "cga.aigos.io");
    ASSERT_EQ(list.revokedCertificates.size(), 2u);
    EXPECT_EQ(list.revokedCertificates[0].certificateId, a.id);
    EXPECT_EQ(list.revokedCertificates[1].certificateId, b.id);
    EXPECT_TRUE(responder_->verifyRevocationList(list));

    list.revokedCertificates.pop_back();
    EXPECT_FALSE(responder_->verifyRevocationList(list));
}

TEST_F(OcspResponderTest, Constructor_RejectsBadConfig) {
    OcspConfig config;
    config.responseValiditySeconds = 0;
    EXPECT_THROW(OcspResponder(registry_.get(), signing_.get(), config), std::invalid_argument);
    EXPECT_THROW(OcspResponder(nullptr, signing_.get()), std::invalid_argument);
}

} // anonymous namespace

/**
 * @file certificate_authority_test.cpp
 * @brief End-to-end tests through the CertificateAuthority facade
 */

#include <gtest/gtest.h>
#include "services/certificate_authority.h"
#include "exceptions.h"
#include "test_helpers.h"

using namespace domain::models;
using services::CertificateAuthority;
using services::OcspResponder;
using services::RevocationManager;

namespace {

class CertificateAuthorityTest : public test_helpers::CaFixture {
protected:
    std::unique_ptr<RevocationManager> revocations_;
    std::unique_ptr<OcspResponder> ocsp_;
    std::unique_ptr<CertificateAuthority> ca_;

    void SetUp() override {
        CaFixture::SetUp();
        revocations_ = std::make_unique<RevocationManager>(registry_.get(), clock_.clock());
        ocsp_ = std::make_unique<OcspResponder>(registry_.get(), signing_.get(), services::OcspConfig{},
                                                clock_.clock());
        ca_ = std::make_unique<CertificateAuthority>(registry_.get(), signing_.get(), revocations_.get(),
                                                     ocsp_.get());
    }

    static Json::Value payload(const std::string& agentId, const std::string& level = "gold") {
        Json::Value body;
        body["agentId"] = agentId;
        body["agentVersion"] = "1.0.0";
        body["orgId"] = "org-42";
        body["orgName"] = "Acme Robotics";
        body["level"] = level;
        body["attestation"] = test_helpers::sampleAttestation(agentId);
        return body;
    }
};

TEST_F(CertificateAuthorityTest, Submit_JsonPayloadIssuesCertificate) {
    auto cert = ca_->submitSigningRequest(payload("agent-7", "silver"), AuditActor::parse("api:portal"));

    EXPECT_EQ(cert.level, CertificateLevel::SILVER);
    EXPECT_TRUE(ca_->verifySignature(cert));
    EXPECT_EQ(ca_->getCertificate(cert.id)->id, cert.id);
    EXPECT_EQ(registry_->listAudit(cert.id).front().entry.actor.type, ActorType::API);
}

TEST_F(CertificateAuthorityTest, Submit_InvalidPayloadNamesField) {
    auto body = payload("agent-7");
    body.removeMember("orgId");
    try {
        ca_->submitSigningRequest(body);
        FAIL() << "expected ValidationException";
    } catch (const common::ValidationException& e) {
        EXPECT_EQ(e.field(), "orgId");
        EXPECT_EQ(e.toErrorResponse().toJson()["success"].asBool(), false);
    }
    EXPECT_TRUE(ca_->listByAgent("agent-7").empty());
}

TEST_F(CertificateAuthorityTest, Submit_DuplicateConflicts) {
    ca_->submitSigningRequest(payload("agent-7"));
    EXPECT_THROW(ca_->submitSigningRequest(payload("agent-7")), common::ConflictException);
}

TEST_F(CertificateAuthorityTest, Lifecycle_IssueQueryRevoke) {
    auto cert = ca_->submitSigningRequest(test_helpers::makeRequest("agent-7"));
    EXPECT_EQ(ca_->queryStatus({cert.id}).front().certStatus, CertStatus::GOOD);

    clock_.advanceSeconds(30);
    auto revoked = ca_->revoke(cert.id, "policy-violation", "admin:alice", std::string("INC-1"));
    EXPECT_EQ(revoked.revokedAt, clock_.now());
    EXPECT_EQ(revoked.incidentId, std::optional<std::string>("INC-1"));

    auto response = ca_->respond({cert.id});
    ASSERT_EQ(response.responses.size(), 1u);
    EXPECT_EQ(response.responses[0].certStatus, CertStatus::REVOKED);
    EXPECT_TRUE(ocsp_->verifyResponse(response));

    // Revocation does not invalidate the stored signature
    EXPECT_TRUE(ca_->verifySignature(*ca_->getCertificate(cert.id)));
}

TEST_F(CertificateAuthorityTest, Listing_ByAgentAndOrgNewestFirst) {
    auto v1 = ca_->submitSigningRequest(test_helpers::makeRequest("agent-7", "1.0.0"));
    clock_.advanceSeconds(10);
    auto v2 = ca_->submitSigningRequest(test_helpers::makeRequest("agent-7", "2.0.0"));
    clock_.advanceSeconds(10);
    auto other = ca_->submitSigningRequest(test_helpers::makeRequest("agent-8", "1.0.0", "org-99"));

    auto byAgent = ca_->listByAgent("agent-7");
    ASSERT_EQ(byAgent.size(), 2u);
    EXPECT_EQ(byAgent[0].id, v2.id);
    EXPECT_EQ(byAgent[1].id, v1.id);

    EXPECT_EQ(ca_->listByOrg("org-42").size(), 2u);
    ASSERT_EQ(ca_->listByOrg("org-99").size(), 1u);
    EXPECT_EQ(ca_->listByOrg("org-99")[0].id, other.id);
    EXPECT_FALSE(ca_->getCertificate("cga-missing").has_value());
}

TEST_F(CertificateAuthorityTest, CaInfo_PublishesActiveKey) {
    auto info = ca_->caInfo();
    EXPECT_EQ(info.keyId, registry_->getActiveKey()->id);
    EXPECT_EQ(info.algorithm, "Ed25519");
    EXPECT_NE(info.publicKey.find("BEGIN PUBLIC KEY"), std::string::npos);

    Json::Value json = info.toJson();
    EXPECT_EQ(json["issuer"]["id"].asString(), "cga.aigos.io");
}

TEST_F(CertificateAuthorityTest, Constructor_RejectsNullDependencies) {
    EXPECT_THROW(CertificateAuthority(registry_.get(), signing_.get(), nullptr, ocsp_.get()),
                 std::invalid_argument);
}

} // anonymous namespace

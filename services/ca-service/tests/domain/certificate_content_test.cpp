/**
 * @file certificate_content_test.cpp
 * @brief Unit tests for the canonical certificate document
 */

#include <gtest/gtest.h>
#include "domain/models/certificate_content.h"
#include "test_helpers.h"

#include <cga/utils/time_utils.h>

using namespace domain::models;

namespace {

class CertificateContentTest : public ::testing::Test {
protected:
    CertificateContent content_;

    void SetUp() override {
        content_.id = "cga-3f1c2b7e-0d4a-4c55-9a51-5b0a7e6f1d22";
        content_.version = 2;
        content_.agentId = "agent-7";
        content_.agentVersion = "1.0.0";
        content_.orgId = "org-42";
        content_.orgName = "Acme Robotics";
        content_.orgDomain = "acme.example";
        content_.attestation = test_helpers::sampleAttestation("agent-7");
        content_.level = CertificateLevel::GOLD;
        content_.issuedAt = *cga::utils::parseIso8601("2026-03-01T12:00:00.000Z");
        content_.expiresAt = *cga::utils::parseIso8601("2026-08-28T12:00:00.000Z");
        content_.issuerId = "cga.aigos.io";
        content_.issuerName = "AIGOS CGA Certificate Authority";
        content_.supersedesId = "cga-previous";
    }
};

TEST_F(CertificateContentTest, ToJson_DocumentLayout) {
    Json::Value doc = content_.toJson();

    EXPECT_EQ(doc["apiVersion"].asString(), "aigos.io/v1");
    EXPECT_EQ(doc["kind"].asString(), "CGACertificate");
    EXPECT_EQ(doc["metadata"]["id"].asString(), content_.id);
    EXPECT_EQ(doc["metadata"]["version"].asInt(), 2);
    EXPECT_EQ(doc["spec"]["agent"]["id"].asString(), "agent-7");
    EXPECT_EQ(doc["spec"]["agent"]["organization"]["domain"].asString(), "acme.example");
    EXPECT_EQ(doc["spec"]["attestation"]["document"], content_.attestation);
    EXPECT_EQ(doc["spec"]["certification"]["level"].asString(), "GOLD");
    EXPECT_EQ(doc["spec"]["certification"]["issued_at"].asString(), "2026-03-01T12:00:00.000Z");
    EXPECT_EQ(doc["spec"]["certification"]["issuer"]["id"].asString(), "cga.aigos.io");
    EXPECT_EQ(doc["spec"]["certification"]["renewal"]["supersedes"].asString(), "cga-previous");
}

TEST_F(CertificateContentTest, ToJson_FirstIssueHasNoRenewalBlock) {
    content_.supersedesId.reset();
    content_.orgDomain.reset();
    Json::Value doc = content_.toJson();
    EXPECT_FALSE(doc["spec"]["certification"].isMember("renewal"));
    EXPECT_FALSE(doc["spec"]["agent"]["organization"].isMember("domain"));
}

TEST_F(CertificateContentTest, Canonical_IsStableAcrossCalls) {
    EXPECT_EQ(content_.toCanonicalJson(), content_.toCanonicalJson());

    // Member insertion order must not change the bytes
    CertificateContent copy = content_;
    Json::Value reordered;
    reordered["controls"]["humanOversight"] = "required";
    reordered["controls"]["killSwitch"] = true;
    reordered["agent"] = "agent-7";
    reordered["kind"] = "GovernanceAttestation";
    reordered["apiVersion"] = "aigos.io/v1";
    copy.attestation = reordered;
    EXPECT_EQ(copy.toCanonicalJson(), content_.toCanonicalJson());
}

TEST_F(CertificateContentTest, Canonical_IsCompact) {
    std::string canonical = content_.toCanonicalJson();
    EXPECT_EQ(canonical.find('\n'), std::string::npos);
    EXPECT_EQ(canonical.front(), '{');
}

TEST_F(CertificateContentTest, Parse_ReadsBackAllFields) {
    auto parsed = CertificateContent::parse(content_.toCanonicalJson());
    ASSERT_TRUE(parsed.has_value());

    EXPECT_EQ(parsed->id, content_.id);
    EXPECT_EQ(parsed->version, 2);
    EXPECT_EQ(parsed->agentId, "agent-7");
    EXPECT_EQ(parsed->agentVersion, "1.0.0");
    EXPECT_EQ(parsed->orgId, "org-42");
    EXPECT_EQ(parsed->orgName, "Acme Robotics");
    ASSERT_TRUE(parsed->orgDomain.has_value());
    EXPECT_EQ(*parsed->orgDomain, "acme.example");
    EXPECT_EQ(parsed->attestation, content_.attestation);
    EXPECT_EQ(parsed->level, CertificateLevel::GOLD);
    EXPECT_EQ(parsed->issuedAt, content_.issuedAt);
    EXPECT_EQ(parsed->expiresAt, content_.expiresAt);
    ASSERT_TRUE(parsed->supersedesId.has_value());
    EXPECT_EQ(*parsed->supersedesId, "cga-previous");
    EXPECT_EQ(parsed->toCanonicalJson(), content_.toCanonicalJson());
}

TEST_F(CertificateContentTest, Parse_RejectsForeignDocuments) {
    EXPECT_FALSE(CertificateContent::parse("not json").has_value());
    EXPECT_FALSE(CertificateContent::parse("[1,2,3]").has_value());
    EXPECT_FALSE(CertificateContent::parse(R"({"apiVersion":"v1","kind":"Pod"})").has_value());

    Json::Value doc = content_.toJson();
    doc["spec"]["certification"]["level"] = "DIAMOND";
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    EXPECT_FALSE(CertificateContent::parse(Json::writeString(builder, doc)).has_value());
}

} // anonymous namespace

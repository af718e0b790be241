/**
 * @file signing_request_test.cpp
 * @brief Unit tests for SigningRequest parsing and validation
 */

#include <gtest/gtest.h>
#include "domain/models/signing_request.h"
#include "exceptions.h"
#include "test_helpers.h"

using namespace domain::models;

namespace {

class SigningRequestTest : public ::testing::Test {
protected:
    Json::Value body_;

    void SetUp() override {
        body_["agentId"] = "agent-7";
        body_["agentVersion"] = "1.0.0";
        body_["orgId"] = "org-42";
        body_["orgName"] = "Acme Robotics";
        body_["level"] = "gold";
        body_["attestation"] = test_helpers::sampleAttestation("agent-7");
    }

    /// Field named by the ValidationException thrown for `body`
    static std::string rejectedField(const Json::Value& body) {
        try {
            SigningRequest::fromJson(body);
        } catch (const common::ValidationException& e) {
            return e.field();
        }
        return "";
    }
};

TEST_F(SigningRequestTest, FromJson_ParsesRequiredFields) {
    auto req = SigningRequest::fromJson(body_);

    EXPECT_EQ(req.agentId, "agent-7");
    EXPECT_EQ(req.agentVersion, "1.0.0");
    EXPECT_EQ(req.orgId, "org-42");
    EXPECT_EQ(req.orgName, "Acme Robotics");
    EXPECT_EQ(req.level, CertificateLevel::GOLD);
    EXPECT_FALSE(req.orgDomain.has_value());
    EXPECT_FALSE(req.validityDays.has_value());
    EXPECT_EQ(req.attestation["controls"]["killSwitch"].asBool(), true);
}

TEST_F(SigningRequestTest, FromJson_OptionalFields) {
    body_["orgDomain"] = "acme.example";
    body_["validityDays"] = 45;
    body_["supersedesId"] = "cga-previous";

    auto req = SigningRequest::fromJson(body_);
    ASSERT_TRUE(req.orgDomain.has_value());
    EXPECT_EQ(*req.orgDomain, "acme.example");
    EXPECT_EQ(req.effectiveValidityDays(), 45);
    ASSERT_TRUE(req.supersedesId.has_value());
    EXPECT_EQ(*req.supersedesId, "cga-previous");
}

TEST_F(SigningRequestTest, EffectiveValidity_DefaultsByLevel) {
    auto req = SigningRequest::fromJson(body_);
    EXPECT_EQ(req.effectiveValidityDays(), defaultValidityDays(CertificateLevel::GOLD));

    body_["level"] = "BRONZE";
    EXPECT_EQ(SigningRequest::fromJson(body_).effectiveValidityDays(), 30);
}

TEST_F(SigningRequestTest, FromJson_MissingFieldNamed) {
    for (const char* field : {"agentId", "agentVersion", "orgId", "orgName", "level", "attestation"}) {
        Json::Value body = body_;
        body.removeMember(field);
        EXPECT_EQ(rejectedField(body), field) << "missing " << field;
    }
}

TEST_F(SigningRequestTest, FromJson_IllTypedFieldsRejected) {
    Json::Value body = body_;
    body["agentId"] = 7;
    EXPECT_EQ(rejectedField(body), "agentId");

    body = body_;
    body["validityDays"] = "ninety";
    EXPECT_EQ(rejectedField(body), "validityDays");

    body = body_;
    body["level"] = "DIAMOND";
    EXPECT_EQ(rejectedField(body), "level");
}

TEST_F(SigningRequestTest, FromJson_NonObjectBody) {
    EXPECT_THROW(SigningRequest::fromJson(Json::Value("agent-7")), common::ValidationException);
    EXPECT_THROW(SigningRequest::fromJson(Json::Value(Json::arrayValue)), common::ValidationException);
}

TEST_F(SigningRequestTest, Validate_BlankNamesRejected) {
    auto req = test_helpers::makeRequest("agent-7");
    req.orgName = "   ";
    try {
        req.validate();
        FAIL() << "Expected ValidationException";
    } catch (const common::ValidationException& e) {
        EXPECT_EQ(e.field(), "orgName");
        EXPECT_EQ(e.getCode(), common::ErrorCode::SERVICE_INVALID_INPUT);
    }
}

TEST_F(SigningRequestTest, Validate_EmptyAttestationRejected) {
    auto req = test_helpers::makeRequest("agent-7");
    req.attestation = Json::Value(Json::objectValue);
    EXPECT_THROW(req.validate(), common::ValidationException);

    req.attestation = Json::Value("");
    EXPECT_THROW(req.validate(), common::ValidationException);
}

TEST_F(SigningRequestTest, Validate_NonPositiveValidityRejected) {
    auto req = test_helpers::makeRequest("agent-7");
    req.validityDays = 0;
    EXPECT_THROW(req.validate(), common::ValidationException);
    req.validityDays = -5;
    EXPECT_THROW(req.validate(), common::ValidationException);
}

TEST_F(SigningRequestTest, ToJson_ParsesBack) {
    auto req = test_helpers::makeRequest("agent-9", "2.1.0", "org-1", CertificateLevel::SILVER);
    req.validityDays = 10;
    auto parsed = SigningRequest::fromJson(req.toJson());
    EXPECT_EQ(parsed.agentId, "agent-9");
    EXPECT_EQ(parsed.level, CertificateLevel::SILVER);
    EXPECT_EQ(parsed.effectiveValidityDays(), 10);
    EXPECT_EQ(parsed.attestation, req.attestation);
}

} // anonymous namespace

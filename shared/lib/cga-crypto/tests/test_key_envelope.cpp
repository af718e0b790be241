/**
 * @file test_key_envelope.cpp
 * @brief Unit tests for scrypt/AES-GCM private key envelopes
 *
 * Uses a low scrypt cost (N=2^10) to keep the suite fast.
 */

#include <gtest/gtest.h>
#include <cga/crypto/key_envelope.h>
#include <cga/crypto/key_pair.h>
#include <cga/utils/string_utils.h>
#include "exceptions.h"

using namespace cga::crypto;

class KeyEnvelopeTest : public ::testing::Test {
protected:
    KdfParams fastParams_;

    void SetUp() override {
        fastParams_.logN = 10;
        fastParams_.r = 8;
        fastParams_.p = 1;
    }

    static SecureBuffer bufferOf(const std::string& s) {
        return SecureBuffer(reinterpret_cast<const uint8_t*>(s.data()), s.size());
    }

    static std::string textOf(const SecureBuffer& b) {
        return std::string(reinterpret_cast<const char*>(b.data()), b.size());
    }
};

TEST_F(KeyEnvelopeTest, SealOpen_RoundTrip) {
    std::string envelope = sealPrivateKey(bufferOf("secret key material"), "correct horse", fastParams_);
    EXPECT_EQ(textOf(openPrivateKey(envelope, "correct horse")), "secret key material");
}

TEST_F(KeyEnvelopeTest, Seal_DoesNotContainPlaintext) {
    std::string envelope = sealPrivateKey(bufferOf("PLAINTEXT-MARKER"), "pw", fastParams_);
    auto raw = cga::utils::fromBase64(envelope);
    ASSERT_TRUE(raw.has_value());
    std::string bytes(raw->begin(), raw->end());
    EXPECT_EQ(bytes.find("PLAINTEXT-MARKER"), std::string::npos);
    EXPECT_EQ(bytes.substr(0, 4), "CGAK");
}

TEST_F(KeyEnvelopeTest, Seal_FreshSaltEachTime) {
    auto a = sealPrivateKey(bufferOf("same"), "pw", fastParams_);
    auto b = sealPrivateKey(bufferOf("same"), "pw", fastParams_);
    EXPECT_NE(a, b);
}

TEST_F(KeyEnvelopeTest, Open_WrongPassphraseThrows) {
    auto envelope = sealPrivateKey(bufferOf("secret"), "right", fastParams_);
    try {
        openPrivateKey(envelope, "wrong");
        FAIL() << "Expected CryptoException";
    } catch (const common::CryptoException& e) {
        EXPECT_EQ(e.getCode(), common::ErrorCode::CRYPTO_DECRYPTION_FAILED);
    }
}

TEST_F(KeyEnvelopeTest, Open_TamperedCiphertextThrows) {
    auto envelope = sealPrivateKey(bufferOf("secret"), "pw", fastParams_);
    auto raw = *cga::utils::fromBase64(envelope);
    raw.back() ^= 0x01;
    EXPECT_THROW(openPrivateKey(cga::utils::toBase64(raw), "pw"), common::CryptoException);
}

TEST_F(KeyEnvelopeTest, Open_TamperedKdfHeaderThrows) {
    auto envelope = sealPrivateKey(bufferOf("secret"), "pw", fastParams_);
    auto raw = *cga::utils::fromBase64(envelope);
    raw[13] = 2;  // p: 1 -> 2, authenticated as AAD
    EXPECT_THROW(openPrivateKey(cga::utils::toBase64(raw), "pw"), common::CryptoException);
}

TEST_F(KeyEnvelopeTest, Open_MalformedThrows) {
    EXPECT_THROW(openPrivateKey("", "pw"), common::CryptoException);
    EXPECT_THROW(openPrivateKey("!!!!", "pw"), common::CryptoException);
    EXPECT_THROW(openPrivateKey(cga::utils::toBase64(std::vector<uint8_t>(80, 0x41)), "pw"),
                 common::CryptoException);
}

TEST_F(KeyEnvelopeTest, Seal_EmptyPassphraseThrows) {
    EXPECT_THROW(sealPrivateKey(bufferOf("secret"), "", fastParams_), common::CryptoException);
}

TEST_F(KeyEnvelopeTest, Seal_InvalidParamsThrows) {
    KdfParams bad;
    bad.logN = 0;
    EXPECT_THROW(sealPrivateKey(bufferOf("secret"), "pw", bad), common::CryptoException);
}

TEST_F(KeyEnvelopeTest, SealedKeyPair_SignsAfterOpen) {
    auto kp = KeyPair::generate(SignatureAlgorithm::ED25519);
    auto envelope = sealPrivateKey(kp.privateKeyPem(), "pw", fastParams_);

    auto restored = KeyPair::fromPrivatePem(openPrivateKey(envelope, "pw"));
    EXPECT_TRUE(kp.verify("doc", restored.sign("doc")));
}

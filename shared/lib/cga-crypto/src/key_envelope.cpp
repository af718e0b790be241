/**
 * @file key_envelope.cpp
 * @brief scrypt + AES-256-GCM private key envelope
 */

#include "cga/crypto/key_envelope.h"
#include "exceptions.h"

#include <cga/utils/string_utils.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <algorithm>
#include <memory>
#include <vector>

namespace cga::crypto {

namespace {

constexpr char MAGIC[4] = {'C', 'G', 'A', 'K'};
constexpr uint8_t VERSION = 1;
constexpr size_t HEADER_LEN = 4 + 1 + 1 + 4 + 4;
constexpr size_t SALT_LEN = 16;
constexpr size_t IV_LEN = 12;
constexpr size_t TAG_LEN = 16;
constexpr size_t KEK_LEN = 32;
constexpr uint8_t MAX_LOG_N = 22;

struct CipherCtxDeleter { void operator()(EVP_CIPHER_CTX* c) { EVP_CIPHER_CTX_free(c); } };
using UniqueCipherCtx = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

void putU32(std::vector<uint8_t>& out, uint32_t v) {
    out.push_back(static_cast<uint8_t>(v >> 24));
    out.push_back(static_cast<uint8_t>(v >> 16));
    out.push_back(static_cast<uint8_t>(v >> 8));
    out.push_back(static_cast<uint8_t>(v));
}

uint32_t getU32(const uint8_t* p) {
    return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
}

void validateParams(const KdfParams& params) {
    if (params.logN < 1 || params.logN > MAX_LOG_N || params.r == 0 || params.p == 0) {
        throw common::CryptoException("Invalid scrypt parameters",
            "logN=" + std::to_string(params.logN) + " r=" + std::to_string(params.r) +
            " p=" + std::to_string(params.p));
    }
}

SecureBuffer deriveKek(const std::string& passphrase, const uint8_t* salt, const KdfParams& params) {
    validateParams(params);

    uint64_t n = uint64_t{1} << params.logN;
    // scrypt needs 128 * r * (N + p) bytes; leave headroom over OpenSSL's 32 MB default
    uint64_t maxmem = 128 * uint64_t{params.r} * (n + params.p + 2) + (uint64_t{1} << 20);

    SecureBuffer kek(KEK_LEN);
    if (EVP_PBE_scrypt(passphrase.data(), passphrase.size(), salt, SALT_LEN,
                       n, params.r, params.p, maxmem, kek.data(), kek.size()) != 1) {
        ERR_clear_error();
        throw common::CryptoException("scrypt key derivation failed");
    }
    return kek;
}

} // anonymous namespace

std::string sealPrivateKey(const SecureBuffer& plaintext,
                           const std::string& passphrase,
                           const KdfParams& params) {
    if (passphrase.empty()) {
        throw common::CryptoException("Key encryption passphrase must not be empty");
    }
    if (plaintext.empty()) {
        throw common::CryptoException("Nothing to encrypt");
    }

    std::vector<uint8_t> out;
    out.reserve(HEADER_LEN + SALT_LEN + IV_LEN + TAG_LEN + plaintext.size());
    out.insert(out.end(), MAGIC, MAGIC + 4);
    out.push_back(VERSION);
    out.push_back(params.logN);
    putU32(out, params.r);
    putU32(out, params.p);

    uint8_t salt[SALT_LEN];
    uint8_t iv[IV_LEN];
    if (RAND_bytes(salt, SALT_LEN) != 1 || RAND_bytes(iv, IV_LEN) != 1) {
        ERR_clear_error();
        throw common::KeyGenerationException("RAND_bytes failed for salt/IV");
    }

    SecureBuffer kek = deriveKek(passphrase, salt, params);

    UniqueCipherCtx ctx(EVP_CIPHER_CTX_new());
    int len = 0;
    std::vector<uint8_t> ciphertext(plaintext.size());
    uint8_t tag[TAG_LEN];

    bool ok = ctx &&
        EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) == 1 &&
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, IV_LEN, nullptr) == 1 &&
        EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, kek.data(), iv) == 1 &&
        EVP_EncryptUpdate(ctx.get(), nullptr, &len, out.data(), static_cast<int>(HEADER_LEN)) == 1 &&
        EVP_EncryptUpdate(ctx.get(), ciphertext.data(), &len,
                          plaintext.data(), static_cast<int>(plaintext.size())) == 1;
    int total = len;
    ok = ok &&
        EVP_EncryptFinal_ex(ctx.get(), ciphertext.data() + total, &len) == 1 &&
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, TAG_LEN, tag) == 1;
    if (!ok) {
        ERR_clear_error();
        throw common::CryptoException("AES-256-GCM encryption failed");
    }
    total += len;
    ciphertext.resize(static_cast<size_t>(total));

    out.insert(out.end(), salt, salt + SALT_LEN);
    out.insert(out.end(), iv, iv + IV_LEN);
    out.insert(out.end(), tag, tag + TAG_LEN);
    out.insert(out.end(), ciphertext.begin(), ciphertext.end());

    return cga::utils::toBase64(out);
}

SecureBuffer openPrivateKey(const std::string& envelope, const std::string& passphrase) {
    auto decoded = cga::utils::fromBase64(envelope);
    if (!decoded || decoded->size() <= HEADER_LEN + SALT_LEN + IV_LEN + TAG_LEN) {
        throw common::CryptoException(common::ErrorCode::CRYPTO_DECRYPTION_FAILED,
            "Malformed key envelope", "envelope too short or not base64");
    }

    const std::vector<uint8_t>& buf = *decoded;
    if (!std::equal(MAGIC, MAGIC + 4, buf.begin()) || buf[4] != VERSION) {
        throw common::CryptoException(common::ErrorCode::CRYPTO_DECRYPTION_FAILED,
            "Malformed key envelope", "bad magic or unsupported version");
    }

    KdfParams params;
    params.logN = buf[5];
    params.r = getU32(&buf[6]);
    params.p = getU32(&buf[10]);

    const uint8_t* salt = buf.data() + HEADER_LEN;
    const uint8_t* iv = salt + SALT_LEN;
    const uint8_t* tag = iv + IV_LEN;
    const uint8_t* ciphertext = tag + TAG_LEN;
    size_t ctLen = buf.size() - (HEADER_LEN + SALT_LEN + IV_LEN + TAG_LEN);

    SecureBuffer kek = deriveKek(passphrase, salt, params);

    UniqueCipherCtx ctx(EVP_CIPHER_CTX_new());
    SecureBuffer plaintext(ctLen);
    int len = 0;

    bool ok = ctx &&
        EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) == 1 &&
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, IV_LEN, nullptr) == 1 &&
        EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, kek.data(), iv) == 1 &&
        EVP_DecryptUpdate(ctx.get(), nullptr, &len, buf.data(), static_cast<int>(HEADER_LEN)) == 1 &&
        EVP_DecryptUpdate(ctx.get(), plaintext.data(), &len, ciphertext, static_cast<int>(ctLen)) == 1 &&
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, TAG_LEN, const_cast<uint8_t*>(tag)) == 1;
    int total = len;
    ok = ok && EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + total, &len) == 1;
    if (!ok) {
        ERR_clear_error();
        throw common::CryptoException(common::ErrorCode::CRYPTO_DECRYPTION_FAILED,
            "Failed to decrypt CA private key", "wrong passphrase or tampered envelope");
    }
    total += len;
    plaintext.truncate(static_cast<size_t>(total));
    return plaintext;
}

} // namespace cga::crypto

/**
 * @file digest.cpp
 * @brief SHA-256 helpers implementation
 */

#include "cga/crypto/digest.h"
#include "exceptions.h"

#include <cga/utils/string_utils.h>
#include <openssl/crypto.h>
#include <openssl/evp.h>

namespace cga::crypto {

std::vector<uint8_t> sha256(const std::string& data) {
    std::vector<uint8_t> digest(EVP_MAX_MD_SIZE);
    unsigned int len = 0;
    if (EVP_Digest(data.data(), data.size(), digest.data(), &len, EVP_sha256(), nullptr) != 1) {
        throw common::CryptoException("SHA-256 digest failed");
    }
    digest.resize(len);
    return digest;
}

std::string sha256Hex(const std::string& data) {
    return cga::utils::bytesToHex(sha256(data));
}

std::string goldenThreadHash(const std::string& canonicalContent) {
    return std::string(GOLDEN_THREAD_PREFIX) + sha256Hex(canonicalContent);
}

bool constantTimeEquals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) {
        return false;
    }
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

} // namespace cga::crypto

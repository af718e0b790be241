/**
 * @file digest.h
 * @brief SHA-256 helpers for content integrity hashes
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace cga::crypto {

/// Prefix of golden thread hashes: "sha256:<64 hex chars>"
inline constexpr const char* GOLDEN_THREAD_PREFIX = "sha256:";

std::vector<uint8_t> sha256(const std::string& data);

std::string sha256Hex(const std::string& data);

/**
 * @brief Golden thread hash of canonical content ("sha256:" + hex digest)
 */
std::string goldenThreadHash(const std::string& canonicalContent);

/**
 * @brief Constant-time string comparison (CRYPTO_memcmp)
 */
bool constantTimeEquals(const std::string& a, const std::string& b);

} // namespace cga::crypto

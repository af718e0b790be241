/**
 * @file ca_key.h
 * @brief Domain model for CA signing keys
 *
 * Exactly one key is active after bootstrap. Rotated keys are retained
 * forever so that historical signatures stay verifiable.
 */

#pragma once

#include <cga/utils/time_utils.h>

#include <cstdint>
#include <optional>
#include <string>
#include <json/json.h>

namespace domain {
namespace models {

using cga::utils::TimePoint;

enum class KeyStatus {
    ACTIVE,
    INACTIVE,
    ROTATED
};

std::string keyStatusToString(KeyStatus status);

std::optional<KeyStatus> parseKeyStatus(const std::string& name);

struct CaKeyRecord {
    std::string id;                   // "cga-ca-<epoch ms>-<8 hex>"
    std::string algorithm;            // "Ed25519" | "ES256"
    std::string publicKey;            // SubjectPublicKeyInfo PEM
    std::string encryptedPrivateKey;  // base64 envelope, never plaintext
    KeyStatus status = KeyStatus::ACTIVE;
    TimePoint createdAt;
    std::optional<TimePoint> expiresAt;
    std::optional<TimePoint> rotatedAt;
    int64_t certificatesSigned = 0;

    /**
     * @brief Public view; never includes the encrypted private key
     */
    Json::Value toJson() const;
};

} // namespace models
} // namespace domain

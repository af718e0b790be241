/**
 * @file ca_key.cpp
 * @brief Implementation of CaKeyRecord domain model
 */

#include "ca_key.h"

namespace domain {
namespace models {

std::string keyStatusToString(KeyStatus status) {
    switch (status) {
        case KeyStatus::ACTIVE: return "active";
        case KeyStatus::INACTIVE: return "inactive";
        case KeyStatus::ROTATED: return "rotated";
    }
    return "inactive";
}

std::optional<KeyStatus> parseKeyStatus(const std::string& name) {
    if (name == "active") return KeyStatus::ACTIVE;
    if (name == "inactive") return KeyStatus::INACTIVE;
    if (name == "rotated") return KeyStatus::ROTATED;
    return std::nullopt;
}

Json::Value CaKeyRecord::toJson() const {
    using cga::utils::formatIso8601;

    Json::Value json;
    json["id"] = id;
    json["algorithm"] = algorithm;
    json["publicKey"] = publicKey;
    json["status"] = keyStatusToString(status);
    json["createdAt"] = formatIso8601(createdAt);
    if (expiresAt) json["expiresAt"] = formatIso8601(*expiresAt);
    if (rotatedAt) json["rotatedAt"] = formatIso8601(*rotatedAt);
    json["certificatesSigned"] = Json::Int64(certificatesSigned);
    return json;
}

} // namespace models
} // namespace domain

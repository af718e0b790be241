/**
 * @file verification.h
 * @brief Domain model for verification history
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

/**
 * @brief Stored outcome of one verification attempt
 */
enum class VerificationResult {
    VALID,
    INVALID,
    REVOKED,
    EXPIRED,
    UNKNOWN
};

std::string verificationResultToString(VerificationResult result);

std::optional<VerificationResult> parseVerificationResult(const std::string& name);

/**
 * @brief Caller context attached to verification history and audit entries
 */
struct RequestContext {
    std::optional<std::string> requestId;
    std::optional<std::string> requestIp;
    std::optional<std::string> requestAction;
};

/**
 * @brief Append-only verification log row
 */
struct VerificationHistoryRecord {
    int64_t id = 0;
    std::optional<std::string> certificateId;
    std::string agentId;
    RequestContext context;
    TimePoint requestTimestamp;
    VerificationResult result = VerificationResult::UNKNOWN;
    Json::Value resultDetails = Json::Value(Json::objectValue);
    int64_t durationMs = 0;

    Json::Value toJson() const;
};

} // namespace models
} // namespace domain

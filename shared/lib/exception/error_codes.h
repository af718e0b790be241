/**
 * @file error_codes.h
 * @brief Standardized error codes for the CGA CA service
 *
 * Provides consistent error codes across all components
 * Format: COMPONENT_ERROR_TYPE_DETAIL
 *
 * @author SmartCore Inc.
 * @date 2026-02-02
 */

#pragma once

#include <string>
#include <json/json.h>

namespace common {

/**
 * @brief Error code enumeration
 */
enum class ErrorCode {
    // Success
    SUCCESS = 0,

    // Database Errors (1000-1999)
    DB_CONNECTION_FAILED = 1001,
    DB_QUERY_FAILED = 1002,
    DB_CONSTRAINT_VIOLATION = 1004,
    DB_POOL_EXHAUSTED = 1006,

    // Repository Errors (3000-3999)
    REPO_ENTITY_NOT_FOUND = 3002,
    REPO_DUPLICATE_ENTITY = 3003,
    REPO_INVALID_TRANSITION = 3005,

    // Service Errors (4000-4999)
    SERVICE_INVALID_INPUT = 4001,

    // Key / Crypto Errors (5100-5199)
    KEY_UNAVAILABLE = 5101,
    KEY_GENERATION_FAILED = 5102,
    CRYPTO_SIGNATURE_FAILED = 5103,
    CRYPTO_DECRYPTION_FAILED = 5104,

    // System Errors (9000-9999)
    SYSTEM_INTERNAL_ERROR = 9001,
    SYSTEM_CONFIG_INVALID = 9005,
};

/**
 * @brief Convert error code to string
 */
inline std::string errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS: return "SUCCESS";

        // Database
        case ErrorCode::DB_CONNECTION_FAILED: return "DB_CONNECTION_FAILED";
        case ErrorCode::DB_QUERY_FAILED: return "DB_QUERY_FAILED";
        case ErrorCode::DB_CONSTRAINT_VIOLATION: return "DB_CONSTRAINT_VIOLATION";
        case ErrorCode::DB_POOL_EXHAUSTED: return "DB_POOL_EXHAUSTED";

        // Repository
        case ErrorCode::REPO_ENTITY_NOT_FOUND: return "REPO_ENTITY_NOT_FOUND";
        case ErrorCode::REPO_DUPLICATE_ENTITY: return "REPO_DUPLICATE_ENTITY";
        case ErrorCode::REPO_INVALID_TRANSITION: return "REPO_INVALID_TRANSITION";

        // Service
        case ErrorCode::SERVICE_INVALID_INPUT: return "SERVICE_INVALID_INPUT";

        // Key / Crypto
        case ErrorCode::KEY_UNAVAILABLE: return "KEY_UNAVAILABLE";
        case ErrorCode::KEY_GENERATION_FAILED: return "KEY_GENERATION_FAILED";
        case ErrorCode::CRYPTO_SIGNATURE_FAILED: return "CRYPTO_SIGNATURE_FAILED";
        case ErrorCode::CRYPTO_DECRYPTION_FAILED: return "CRYPTO_DECRYPTION_FAILED";

        // System
        case ErrorCode::SYSTEM_INTERNAL_ERROR: return "SYSTEM_INTERNAL_ERROR";
        case ErrorCode::SYSTEM_CONFIG_INVALID: return "SYSTEM_CONFIG_INVALID";

        default: return "UNKNOWN_ERROR";
    }
}

/**
 * @brief Convert error code to HTTP status code
 *
 * Used by the transport layer when it renders an ErrorResponse.
 */
inline int errorCodeToHttpStatus(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS: return 200;
        case ErrorCode::SERVICE_INVALID_INPUT: return 400;
        case ErrorCode::REPO_ENTITY_NOT_FOUND: return 404;
        case ErrorCode::REPO_DUPLICATE_ENTITY:
        case ErrorCode::REPO_INVALID_TRANSITION:
        case ErrorCode::DB_CONSTRAINT_VIOLATION: return 409;
        case ErrorCode::KEY_UNAVAILABLE: return 503;
        default: return 500;
    }
}

/**
 * @brief Error response builder
 */
class ErrorResponse {
private:
    ErrorCode code_;
    std::string message_;
    std::string details_;
    std::string requestId_;

public:
    ErrorResponse(ErrorCode code, const std::string& message, const std::string& details = "")
        : code_(code), message_(message), details_(details) {}

    /**
     * @brief Set request ID for tracing
     */
    ErrorResponse& setRequestId(const std::string& requestId) {
        requestId_ = requestId;
        return *this;
    }

    /**
     * @brief Convert to JSON response
     */
    Json::Value toJson() const {
        Json::Value json;
        json["success"] = false;
        json["error"]["code"] = errorCodeToString(code_);
        json["error"]["numericCode"] = static_cast<int>(code_);
        json["error"]["message"] = message_;

        if (!details_.empty()) {
            json["error"]["details"] = details_;
        }

        if (!requestId_.empty()) {
            json["requestId"] = requestId_;
        }

        return json;
    }

    int getHttpStatus() const {
        return errorCodeToHttpStatus(code_);
    }

    ErrorCode getCode() const {
        return code_;
    }

    std::string getMessage() const {
        return message_;
    }
};

} // namespace common

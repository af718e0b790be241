/**
 * @file exceptions.h
 * @brief Exception hierarchy for the CGA CA service
 *
 * Provides typed exceptions with error codes for better error handling
 *
 * @author SmartCore Inc.
 * @date 2026-02-02
 */

#pragma once

#include <stdexcept>
#include <string>
#include "error_codes.h"

namespace common {

/**
 * @brief Base exception for all CA service errors
 */
class CaException : public std::runtime_error {
private:
    ErrorCode code_;
    std::string details_;

public:
    explicit CaException(
        ErrorCode code,
        const std::string& message,
        const std::string& details = "")
        : std::runtime_error(message)
        , code_(code)
        , details_(details) {}

    /**
     * @brief Get error code
     */
    ErrorCode getCode() const {
        return code_;
    }

    /**
     * @brief Get error details
     */
    const std::string& getDetails() const {
        return details_;
    }

    /**
     * @brief Convert to ErrorResponse
     */
    ErrorResponse toErrorResponse() const {
        return ErrorResponse(code_, what(), details_);
    }
};

// =============================================================================
// Request Exceptions
// =============================================================================

/**
 * @brief Malformed request; field() names the offending field
 */
class ValidationException : public CaException {
private:
    std::string field_;

public:
    ValidationException(const std::string& field, const std::string& message)
        : CaException(ErrorCode::SERVICE_INVALID_INPUT, message, "field: " + field)
        , field_(field) {}

    const std::string& field() const {
        return field_;
    }
};

/**
 * @brief Uniqueness violation or illegal status transition
 */
class ConflictException : public CaException {
public:
    explicit ConflictException(const std::string& message, const std::string& details = "")
        : CaException(ErrorCode::REPO_DUPLICATE_ENTITY, message, details) {}
};

class NotFoundException : public CaException {
public:
    NotFoundException(const std::string& entity, const std::string& id)
        : CaException(ErrorCode::REPO_ENTITY_NOT_FOUND, entity + " not found: " + id, id) {}
};

// =============================================================================
// Key / Crypto Exceptions
// =============================================================================

class KeyUnavailableException : public CaException {
public:
    explicit KeyUnavailableException(const std::string& details = "")
        : CaException(ErrorCode::KEY_UNAVAILABLE, "No usable CA signing key", details) {}
};

class KeyGenerationException : public CaException {
public:
    explicit KeyGenerationException(const std::string& details = "")
        : CaException(ErrorCode::KEY_GENERATION_FAILED, "CA key generation failed", details) {}
};

class CryptoException : public CaException {
public:
    explicit CryptoException(const std::string& message, const std::string& details = "")
        : CaException(ErrorCode::CRYPTO_SIGNATURE_FAILED, message, details) {}

    CryptoException(ErrorCode code, const std::string& message, const std::string& details)
        : CaException(code, message, details) {}
};

// =============================================================================
// Infrastructure Exceptions
// =============================================================================

/**
 * @brief Persistence failure; state may have diverged from the caller's view
 */
class StorageException : public CaException {
public:
    explicit StorageException(const std::string& message, const std::string& details = "")
        : CaException(ErrorCode::DB_QUERY_FAILED, message, details) {}

    StorageException(ErrorCode code, const std::string& message, const std::string& details)
        : CaException(code, message, details) {}
};

class ConfigException : public CaException {
public:
    explicit ConfigException(const std::string& message)
        : CaException(ErrorCode::SYSTEM_CONFIG_INVALID, "Configuration error: " + message) {}
};

} // namespace common

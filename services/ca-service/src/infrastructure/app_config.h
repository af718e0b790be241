#pragma once

/**
 * @file app_config.h
 * @brief CA service configuration
 *
 * Loaded from environment variables at startup.
 */

#include "exceptions.h"
#include "../domain/models/certificate.h"

#include <cga/crypto/key_pair.h>
#include <cga/utils/string_utils.h>

#include <cstdlib>
#include <string>
#include <spdlog/spdlog.h>

namespace infrastructure {

struct AppConfig {
    // Storage
    std::string storage = "postgres";  // postgres | memory
    std::string dbHost = "postgres";
    int dbPort = 5432;
    std::string dbName = "cga_ca";
    std::string dbUser = "cga";
    std::string dbPassword;
    int dbPoolMin = 2;
    int dbPoolMax = 10;

    // Keys
    std::string keyPassword;
    cga::crypto::SignatureAlgorithm keyAlgorithm = cga::crypto::SignatureAlgorithm::ED25519;
    int kdfLogN = 15;
    int kdfR = 8;
    int kdfP = 1;

    // Issuer
    std::string issuerId = "cga.aigos.io";
    std::string issuerName = "AIGOS CGA Certificate Authority";

    // OCSP
    int ocspResponseValiditySeconds = 3600;
    bool ocspCacheEnabled = true;

    // Renewal
    int renewalWindowDays = 14;
    int renewalIntervalMinutes = 60;
    bool autoRenewEnabled = true;
    domain::models::CertificateLevel maxAutoRenewLevel = domain::models::CertificateLevel::GOLD;

    // Live verification
    int liveVerifyMaxFailures = 3;

    // Logging
    std::string logLevel = "info";
    std::string logFile = "logs/cga-ca.log";

    bool useMemoryStorage() const { return storage == "memory"; }

    static AppConfig fromEnvironment() {
        AppConfig config;

        if (auto val = std::getenv("CA_STORAGE")) config.storage = cga::utils::toLower(val);
        if (auto val = std::getenv("DB_HOST")) config.dbHost = val;
        if (auto val = std::getenv("DB_PORT")) config.dbPort = toInt("DB_PORT", val);
        if (auto val = std::getenv("DB_NAME")) config.dbName = val;
        if (auto val = std::getenv("DB_USER")) config.dbUser = val;
        if (auto val = std::getenv("DB_PASSWORD")) config.dbPassword = val;
        if (auto val = std::getenv("DB_POOL_MIN")) config.dbPoolMin = toInt("DB_POOL_MIN", val);
        if (auto val = std::getenv("DB_POOL_MAX")) config.dbPoolMax = toInt("DB_POOL_MAX", val);

        if (auto val = std::getenv("CA_KEY_PASSWORD")) config.keyPassword = val;
        if (auto val = std::getenv("CA_KEY_ALGORITHM")) {
            auto alg = cga::crypto::parseSignatureAlgorithm(val);
            if (!alg) {
                throw common::ConfigException(std::string("CA_KEY_ALGORITHM must be Ed25519 or ES256, got ") + val);
            }
            config.keyAlgorithm = *alg;
        }
        if (auto val = std::getenv("CA_KDF_LOG_N")) config.kdfLogN = toInt("CA_KDF_LOG_N", val);
        if (auto val = std::getenv("CA_KDF_R")) config.kdfR = toInt("CA_KDF_R", val);
        if (auto val = std::getenv("CA_KDF_P")) config.kdfP = toInt("CA_KDF_P", val);

        if (auto val = std::getenv("CA_ISSUER_ID")) config.issuerId = val;
        if (auto val = std::getenv("CA_ISSUER_NAME")) config.issuerName = val;

        if (auto val = std::getenv("OCSP_RESPONSE_VALIDITY_SECONDS"))
            config.ocspResponseValiditySeconds = toInt("OCSP_RESPONSE_VALIDITY_SECONDS", val);
        if (auto val = std::getenv("OCSP_CACHE_ENABLED")) config.ocspCacheEnabled = toBool("OCSP_CACHE_ENABLED", val);

        if (auto val = std::getenv("RENEWAL_WINDOW_DAYS")) config.renewalWindowDays = toInt("RENEWAL_WINDOW_DAYS", val);
        if (auto val = std::getenv("RENEWAL_INTERVAL_MINUTES"))
            config.renewalIntervalMinutes = toInt("RENEWAL_INTERVAL_MINUTES", val);
        if (auto val = std::getenv("AUTO_RENEW_ENABLED")) config.autoRenewEnabled = toBool("AUTO_RENEW_ENABLED", val);
        if (auto val = std::getenv("MAX_AUTO_RENEW_LEVEL")) {
            auto level = domain::models::parseCertificateLevel(val);
            if (!level) {
                throw common::ConfigException(std::string("MAX_AUTO_RENEW_LEVEL is not a certification level: ") + val);
            }
            config.maxAutoRenewLevel = *level;
        }

        if (auto val = std::getenv("LIVE_VERIFY_MAX_FAILURES"))
            config.liveVerifyMaxFailures = toInt("LIVE_VERIFY_MAX_FAILURES", val);

        if (auto val = std::getenv("CA_LOG_LEVEL")) config.logLevel = val;
        if (auto val = std::getenv("CA_LOG_FILE")) config.logFile = val;

        return config;
    }

    /**
     * @throws common::ConfigException on a missing secret or out-of-range value
     */
    void validateRequiredCredentials() const {
        if (storage != "postgres" && storage != "memory") {
            throw common::ConfigException("CA_STORAGE must be postgres or memory, got " + storage);
        }
        if (storage == "postgres" && dbPassword.empty()) {
            throw common::ConfigException("DB_PASSWORD environment variable not set");
        }
        if (keyPassword.empty()) {
            throw common::ConfigException("CA_KEY_PASSWORD environment variable not set");
        }
        if (dbPoolMin < 1 || dbPoolMax < dbPoolMin) {
            throw common::ConfigException("DB_POOL_MIN/DB_POOL_MAX must satisfy 1 <= min <= max");
        }
        if (kdfLogN < 10 || kdfLogN > 22 || kdfR < 1 || kdfP < 1) {
            throw common::ConfigException("scrypt parameters out of range (CA_KDF_LOG_N 10..22, r >= 1, p >= 1)");
        }
        if (ocspResponseValiditySeconds <= 0) {
            throw common::ConfigException("OCSP_RESPONSE_VALIDITY_SECONDS must be positive");
        }
        if (renewalWindowDays <= 0 || renewalIntervalMinutes <= 0) {
            throw common::ConfigException("RENEWAL_WINDOW_DAYS and RENEWAL_INTERVAL_MINUTES must be positive");
        }
        if (liveVerifyMaxFailures < 0) {
            throw common::ConfigException("LIVE_VERIFY_MAX_FAILURES cannot be negative");
        }
        spdlog::info("All required credentials loaded from environment");
    }

private:
    static int toInt(const char* name, const char* value) {
        try {
            size_t pos = 0;
            int parsed = std::stoi(value, &pos);
            if (value[pos] != '\0') {
                throw std::invalid_argument("trailing characters");
            }
            return parsed;
        } catch (const std::exception&) {
            throw common::ConfigException(std::string(name) + " must be an integer, got '" + value + "'");
        }
    }

    static bool toBool(const char* name, const char* value) {
        std::string v = cga::utils::toLower(cga::utils::trim(value));
        if (v == "true" || v == "1" || v == "yes" || v == "on") return true;
        if (v == "false" || v == "0" || v == "no" || v == "off") return false;
        throw common::ConfigException(std::string(name) + " must be true or false, got '" + value + "'");
    }
};

} // namespace infrastructure

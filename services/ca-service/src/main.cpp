/**
 * @file main.cpp
 * @brief CGA Certificate Authority host process
 *
 * Command-line daemon around the CA core: schema bootstrap, key management,
 * one-shot renewal sweeps, OCSP queries, revocation and the renewal
 * scheduler loop.
 *
 * @author SmartCore Inc.
 * @date 2026-02-06
 * @version 1.0.0
 */

#include "infrastructure/app_config.h"
#include "infrastructure/service_container.h"
#include "repositories/certificate_registry.h"
#include "services/certificate_authority.h"
#include "services/renewal_scheduler.h"
#include "services/signing_service.h"
#include "common/json_utils.h"
#include "exceptions.h"
#include "logger.h"

#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

namespace {

std::atomic<bool> g_stopRequested{false};

void handleSignal(int) {
    g_stopRequested = true;
}

void printUsage() {
    std::cerr << "Usage: cga-ca <command> [args]\n"
              << "\n"
              << "Commands:\n"
              << "  init-db                                 Create the schema and apply migrations\n"
              << "  generate-key                            Bootstrap or rotate the CA signing key\n"
              << "  renew                                   Run one renewal sweep\n"
              << "  ocsp <id>...                            Print a signed status response\n"
              << "  revoke <id> <reason> <actor> [incident] Revoke a certificate\n"
              << "  run                                     Run the renewal scheduler until SIGINT/SIGTERM\n";
}

int cmdInitDb(infrastructure::ServiceContainer& container) {
    // Migrations already ran during container initialization
    int version = container.registry()->schemaVersion();
    std::cout << "schema version " << version << std::endl;
    return 0;
}

int cmdGenerateKey(infrastructure::ServiceContainer& container, const infrastructure::AppConfig& config) {
    auto* signing = container.signingService();
    auto active = container.registry()->getActiveKey();

    services::KeyGenerationResult result = active
        ? signing->rotateKey()
        : signing->generateKey(config.keyPassword);

    Json::Value out;
    out["keyId"] = result.keyId;
    out["algorithm"] = result.algorithm;
    out["publicKey"] = result.publicKey;
    if (active) out["previousKeyId"] = active->id;
    std::cout << out.toStyledString();
    return 0;
}

int cmdRenew(infrastructure::ServiceContainer& container) {
    services::RenewalReport report = container.renewalScheduler()->runOnce();
    std::cout << report.toJson().toStyledString();
    return report.exitCode();
}

int cmdOcsp(infrastructure::ServiceContainer& container, const std::vector<std::string>& ids) {
    if (ids.empty()) {
        printUsage();
        return 2;
    }
    auto response = container.certificateAuthority()->respond(ids);
    std::cout << response.toJson().toStyledString();
    return response.responseStatus == domain::models::OcspResponseStatus::SUCCESSFUL ? 0 : 1;
}

int cmdRevoke(infrastructure::ServiceContainer& container, const std::vector<std::string>& args) {
    if (args.size() < 3 || args.size() > 4) {
        printUsage();
        return 2;
    }
    std::optional<std::string> incident;
    if (args.size() == 4) incident = args[3];

    auto record = container.certificateAuthority()->revoke(args[0], args[1], args[2], incident);
    std::cout << record.toJson().toStyledString();
    return 0;
}

int cmdRun(infrastructure::ServiceContainer& container) {
    auto* scheduler = container.renewalScheduler();
    scheduler->setReportFn([](const services::RenewalReport& report) {
        spdlog::info("Renewal sweep: candidates={}, renewed={}, failed={}, skipped={}",
                     report.candidates, report.succeeded, report.failed, report.skipped);
    });

    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    scheduler->start();
    scheduler->triggerNow();

    while (!g_stopRequested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    spdlog::info("Shutdown requested");
    scheduler->stop();
    return 0;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        printUsage();
        return 2;
    }
    std::string command = argv[1];
    std::vector<std::string> args(argv + 2, argv + argc);

    infrastructure::AppConfig config;
    try {
        config = infrastructure::AppConfig::fromEnvironment();
    } catch (const std::exception& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 1;
    }

    common::Logger::initialize("cga-ca", config.logLevel, config.logFile);

    try {
        config.validateRequiredCredentials();
    } catch (const std::exception& e) {
        spdlog::critical("{}", e.what());
        return 1;
    }

    spdlog::info("=================================================");
    spdlog::info("  CGA Certificate Authority v1.0.0");
    spdlog::info("=================================================");
    spdlog::info("Issuer: {} ({})", config.issuerName, config.issuerId);
    if (!config.useMemoryStorage()) {
        spdlog::info("Database: {}:{}/{}", config.dbHost, config.dbPort, config.dbName);
    }

    infrastructure::ServiceContainer container;
    if (!container.initialize(config)) {
        return 1;
    }

    int rc = 1;
    try {
        if (command == "init-db") {
            rc = cmdInitDb(container);
        } else if (command == "generate-key") {
            rc = cmdGenerateKey(container, config);
        } else if (command == "renew") {
            rc = cmdRenew(container);
        } else if (command == "ocsp") {
            rc = cmdOcsp(container, args);
        } else if (command == "revoke") {
            rc = cmdRevoke(container, args);
        } else if (command == "run") {
            rc = cmdRun(container);
        } else {
            printUsage();
            rc = 2;
        }
    } catch (const common::CaException& e) {
        spdlog::error("{} failed: {}", command, e.what());
        std::cerr << common::toCompactJson(e.toErrorResponse().toJson()) << std::endl;
        rc = 1;
    } catch (const std::exception& e) {
        spdlog::error("{} failed: {}", command, e.what());
        rc = 1;
    }

    container.shutdown();
    common::Logger::flush();
    return rc;
}

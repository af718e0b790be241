/**
 * @file service_container.cpp
 * @brief CA Service ServiceContainer implementation
 */

#include "service_container.h"
#include "app_config.h"

#include <spdlog/spdlog.h>

// Infrastructure
#include "db_connection_pool.h"

// Repositories
#include "../repositories/memory_certificate_registry.h"
#include "../repositories/pg_certificate_registry.h"

// Services
#include "../services/certificate_authority.h"
#include "../services/live_verification_service.h"
#include "../services/ocsp_responder.h"
#include "../services/renewal_scheduler.h"
#include "../services/revocation_manager.h"
#include "../services/signing_service.h"

namespace infrastructure {

struct ServiceContainer::Impl {
    // Connection pool
    std::unique_ptr<common::DbConnectionPool> dbPool;

    // Repositories
    std::unique_ptr<repositories::ICertificateRegistry> registry;

    // Services
    std::unique_ptr<services::SigningService> signingService;
    std::unique_ptr<services::RevocationManager> revocationManager;
    std::unique_ptr<services::OcspResponder> ocspResponder;
    std::unique_ptr<services::RenewalScheduler> renewalScheduler;
    std::unique_ptr<services::LiveVerificationService> liveVerificationService;
    std::unique_ptr<services::CertificateAuthority> certificateAuthority;
};

ServiceContainer::ServiceContainer() : impl_(std::make_unique<Impl>()) {}

ServiceContainer::~ServiceContainer() {
    shutdown();
}

bool ServiceContainer::initialize(const AppConfig& config,
                                  services::IAttestationProbe* probe,
                                  services::IRenewalNotifier* notifier) {
    spdlog::info("Initializing CA Service dependencies (storage={})...", config.storage);

    try {
        // Step 1: Storage
        if (config.useMemoryStorage()) {
            spdlog::warn("Using in-memory registry; nothing survives a restart");
            impl_->registry = std::make_unique<repositories::MemoryCertificateRegistry>();
        } else {
            std::string connString = common::DbConnectionPool::buildConnString(
                config.dbHost, config.dbPort, config.dbName, config.dbUser, config.dbPassword);
            impl_->dbPool = std::make_unique<common::DbConnectionPool>(
                connString, static_cast<size_t>(config.dbPoolMin), static_cast<size_t>(config.dbPoolMax));
            if (!impl_->dbPool->initialize()) {
                spdlog::critical("Failed to initialize database connection pool ({}:{}/{})",
                                 config.dbHost, config.dbPort, config.dbName);
                return false;
            }
            spdlog::info("Database connection pool initialized ({}:{}/{})",
                         config.dbHost, config.dbPort, config.dbName);
            impl_->registry = std::make_unique<repositories::PgCertificateRegistry>(impl_->dbPool.get());
        }

        // Step 2: Schema
        impl_->registry->initialize();
        spdlog::info("Certificate registry ready (schema version {})", impl_->registry->schemaVersion());

        // Step 3: Services
        services::SigningConfig signingConfig;
        signingConfig.issuerId = config.issuerId;
        signingConfig.issuerName = config.issuerName;
        signingConfig.algorithm = config.keyAlgorithm;
        signingConfig.kdf.logN = static_cast<uint8_t>(config.kdfLogN);
        signingConfig.kdf.r = static_cast<uint32_t>(config.kdfR);
        signingConfig.kdf.p = static_cast<uint32_t>(config.kdfP);
        impl_->signingService = std::make_unique<services::SigningService>(
            impl_->registry.get(), config.keyPassword, signingConfig);

        impl_->revocationManager = std::make_unique<services::RevocationManager>(impl_->registry.get());

        services::OcspConfig ocspConfig;
        ocspConfig.responseValiditySeconds = config.ocspResponseValiditySeconds;
        ocspConfig.cacheEnabled = config.ocspCacheEnabled;
        impl_->ocspResponder = std::make_unique<services::OcspResponder>(
            impl_->registry.get(), impl_->signingService.get(), ocspConfig);

        services::RenewalConfig renewalConfig;
        renewalConfig.renewalWindowDays = config.renewalWindowDays;
        renewalConfig.autoRenewEnabled = config.autoRenewEnabled;
        renewalConfig.maxAutoRenewLevel = config.maxAutoRenewLevel;
        renewalConfig.interval = std::chrono::minutes(config.renewalIntervalMinutes);
        impl_->renewalScheduler = std::make_unique<services::RenewalScheduler>(
            impl_->registry.get(), impl_->signingService.get(), renewalConfig);
        if (notifier) {
            impl_->renewalScheduler->setNotifier(notifier);
        }

        if (probe) {
            services::LiveVerificationConfig liveConfig;
            liveConfig.maxConsecutiveFailures = config.liveVerifyMaxFailures;
            impl_->liveVerificationService = std::make_unique<services::LiveVerificationService>(
                impl_->registry.get(), probe, impl_->revocationManager.get(), liveConfig);
        } else {
            spdlog::info("No attestation probe configured; live verification disabled");
        }

        impl_->certificateAuthority = std::make_unique<services::CertificateAuthority>(
            impl_->registry.get(),
            impl_->signingService.get(),
            impl_->revocationManager.get(),
            impl_->ocspResponder.get());

        spdlog::info("All CA Service dependencies initialized successfully");
        return true;

    } catch (const std::exception& e) {
        spdlog::critical("Failed to initialize CA Service: {}", e.what());
        return false;
    }
}

void ServiceContainer::shutdown() {
    if (!impl_) return;

    if (impl_->renewalScheduler) {
        impl_->renewalScheduler->stop();
    }

    // Delete in reverse order of initialization
    impl_->certificateAuthority.reset();
    impl_->liveVerificationService.reset();
    impl_->renewalScheduler.reset();
    impl_->ocspResponder.reset();
    impl_->revocationManager.reset();
    impl_->signingService.reset();
    impl_->registry.reset();

    if (impl_->dbPool) {
        impl_->dbPool->shutdown();
        impl_->dbPool.reset();
    }
}

// --- Accessors ---
common::DbConnectionPool* ServiceContainer::dbPool() const { return impl_->dbPool.get(); }
repositories::ICertificateRegistry* ServiceContainer::registry() const { return impl_->registry.get(); }
services::SigningService* ServiceContainer::signingService() const { return impl_->signingService.get(); }
services::RevocationManager* ServiceContainer::revocationManager() const { return impl_->revocationManager.get(); }
services::OcspResponder* ServiceContainer::ocspResponder() const { return impl_->ocspResponder.get(); }
services::RenewalScheduler* ServiceContainer::renewalScheduler() const { return impl_->renewalScheduler.get(); }
services::LiveVerificationService* ServiceContainer::liveVerificationService() const { return impl_->liveVerificationService.get(); }
services::CertificateAuthority* ServiceContainer::certificateAuthority() const { return impl_->certificateAuthority.get(); }

} // namespace infrastructure

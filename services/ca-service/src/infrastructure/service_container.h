#pragma once

/**
 * @file service_container.h
 * @brief Centralized service container for CA service dependency management
 *
 * Owns the connection pool, the certificate registry and every lifecycle
 * service. Provides non-owning pointer accessors for command handlers.
 */

#include <memory>

namespace infrastructure {
struct AppConfig;
}

// Forward declarations - Infrastructure
namespace common {
    class DbConnectionPool;
}

// Forward declarations - Repositories
namespace repositories {
    class ICertificateRegistry;
}

// Forward declarations - Services
namespace services {
    class SigningService;
    class RevocationManager;
    class OcspResponder;
    class RenewalScheduler;
    class LiveVerificationService;
    class CertificateAuthority;
    class IAttestationProbe;
    class IRenewalNotifier;
}

namespace infrastructure {

class ServiceContainer {
public:
    ServiceContainer();
    ~ServiceContainer();

    // Non-copyable, non-movable
    ServiceContainer(const ServiceContainer&) = delete;
    ServiceContainer& operator=(const ServiceContainer&) = delete;

    /**
     * @brief Initialize all components in dependency order
     * @param config Application configuration
     * @param probe Live attestation source (non-owning); live verification is
     *        only wired when one is supplied
     * @param notifier Renewal event sink (non-owning, optional)
     * @return true on success, false on failure (details logged)
     */
    bool initialize(const AppConfig& config,
                    services::IAttestationProbe* probe = nullptr,
                    services::IRenewalNotifier* notifier = nullptr);

    /**
     * @brief Release all resources (called automatically by destructor)
     */
    void shutdown();

    // --- Infrastructure Accessors ---
    common::DbConnectionPool* dbPool() const;  // nullptr with memory storage

    // --- Repository Accessors ---
    repositories::ICertificateRegistry* registry() const;

    // --- Service Accessors ---
    services::SigningService* signingService() const;
    services::RevocationManager* revocationManager() const;
    services::OcspResponder* ocspResponder() const;
    services::RenewalScheduler* renewalScheduler() const;
    services::LiveVerificationService* liveVerificationService() const;  // nullptr without a probe
    services::CertificateAuthority* certificateAuthority() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace infrastructure

#pragma once

/**
 * @file service_container.h
 * @brief Centralized service container for E-Invoice Service dependency management
 *
 * Owns the connection pool, chain store, regulator clients and the invoice
 * processor. Provides non-owning pointer accessors for handler construction.
 */

#include <memory>
#include <string>

struct AppConfig;

namespace zatca::common {
    struct EngineConfig;
}
namespace zatca::db {
    class DbConnectionPool;
    class IQueryExecutor;
}
namespace zatca::chain {
    class PostgresChainStateStore;
    class ChainSequencer;
}
namespace zatca::api {
    class CsidClient;
    class SubmissionClient;
}
namespace zatca::engine {
    class InvoiceProcessor;
}

namespace infrastructure {

class ServiceContainer {
public:
    ServiceContainer();
    ~ServiceContainer();

    ServiceContainer(const ServiceContainer&) = delete;
    ServiceContainer& operator=(const ServiceContainer&) = delete;

    /**
     * @brief Initialize all components in dependency order
     * @return true on success, false on failure (details logged)
     */
    bool initialize(const AppConfig& config);

    /**
     * @brief Release all resources (called automatically by destructor)
     */
    void shutdown();

    zatca::db::DbConnectionPool* dbPool() const;
    zatca::db::IQueryExecutor* queryExecutor() const;

    zatca::chain::ChainSequencer* chainSequencer() const;
    zatca::api::CsidClient* csidClient() const;
    zatca::api::SubmissionClient* submissionClient() const;
    zatca::engine::InvoiceProcessor* invoiceProcessor() const;

    const zatca::common::EngineConfig& engineConfig() const;

    /// @brief PEM private key of the signing identity (CSR signing)
    const std::string& signingKeyPem() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace infrastructure

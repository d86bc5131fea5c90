/**
 * @file service_container.cpp
 * @brief E-Invoice Service ServiceContainer implementation
 */

#include "service_container.h"
#include "app_config.h"
#include "drogon_http_transport.h"

#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>

#include "zatca/api/csid_client.h"
#include "zatca/api/submission_client.h"
#include "zatca/chain/chain_sequencer.h"
#include "zatca/chain/postgres_chain_state_store.h"
#include "zatca/common/exceptions.h"
#include "zatca/db/db_connection_pool.h"
#include "zatca/db/postgresql_query_executor.h"
#include "zatca/engine/invoice_processor.h"

namespace infrastructure {

struct ServiceContainer::Impl {
    zatca::common::EngineConfig engineConfig;
    std::string signingKeyPem;

    // Database
    std::unique_ptr<zatca::db::DbConnectionPool> dbPool;
    std::unique_ptr<zatca::db::PostgreSQLQueryExecutor> queryExecutor;

    // Chain
    std::unique_ptr<zatca::chain::PostgresChainStateStore> chainStore;
    std::unique_ptr<zatca::chain::ChainSequencer> chainSequencer;

    // Regulator clients
    std::unique_ptr<DrogonHttpTransport> transport;
    std::unique_ptr<zatca::api::CsidClient> csidClient;
    std::unique_ptr<zatca::api::SubmissionClient> submissionClient;

    std::unique_ptr<zatca::engine::InvoiceProcessor> invoiceProcessor;
};

ServiceContainer::ServiceContainer() : impl_(std::make_unique<Impl>()) {}

ServiceContainer::~ServiceContainer() {
    shutdown();
}

namespace {

std::string readTextFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw zatca::common::ConfigException("cannot read file: " + path);
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

} // anonymous namespace

bool ServiceContainer::initialize(const AppConfig& config) {
    spdlog::info("Initializing E-Invoice Service dependencies...");

    try {
        impl_->engineConfig = config.engine;

        // Step 1: Signing identity
        zatca::engine::SigningIdentity identity;
        identity.privateKeyPem = readTextFile(config.privateKeyPath);
        if (!config.certificatePath.empty()) {
            identity.certificate = readTextFile(config.certificatePath);
        } else {
            spdlog::warn("ZATCA_CERTIFICATE_PATH not set; QR tag 9 will be empty until onboarding completes");
        }
        impl_->signingKeyPem = identity.privateKeyPem;

        // Step 2: Database connection pool
        impl_->dbPool = std::make_unique<zatca::db::DbConnectionPool>(config.database);
        if (!impl_->dbPool->initialize()) {
            spdlog::critical("Failed to initialize database connection pool");
            return false;
        }
        spdlog::info("Database connection pool initialized ({}:{}/{})",
                     config.database.host, config.database.port, config.database.database);

        // Step 3: Query Executor
        impl_->queryExecutor = std::make_unique<zatca::db::PostgreSQLQueryExecutor>(impl_->dbPool.get());

        // Step 4: Chain state
        impl_->chainStore = std::make_unique<zatca::chain::PostgresChainStateStore>(impl_->queryExecutor.get());
        impl_->chainStore->ensureSchema();
        impl_->chainSequencer = std::make_unique<zatca::chain::ChainSequencer>(impl_->chainStore.get());

        // Step 5: Regulator clients
        impl_->transport = std::make_unique<DrogonHttpTransport>();
        impl_->csidClient = std::make_unique<zatca::api::CsidClient>(
            impl_->transport.get(), config.engine.endpoints, config.engine.httpTimeoutSeconds);

        zatca::api::RetryPolicy retry;
        retry.maxRetries = config.engine.maxRetries;
        retry.initialBackoffMs = config.engine.retryBackoffMs;
        impl_->submissionClient = std::make_unique<zatca::api::SubmissionClient>(
            impl_->transport.get(), config.engine.endpoints, config.engine.httpTimeoutSeconds, retry);

        // Step 6: Invoice processor
        impl_->invoiceProcessor = std::make_unique<zatca::engine::InvoiceProcessor>(
            impl_->chainSequencer.get(),
            impl_->submissionClient.get(),
            std::move(identity));

        spdlog::info("All E-Invoice Service dependencies initialized successfully");
        return true;

    } catch (const std::exception& e) {
        spdlog::critical("Failed to initialize E-Invoice Service: {}", e.what());
        return false;
    }
}

void ServiceContainer::shutdown() {
    if (!impl_) return;

    spdlog::info("Shutting down E-Invoice Service dependencies...");

    // Reverse order of initialization
    impl_->invoiceProcessor.reset();
    impl_->submissionClient.reset();
    impl_->csidClient.reset();
    impl_->transport.reset();
    impl_->chainSequencer.reset();
    impl_->chainStore.reset();
    impl_->queryExecutor.reset();
    if (impl_->dbPool) {
        impl_->dbPool->shutdown();
        impl_->dbPool.reset();
    }

    spdlog::info("E-Invoice Service dependencies shut down");
}

zatca::db::DbConnectionPool* ServiceContainer::dbPool() const { return impl_->dbPool.get(); }
zatca::db::IQueryExecutor* ServiceContainer::queryExecutor() const { return impl_->queryExecutor.get(); }
zatca::chain::ChainSequencer* ServiceContainer::chainSequencer() const { return impl_->chainSequencer.get(); }
zatca::api::CsidClient* ServiceContainer::csidClient() const { return impl_->csidClient.get(); }
zatca::api::SubmissionClient* ServiceContainer::submissionClient() const { return impl_->submissionClient.get(); }
zatca::engine::InvoiceProcessor* ServiceContainer::invoiceProcessor() const { return impl_->invoiceProcessor.get(); }
const zatca::common::EngineConfig& ServiceContainer::engineConfig() const { return impl_->engineConfig; }
const std::string& ServiceContainer::signingKeyPem() const { return impl_->signingKeyPem; }

} // namespace infrastructure

/**
 * @file main.cpp
 * @brief E-Invoice Service - ZATCA Phase 2 compliance engine REST front
 *
 * Wires the zatca_einvoice library to configuration, PostgreSQL chain
 * state and the service signing identity, and exposes onboarding (CSR,
 * CSID) and invoice processing endpoints.
 */

#include <drogon/drogon.h>
#include <trantor/utils/Logger.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <iostream>
#include <memory>

#include "infrastructure/app_config.h"
#include "infrastructure/service_container.h"
#include "handlers/health_handler.h"
#include "handlers/einvoice_handler.h"

#include "zatca/common/logger.h"
#include "zatca/common/time_utils.h"
#include "zatca/db/query_executor.h"

namespace {

std::unique_ptr<infrastructure::ServiceContainer> g_services;
std::shared_ptr<handlers::HealthHandler> g_healthHandler;
std::shared_ptr<handlers::EInvoiceHandler> g_einvoiceHandler;

void printBanner() {
    std::cout << R"(
  _____      ___                 _
 | ____|    |_ _|_ ____   _____ (_) ___ ___
 |  _| _____ | || '_ \ \ / / _ \| |/ __/ _ \
 | |__|_____|| || | | \ V / (_) | | (_|  __/
 |_____|    |___|_| |_|\_/ \___/|_|\___\___|

)" << std::endl;
    std::cout << "  E-Invoice Service - ZATCA Phase 2 Compliance" << std::endl;
    std::cout << "  Version: 1.0.0" << std::endl;
    std::cout << std::endl;
}

std::string getCurrentTimestamp() {
    return zatca::common::formatIso8601(std::chrono::system_clock::now());
}

Json::Value checkDatabase() {
    Json::Value result;
    result["name"] = "database";

    auto start = std::chrono::steady_clock::now();
    try {
        auto rows = g_services->queryExecutor()->executeQuery("SELECT version() AS version", {});
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);

        result["status"] = "UP";
        result["responseTimeMs"] = static_cast<Json::Int64>(elapsed.count());
        if (rows.isArray() && !rows.empty()) {
            result["version"] = rows[0]["version"];
        }
    } catch (const std::exception& e) {
        result["status"] = "DOWN";
        result["error"] = e.what();
    }
    return result;
}

void registerRoutes() {
    auto& app = drogon::app();

    g_healthHandler = std::make_shared<handlers::HealthHandler>(checkDatabase, getCurrentTimestamp);
    g_healthHandler->registerRoutes(app);

    g_einvoiceHandler = std::make_shared<handlers::EInvoiceHandler>(
        g_services->invoiceProcessor(),
        g_services->csidClient(),
        g_services->chainSequencer(),
        g_services->signingKeyPem(),
        g_services->engineConfig().environment);
    g_einvoiceHandler->registerRoutes(app);
}

} // anonymous namespace

int main(int /* argc */, char* /* argv */[]) {
    printBanner();

    AppConfig appConfig;
    try {
        appConfig = AppConfig::fromEnvironment();
    } catch (const std::exception& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 1;
    }

    zatca::common::Logger::initialize("einvoice-service", appConfig.logLevel,
                                      !appConfig.logFile.empty(), appConfig.logFile);

    try {
        appConfig.validateRequiredCredentials();
    } catch (const std::exception& e) {
        spdlog::critical("{}", e.what());
        return 1;
    }

    spdlog::info("Starting E-Invoice Service...");
    spdlog::info("Environment: {}", zatca::common::environmentToString(appConfig.engine.environment));
    spdlog::info("Database: {}:{}/{}", appConfig.database.host, appConfig.database.port, appConfig.database.database);

    g_services = std::make_unique<infrastructure::ServiceContainer>();
    if (!g_services->initialize(appConfig)) {
        spdlog::critical("Service initialization failed");
        return 1;
    }

    try {
        auto& app = drogon::app();

        // Server settings
        app.setLogLevel(trantor::Logger::kInfo)
           .addListener("0.0.0.0", appConfig.serverPort)
           .setThreadNum(appConfig.threadNum)
           .enableGzip(true)
           .setClientMaxBodySize(10 * 1024 * 1024);

        // Enable CORS
        app.registerPreSendingAdvice([](const drogon::HttpRequestPtr& /* req */,
                                         const drogon::HttpResponsePtr& resp) {
            resp->addHeader("Access-Control-Allow-Origin", "*");
            resp->addHeader("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
            resp->addHeader("Access-Control-Allow-Headers", "Content-Type, Authorization");
        });

        // Handle OPTIONS requests for CORS preflight
        app.registerHandler(
            "/{path}",
            [](const drogon::HttpRequestPtr& /* req */,
               std::function<void(const drogon::HttpResponsePtr&)>&& callback,
               const std::string& /* path */) {
                auto resp = drogon::HttpResponse::newHttpResponse();
                resp->setStatusCode(drogon::k204NoContent);
                callback(resp);
            },
            {drogon::Options}
        );

        registerRoutes();

        spdlog::info("Server starting on http://0.0.0.0:{}", appConfig.serverPort);
        spdlog::info("Press Ctrl+C to stop the server");

        app.run();

    } catch (const std::exception& e) {
        spdlog::error("Application error: {}", e.what());
        g_services->shutdown();
        return 1;
    }

    g_einvoiceHandler.reset();
    g_healthHandler.reset();
    g_services->shutdown();

    spdlog::info("Server stopped");
    return 0;
}

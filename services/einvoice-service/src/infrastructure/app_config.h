#pragma once

/**
 * @file app_config.h
 * @brief E-Invoice Service application configuration
 *
 * Loaded from environment variables (through ConfigManager) at startup.
 */

#include <string>

#include <spdlog/spdlog.h>

#include "zatca/common/config_manager.h"
#include "zatca/common/engine_config.h"
#include "zatca/common/exceptions.h"
#include "zatca/db/db_connection_pool.h"

struct AppConfig {
    zatca::common::EngineConfig engine;
    zatca::db::DbPoolConfig database;

    std::string privateKeyPath;
    std::string certificatePath;  // optional before onboarding

    int serverPort = 8090;
    int threadNum = 4;
    std::string logLevel = "info";
    std::string logFile;

    static AppConfig fromEnvironment() {
        using zatca::common::ConfigManager;
        auto& cm = ConfigManager::getInstance();

        AppConfig config;
        config.engine = zatca::common::EngineConfig::fromConfigManager();
        config.database = zatca::db::DbPoolConfig::fromConfigManager();

        config.privateKeyPath = cm.getString(ConfigManager::PRIVATE_KEY_PATH);
        config.certificatePath = cm.getString(ConfigManager::CERTIFICATE_PATH);

        config.serverPort = cm.getInt(ConfigManager::SERVICE_PORT, 8090);
        config.threadNum = cm.getInt(ConfigManager::SERVICE_THREADS, 4);
        config.logLevel = cm.getString(ConfigManager::LOG_LEVEL, "info");
        config.logFile = cm.getString(ConfigManager::LOG_FILE);

        return config;
    }

    void validateRequiredCredentials() const {
        if (privateKeyPath.empty()) {
            throw zatca::common::ConfigException("FATAL: ZATCA_PRIVATE_KEY_PATH environment variable not set");
        }
        if (database.password.empty()) {
            throw zatca::common::ConfigException("FATAL: DB_PASSWORD environment variable not set");
        }
        engine.validate();
        spdlog::info("All required credentials loaded from environment");
    }
};

/**
 * @file config_manager.h
 * @brief Centralized Configuration Management
 *
 * Provides unified access to environment variables and runtime overrides.
 * Features:
 * - Environment variable access with defaults
 * - Type-safe configuration retrieval
 * - Thread-safe singleton pattern
 */

#pragma once

#include <string>
#include <map>
#include <mutex>
#include <memory>

namespace zatca::common {

/**
 * @brief Configuration Manager (Singleton)
 *
 * Values set through set() take precedence over the process environment.
 */
class ConfigManager {
private:
    std::map<std::string, std::string> config_;
    mutable std::mutex mutex_;

    // Singleton instance
    static std::unique_ptr<ConfigManager> instance_;
    static std::once_flag initFlag_;

    // Private constructor (singleton)
    ConfigManager();

public:
    /**
     * @brief Get singleton instance
     */
    static ConfigManager& getInstance();

    // Delete copy and move
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;
    ConfigManager(ConfigManager&&) = delete;
    ConfigManager& operator=(ConfigManager&&) = delete;

    /**
     * @brief Get string configuration value
     * @param key Configuration key
     * @param defaultValue Default value if key not found
     * @return Configuration value
     */
    std::string getString(const std::string& key, const std::string& defaultValue = "") const;

    /**
     * @brief Get integer configuration value
     * @param key Configuration key
     * @param defaultValue Default value if key not found or not numeric
     * @return Configuration value
     */
    int getInt(const std::string& key, int defaultValue = 0) const;

    /**
     * @brief Get boolean configuration value
     * @param key Configuration key
     * @param defaultValue Default value if key not found
     * @return Configuration value
     */
    bool getBool(const std::string& key, bool defaultValue = false) const;

    /**
     * @brief Check if configuration key exists
     */
    bool has(const std::string& key) const;

    /**
     * @brief Set configuration value (overrides environment)
     */
    void set(const std::string& key, const std::string& value);

    /**
     * @brief Remove an override set through set()
     */
    void unset(const std::string& key);

    /**
     * @brief Load configuration from environment
     */
    void loadFromEnvironment();

    /**
     * @brief Get environment variable
     * @param key Environment variable name
     * @param defaultValue Default if not found
     * @return Environment variable value
     */
    static std::string getEnv(const std::string& key, const std::string& defaultValue = "");

    /// @name Predefined Configuration Keys

    // Regulator endpoints
    static constexpr const char* COMPLIANCE_API_URL = "ZATCA_COMPLIANCE_API_URL";
    static constexpr const char* CLEARANCE_API_URL = "ZATCA_CLEARANCE_API_URL";
    static constexpr const char* REPORTING_API_URL = "ZATCA_REPORTING_API_URL";
    static constexpr const char* PRODUCTION_CSID_API_URL = "ZATCA_PRODUCTION_CSID_API_URL";

    // Engine
    static constexpr const char* ENVIRONMENT = "ZATCA_ENVIRONMENT";
    static constexpr const char* EC_CURVE = "ZATCA_EC_CURVE";
    static constexpr const char* HTTP_TIMEOUT_SECONDS = "ZATCA_HTTP_TIMEOUT_SECONDS";
    static constexpr const char* MAX_RETRIES = "ZATCA_MAX_RETRIES";
    static constexpr const char* RETRY_BACKOFF_MS = "ZATCA_RETRY_BACKOFF_MS";
    static constexpr const char* RENEWAL_THRESHOLD_DAYS = "ZATCA_RENEWAL_THRESHOLD_DAYS";
    static constexpr const char* PRIVATE_KEY_PATH = "ZATCA_PRIVATE_KEY_PATH";
    static constexpr const char* CERTIFICATE_PATH = "ZATCA_CERTIFICATE_PATH";

    // Database
    static constexpr const char* DB_HOST = "DB_HOST";
    static constexpr const char* DB_PORT = "DB_PORT";
    static constexpr const char* DB_NAME = "DB_NAME";
    static constexpr const char* DB_USER = "DB_USER";
    static constexpr const char* DB_PASSWORD = "DB_PASSWORD";
    static constexpr const char* DB_POOL_MIN = "DB_POOL_MIN";
    static constexpr const char* DB_POOL_MAX = "DB_POOL_MAX";

    // Service
    static constexpr const char* SERVICE_PORT = "SERVICE_PORT";
    static constexpr const char* SERVICE_THREADS = "SERVICE_THREADS";
    static constexpr const char* LOG_LEVEL = "LOG_LEVEL";
    static constexpr const char* LOG_FILE = "LOG_FILE";
};

} // namespace zatca::common

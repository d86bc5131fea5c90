#pragma once

/**
 * @file engine_config.h
 * @brief Engine configuration resolved from ConfigManager
 */

#include <string>

namespace zatca::common {

/// @brief Regulator endpoint set (compliance, clearance, reporting, production CSID)
struct ApiEndpoints {
    std::string complianceApiUrl;
    std::string clearanceApiUrl;
    std::string reportingApiUrl;
    std::string productionCsidApiUrl;
};

/// @brief Onboarding environment; selects the CSR certificate template name
enum class ZatcaEnvironment {
    SANDBOX,
    SIMULATION,
    PRODUCTION
};

std::string environmentToString(ZatcaEnvironment env);

/**
 * @brief Parse "sandbox" / "simulation" / "production" (case-insensitive)
 * @throws ConfigException on unknown value
 */
ZatcaEnvironment environmentFromString(const std::string& value);

struct EngineConfig {
    ApiEndpoints endpoints;
    ZatcaEnvironment environment = ZatcaEnvironment::SANDBOX;
    std::string ecCurve = "secp256k1";

    int httpTimeoutSeconds = 30;
    int maxRetries = 3;
    int retryBackoffMs = 500;
    int renewalThresholdDays = 30;

    /**
     * @brief Resolve all engine settings from ConfigManager (environment + overrides)
     * @throws ConfigException on invalid values
     */
    static EngineConfig fromConfigManager();

    /**
     * @brief Check endpoint URLs and numeric ranges
     * @throws ConfigException describing the first invalid setting
     */
    void validate() const;
};

} // namespace zatca::common

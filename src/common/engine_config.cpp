/**
 * @file engine_config.cpp
 * @brief EngineConfig resolution and validation
 */

#include "zatca/common/engine_config.h"
#include "zatca/common/config_manager.h"
#include "zatca/common/exceptions.h"

#include <algorithm>
#include <cctype>
#include <spdlog/spdlog.h>

namespace zatca::common {

namespace {

constexpr const char* kDeveloperPortal =
    "https://gw-fatoora.zatca.gov.sa/e-invoicing/developer-portal";

bool isHttpUrl(const std::string& url) {
    return url.rfind("https://", 0) == 0 || url.rfind("http://", 0) == 0;
}

} // anonymous namespace

std::string environmentToString(ZatcaEnvironment env) {
    switch (env) {
        case ZatcaEnvironment::SANDBOX:    return "sandbox";
        case ZatcaEnvironment::SIMULATION: return "simulation";
        case ZatcaEnvironment::PRODUCTION: return "production";
    }
    return "sandbox";
}

ZatcaEnvironment environmentFromString(const std::string& value) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "sandbox" || lower == "developer-portal") return ZatcaEnvironment::SANDBOX;
    if (lower == "simulation") return ZatcaEnvironment::SIMULATION;
    if (lower == "production" || lower == "core") return ZatcaEnvironment::PRODUCTION;

    throw ConfigException("unknown ZATCA environment '" + value + "'");
}

EngineConfig EngineConfig::fromConfigManager() {
    auto& cfg = ConfigManager::getInstance();
    const std::string portal = kDeveloperPortal;

    EngineConfig config;
    config.endpoints.complianceApiUrl =
        cfg.getString(ConfigManager::COMPLIANCE_API_URL, portal + "/compliance");
    config.endpoints.clearanceApiUrl =
        cfg.getString(ConfigManager::CLEARANCE_API_URL, portal + "/invoices/clearance/single");
    config.endpoints.reportingApiUrl =
        cfg.getString(ConfigManager::REPORTING_API_URL, portal + "/invoices/reporting/single");
    config.endpoints.productionCsidApiUrl =
        cfg.getString(ConfigManager::PRODUCTION_CSID_API_URL, portal + "/production/csids");

    config.environment = environmentFromString(cfg.getString(ConfigManager::ENVIRONMENT, "sandbox"));
    config.ecCurve = cfg.getString(ConfigManager::EC_CURVE, config.ecCurve);
    config.httpTimeoutSeconds = cfg.getInt(ConfigManager::HTTP_TIMEOUT_SECONDS, config.httpTimeoutSeconds);
    config.maxRetries = cfg.getInt(ConfigManager::MAX_RETRIES, config.maxRetries);
    config.retryBackoffMs = cfg.getInt(ConfigManager::RETRY_BACKOFF_MS, config.retryBackoffMs);
    config.renewalThresholdDays = cfg.getInt(ConfigManager::RENEWAL_THRESHOLD_DAYS, config.renewalThresholdDays);

    config.validate();

    spdlog::info("Engine config: environment={}, curve={}, timeout={}s, retries={}",
                 environmentToString(config.environment), config.ecCurve,
                 config.httpTimeoutSeconds, config.maxRetries);
    return config;
}

void EngineConfig::validate() const {
    if (!isHttpUrl(endpoints.complianceApiUrl)) {
        throw ConfigException("invalid compliance API URL: " + endpoints.complianceApiUrl);
    }
    if (!isHttpUrl(endpoints.clearanceApiUrl)) {
        throw ConfigException("invalid clearance API URL: " + endpoints.clearanceApiUrl);
    }
    if (!isHttpUrl(endpoints.reportingApiUrl)) {
        throw ConfigException("invalid reporting API URL: " + endpoints.reportingApiUrl);
    }
    if (!isHttpUrl(endpoints.productionCsidApiUrl)) {
        throw ConfigException("invalid production CSID API URL: " + endpoints.productionCsidApiUrl);
    }
    if (ecCurve.empty()) {
        throw ConfigException("EC curve must not be empty");
    }
    if (httpTimeoutSeconds <= 0) {
        throw ConfigException("HTTP timeout must be positive");
    }
    if (maxRetries < 0) {
        throw ConfigException("max retries must not be negative");
    }
    if (retryBackoffMs < 0) {
        throw ConfigException("retry backoff must not be negative");
    }
    if (renewalThresholdDays < 0) {
        throw ConfigException("renewal threshold must not be negative");
    }
}

} // namespace zatca::common

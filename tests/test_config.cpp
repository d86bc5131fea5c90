/**
 * @file test_config.cpp
 * @brief Unit tests for ConfigManager and EngineConfig
 */

#include <gtest/gtest.h>

#include "zatca/common/config_manager.h"
#include "zatca/common/engine_config.h"
#include "zatca/common/exceptions.h"

using namespace zatca::common;

class ConfigTest : public ::testing::Test {
protected:
    ConfigManager& cfg_ = ConfigManager::getInstance();

    void TearDown() override {
        for (const char* key : {"ZATCA_TEST_STRING", "ZATCA_TEST_INT", "ZATCA_TEST_BOOL",
                                ConfigManager::ENVIRONMENT, ConfigManager::EC_CURVE,
                                ConfigManager::MAX_RETRIES, ConfigManager::CLEARANCE_API_URL,
                                ConfigManager::HTTP_TIMEOUT_SECONDS}) {
            cfg_.unset(key);
        }
    }
};

// ============================================================================
// ConfigManager
// ============================================================================

TEST_F(ConfigTest, SetOverridesAndUnsetRestoresDefault) {
    EXPECT_EQ(cfg_.getString("ZATCA_TEST_STRING", "fallback"), "fallback");
    EXPECT_FALSE(cfg_.has("ZATCA_TEST_STRING"));

    cfg_.set("ZATCA_TEST_STRING", "value");
    EXPECT_TRUE(cfg_.has("ZATCA_TEST_STRING"));
    EXPECT_EQ(cfg_.getString("ZATCA_TEST_STRING", "fallback"), "value");

    cfg_.unset("ZATCA_TEST_STRING");
    EXPECT_EQ(cfg_.getString("ZATCA_TEST_STRING", "fallback"), "fallback");
}

TEST_F(ConfigTest, GetInt_NonNumericUsesDefault) {
    cfg_.set("ZATCA_TEST_INT", "42");
    EXPECT_EQ(cfg_.getInt("ZATCA_TEST_INT", 7), 42);

    cfg_.set("ZATCA_TEST_INT", "forty-two");
    EXPECT_EQ(cfg_.getInt("ZATCA_TEST_INT", 7), 7);
}

TEST_F(ConfigTest, GetBool_AcceptedSpellings) {
    for (const char* v : {"true", "1", "YES", "on"}) {
        cfg_.set("ZATCA_TEST_BOOL", v);
        EXPECT_TRUE(cfg_.getBool("ZATCA_TEST_BOOL", false)) << v;
    }
    for (const char* v : {"false", "0", "No", "off"}) {
        cfg_.set("ZATCA_TEST_BOOL", v);
        EXPECT_FALSE(cfg_.getBool("ZATCA_TEST_BOOL", true)) << v;
    }
    cfg_.set("ZATCA_TEST_BOOL", "maybe");
    EXPECT_TRUE(cfg_.getBool("ZATCA_TEST_BOOL", true));
}

// ============================================================================
// EngineConfig
// ============================================================================

TEST_F(ConfigTest, EngineConfig_Defaults) {
    EngineConfig config = EngineConfig::fromConfigManager();

    EXPECT_EQ(config.environment, ZatcaEnvironment::SANDBOX);
    EXPECT_EQ(config.ecCurve, "secp256k1");
    EXPECT_EQ(config.httpTimeoutSeconds, 30);
    EXPECT_EQ(config.maxRetries, 3);
    EXPECT_NE(config.endpoints.clearanceApiUrl.find("/invoices/clearance/single"), std::string::npos);
    EXPECT_NE(config.endpoints.productionCsidApiUrl.find("/production/csids"), std::string::npos);
}

TEST_F(ConfigTest, EngineConfig_Overrides) {
    cfg_.set(ConfigManager::ENVIRONMENT, "Simulation");
    cfg_.set(ConfigManager::EC_CURVE, "prime256v1");
    cfg_.set(ConfigManager::MAX_RETRIES, "0");
    cfg_.set(ConfigManager::CLEARANCE_API_URL, "http://localhost:9000/clearance");

    EngineConfig config = EngineConfig::fromConfigManager();

    EXPECT_EQ(config.environment, ZatcaEnvironment::SIMULATION);
    EXPECT_EQ(config.ecCurve, "prime256v1");
    EXPECT_EQ(config.maxRetries, 0);
    EXPECT_EQ(config.endpoints.clearanceApiUrl, "http://localhost:9000/clearance");
}

TEST_F(ConfigTest, EngineConfig_InvalidValuesThrow) {
    cfg_.set(ConfigManager::CLEARANCE_API_URL, "ftp://example.sa");
    EXPECT_THROW(EngineConfig::fromConfigManager(), ConfigException);

    cfg_.unset(ConfigManager::CLEARANCE_API_URL);
    cfg_.set(ConfigManager::HTTP_TIMEOUT_SECONDS, "0");
    EXPECT_THROW(EngineConfig::fromConfigManager(), ConfigException);

    cfg_.unset(ConfigManager::HTTP_TIMEOUT_SECONDS);
    cfg_.set(ConfigManager::ENVIRONMENT, "staging");
    EXPECT_THROW(EngineConfig::fromConfigManager(), ConfigException);
}

TEST(EngineConfigValidateTest, NegativeRetriesThrow) {
    EngineConfig config;
    config.endpoints = {"https://a", "https://b", "https://c", "https://d"};
    EXPECT_NO_THROW(config.validate());

    config.maxRetries = -1;
    EXPECT_THROW(config.validate(), ConfigException);
}

TEST(EnvironmentTest, NamesAndAliases) {
    EXPECT_EQ(environmentFromString("sandbox"), ZatcaEnvironment::SANDBOX);
    EXPECT_EQ(environmentFromString("developer-portal"), ZatcaEnvironment::SANDBOX);
    EXPECT_EQ(environmentFromString("core"), ZatcaEnvironment::PRODUCTION);
    EXPECT_EQ(environmentToString(ZatcaEnvironment::SIMULATION), "simulation");
}

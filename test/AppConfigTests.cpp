#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include "STS/AppConfig.hpp"

using namespace STS;

class AppConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        clearEnvironment();
    }

    void TearDown() override {
        clearEnvironment();
    }

    static void clearEnvironment() {
        for (const char* name : {"STS_LOG_LEVEL", "STS_LOG_FILE", "STS_DISCOVERY_ENABLED", "STS_DISCOVERY_TIMEOUT",
                                 "STS_MANUAL_DEVICE_IPS", "STS_STORE_PATH", "STS_MOCK_MODE", "STS_VENDOR_FILTER"}) {
            unsetenv(name);
        }
    }
};

TEST_F(AppConfigTest, Defaults) {
    AppConfig config;

    EXPECT_EQ(config.logLevel, "info");
    EXPECT_TRUE(config.discoveryEnabled);
    EXPECT_EQ(config.discoveryTimeout, std::chrono::seconds(5));
    EXPECT_EQ(config.searchTarget, "ssdp:all");
    EXPECT_EQ(config.vendorFilter, "bose");
    EXPECT_EQ(config.deviceHttpPort, 8090);
    EXPECT_FALSE(config.mockMode);
    EXPECT_TRUE(config.validate().has_value());
}

TEST_F(AppConfigTest, LoadsJsonAndIgnoresUnknownKeys) {
    AppConfig config;

    auto loaded = config.loadFromJsonText(R"({
        "logLevel": "debug",
        "discoveryEnabled": false,
        "discoveryTimeout": 8,
        "manualDeviceIps": ["192.168.1.10", "192.168.1.11"],
        "deviceHttpPort": 8091,
        "storePath": "/tmp/devices.json",
        "somethingElse": {"nested": true}
    })");

    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(config.logLevel, "debug");
    EXPECT_FALSE(config.discoveryEnabled);
    EXPECT_EQ(config.discoveryTimeout, std::chrono::seconds(8));
    EXPECT_EQ(config.manualDeviceIps.size(), 2u);
    EXPECT_EQ(config.deviceHttpPort, 8091);
    EXPECT_EQ(config.storePath, "/tmp/devices.json");
}

TEST_F(AppConfigTest, JsonErrors) {
    AppConfig config;

    EXPECT_EQ(config.loadFromJsonText("{not json").error(), ConfigError::ParseFailed);
    EXPECT_EQ(config.loadFromJsonText("[1, 2]").error(), ConfigError::ParseFailed);
    EXPECT_EQ(config.loadFromJsonText(R"({"discoveryTimeout": "soon"})").error(), ConfigError::InvalidValue);
    EXPECT_EQ(config.loadFromJsonText(R"({"deviceHttpPort": 70000})").error(), ConfigError::InvalidValue);
    EXPECT_EQ(config.loadFromFile("/nonexistent/sts-config.json").error(), ConfigError::FileNotFound);
}

TEST_F(AppConfigTest, LoadsFromFile) {
    auto path = std::filesystem::temp_directory_path() / "sts-config-test.json";
    {
        std::ofstream out(path);
        out << R"({"mockMode": true, "vendorFilter": "Bose Corporation"})";
    }
    AppConfig config;

    auto loaded = config.loadFromFile(path);
    std::filesystem::remove(path);

    ASSERT_TRUE(loaded.has_value());
    EXPECT_TRUE(config.mockMode);
    EXPECT_EQ(config.vendorFilter, "Bose Corporation");
}

TEST_F(AppConfigTest, EnvironmentOverridesFile) {
    AppConfig config;
    ASSERT_TRUE(config.loadFromJsonText(R"({"discoveryEnabled": true, "logLevel": "info"})").has_value());
    setenv("STS_DISCOVERY_ENABLED", "false", 1);
    setenv("STS_LOG_LEVEL", "WARN", 1);
    setenv("STS_MANUAL_DEVICE_IPS", "10.0.0.1, 10.0.0.2,,", 1);
    setenv("STS_DISCOVERY_TIMEOUT", "3", 1);
    setenv("STS_MOCK_MODE", "yes", 1);

    ASSERT_TRUE(config.applyEnvironment().has_value());
    ASSERT_TRUE(config.validate().has_value());

    EXPECT_FALSE(config.discoveryEnabled);
    EXPECT_EQ(config.logLevel, "warn");
    EXPECT_EQ(config.manualDeviceIps, (std::vector<std::string>{"10.0.0.1", "10.0.0.2"}));
    EXPECT_EQ(config.discoveryTimeout, std::chrono::seconds(3));
    EXPECT_TRUE(config.mockMode);
}

TEST_F(AppConfigTest, BadEnvironmentValues) {
    AppConfig config;
    setenv("STS_DISCOVERY_ENABLED", "maybe", 1);
    EXPECT_EQ(config.applyEnvironment().error(), ConfigError::InvalidValue);

    unsetenv("STS_DISCOVERY_ENABLED");
    setenv("STS_DISCOVERY_TIMEOUT", "5s", 1);
    EXPECT_EQ(config.applyEnvironment().error(), ConfigError::InvalidValue);
}

TEST_F(AppConfigTest, ValidateNormalisesManualIps) {
    AppConfig config;
    config.manualDeviceIps = {" 192.168.1.10 ", "", "192.168.1.11", "192.168.1.10", "   "};

    ASSERT_TRUE(config.validate().has_value());

    EXPECT_EQ(config.manualDeviceIps, (std::vector<std::string>{"192.168.1.10", "192.168.1.11"}));
}

TEST_F(AppConfigTest, ValidateRejectsBadValues) {
    AppConfig badIp;
    badIp.manualDeviceIps = {"192.168.1.300"};
    EXPECT_EQ(badIp.validate().error(), ConfigError::InvalidValue);

    AppConfig badLevel;
    badLevel.logLevel = "chatty";
    EXPECT_EQ(badLevel.validate().error(), ConfigError::InvalidValue);

    AppConfig badTimeout;
    badTimeout.discoveryTimeout = std::chrono::seconds(0);
    EXPECT_EQ(badTimeout.validate().error(), ConfigError::InvalidValue);
}

TEST_F(AppConfigTest, SyncOptionsCarryDiscoveryInputs) {
    AppConfig config;
    config.discoveryEnabled = false;
    config.discoveryTimeout = std::chrono::seconds(9);
    config.manualDeviceIps = {"10.0.0.5"};

    auto options = config.toSyncOptions();

    EXPECT_FALSE(options.discoveryEnabled);
    EXPECT_EQ(options.discoveryTimeout, std::chrono::milliseconds(9000));
    EXPECT_EQ(options.manualIps, std::vector<std::string>{"10.0.0.5"});
}

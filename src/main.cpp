/**
 * @file main.cpp
 * @brief sts-sync: discover SoundTouch speakers and sync them into the inventory.
 */

#include <CLI/CLI.hpp>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "STS/AppConfig.hpp"
#include "STS/DeviceStore.hpp"
#include "STS/DiscoveryAggregator.hpp"
#include "STS/HttpClient.hpp"
#include "STS/HttpDeviceInfoClient.hpp"
#include "STS/Logging.hpp"
#include "STS/MockDevices.hpp"
#include "STS/SsdpDiscovery.hpp"
#include "STS/SyncOrchestrator.h"

namespace {

constexpr int kExitConfigError = 1;
constexpr int kExitConcurrentRun = 2;

std::unique_ptr<STS::IDeviceDiscovery> makeNetworkSource(const STS::AppConfig& config,
                                                         const std::shared_ptr<STS::IHttpClient>& httpClient) {
    if (config.mockMode) {
        return std::make_unique<STS::MockDiscovery>();
    }
    STS::SsdpOptions options;
    options.searchTarget = config.searchTarget;
    options.vendorFilter = config.vendorFilter;
    options.descriptorTimeout = config.descriptorTimeout;
    options.devicePort = config.deviceHttpPort;
    return std::make_unique<STS::SsdpDiscovery>(httpClient, options);
}

std::shared_ptr<STS::IDeviceInfoClient> makeInfoClient(const STS::AppConfig& config,
                                                       const std::shared_ptr<STS::IHttpClient>& httpClient) {
    if (config.mockMode) {
        return std::make_shared<STS::MockDeviceInfoClient>();
    }
    return std::make_shared<STS::HttpDeviceInfoClient>(httpClient, config.deviceRequestTimeout);
}

nlohmann::json discoveredToJson(const std::vector<STS::DiscoveredDevice>& devices) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& device : devices) {
        nlohmann::json j;
        j["ip"] = device.ip;
        j["port"] = device.port;
        j["name"] = device.name ? nlohmann::json(*device.name) : nlohmann::json(nullptr);
        j["model"] = device.model ? nlohmann::json(*device.model) : nlohmann::json(nullptr);
        arr.push_back(std::move(j));
    }
    return {{"count", devices.size()}, {"devices", std::move(arr)}};
}

} // namespace

int main(int argc, char** argv) {
    CLI::App app{"SoundTouch speaker discovery and inventory sync"};

    std::optional<std::string> configPath;
    bool mock = false;
    std::optional<std::string> logLevel;
    app.add_option("--config", configPath, "JSON configuration file");
    app.add_flag("--mock", mock, "Use the built-in mock speakers instead of the network");
    app.add_option("--log-level", logLevel, "trace|debug|info|warn|error|critical|off");

    app.add_subcommand("sync", "Discover devices and update the inventory (default)");
    auto* discoverCmd = app.add_subcommand("discover", "Discover devices and print them");
    auto* listCmd = app.add_subcommand("list", "Print all inventory records");
    auto* clearCmd = app.add_subcommand("clear", "Delete all inventory records");
    app.require_subcommand(0, 1);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    STS::AppConfig config;
    if (configPath) {
        if (auto loaded = config.loadFromFile(*configPath); !loaded) {
            spdlog::critical("Failed to load {}: {}", *configPath, make_error_code(loaded.error()).message());
            return kExitConfigError;
        }
    }
    if (auto env = config.applyEnvironment(); !env) {
        spdlog::critical("Invalid environment configuration: {}", make_error_code(env.error()).message());
        return kExitConfigError;
    }
    if (mock) {
        config.mockMode = true;
    }
    if (logLevel) {
        config.logLevel = *logLevel;
    }
    if (auto valid = config.validate(); !valid) {
        spdlog::critical("Invalid configuration: {}", make_error_code(valid.error()).message());
        return kExitConfigError;
    }

    try {
        STS::Logging::configure(config);
        spdlog::info("sts-sync starting (mock mode: {})", config.mockMode);

        auto httpClient = std::make_shared<STS::CurlHttpClient>();

        auto store = std::make_shared<STS::JsonFileDeviceStore>(config.storePath);
        if (auto opened = store->open(); !opened) {
            spdlog::critical("Cannot open device store {}: {}", config.storePath,
                             make_error_code(opened.error()).message());
            return kExitConfigError;
        }

        if (*listCmd) {
            auto records = store->getAll();
            nlohmann::json arr = nlohmann::json::array();
            for (const auto& record : records) {
                arr.push_back(record.toJson());
            }
            std::cout << nlohmann::json{{"count", records.size()}, {"devices", std::move(arr)}}.dump(2) << std::endl;
            return 0;
        }

        if (*clearCmd) {
            auto removed = store->deleteAll();
            if (!removed) {
                spdlog::error("Failed to clear device store: {}", make_error_code(removed.error()).message());
                return 1;
            }
            std::cout << nlohmann::json{{"deleted", *removed}}.dump(2) << std::endl;
            return 0;
        }

        auto aggregator = std::make_unique<STS::DiscoveryAggregator>(makeNetworkSource(config, httpClient),
                                                                     config.deviceHttpPort);

        if (*discoverCmd) {
            auto devices = aggregator->discover(config.discoveryEnabled, config.manualDeviceIps,
                                                config.discoveryTimeout);
            std::cout << discoveredToJson(devices).dump(2) << std::endl;
            return 0;
        }

        // sync, explicit or by default
        STS::SyncOrchestrator orchestrator(std::move(aggregator), makeInfoClient(config, httpClient),
                                           store, config.toSyncOptions());
        auto result = orchestrator.sync();
        if (!result) {
            spdlog::error("Sync rejected: {}", make_error_code(result.error()).message());
            return kExitConcurrentRun;
        }
        std::cout << result->toJson().dump(2) << std::endl;
        return 0;
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
        return 1;
    } catch (const std::exception& ex) {
        spdlog::critical("Unhandled exception: {}", ex.what());
        return 1;
    }
}

#pragma once

#include "STS/Error.h"
#include "STS/SyncOrchestrator.h"
#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <vector>

namespace STS {

/**
 * @brief Process configuration for sts-sync
 *
 * Sources, lowest precedence first: defaults, JSON file, STS_* environment
 * variables, command line. validate() must run after the last overlay.
 */
struct AppConfig {
    std::string logLevel = "info";
    std::string logFile;                                    ///< Empty: console only
    bool discoveryEnabled = true;
    std::chrono::seconds discoveryTimeout{5};
    std::string searchTarget = "ssdp:all";
    std::string vendorFilter = "bose";
    std::vector<std::string> manualDeviceIps;
    std::uint16_t deviceHttpPort = 8090;
    std::chrono::seconds deviceRequestTimeout{5};
    std::chrono::seconds descriptorTimeout{5};
    std::string storePath = "sts-devices.json";
    bool mockMode = false;

    /**
     * @brief Overlay values from a JSON object file
     *
     * Unknown keys are ignored.
     */
    std::expected<void, ConfigError> loadFromFile(const std::filesystem::path& path);

    /// Overlay values from a parsed JSON document.
    std::expected<void, ConfigError> loadFromJsonText(const std::string& text);

    /// Overlay STS_* environment variables.
    std::expected<void, ConfigError> applyEnvironment();

    /**
     * @brief Check ranges and normalise manualDeviceIps
     *
     * Trims entries, drops empty ones, rejects anything that is not a dotted
     * IPv4 quad and removes duplicates keeping first-seen order.
     */
    std::expected<void, ConfigError> validate();

    SyncOptions toSyncOptions() const;
};

} // namespace STS

#include "STS/AppConfig.hpp"
#include "STS/Helpers.h"
#include "STS/Logging.hpp"
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <nlohmann/json.hpp>
#include <optional>
#include <spdlog/spdlog.h>
#include <sstream>
#include <unordered_set>

using json = nlohmann::json;

namespace STS {

namespace {

std::optional<bool> parseBool(std::string_view value) {
    auto lowered = Helpers::toLower(Helpers::trim(value));
    if (lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on") {
        return true;
    }
    if (lowered == "0" || lowered == "false" || lowered == "no" || lowered == "off") {
        return false;
    }
    return std::nullopt;
}

std::optional<long long> parseInteger(std::string_view value) {
    auto trimmed = Helpers::trim(value);
    long long result = 0;
    auto [ptr, ec] = std::from_chars(trimmed.data(), trimmed.data() + trimmed.size(), result);
    if (ec != std::errc() || ptr != trimmed.data() + trimmed.size()) {
        return std::nullopt;
    }
    return result;
}

const char* env(const char* name) {
    const char* value = std::getenv(name);
    return (value && *value) ? value : nullptr;
}

} // namespace

std::expected<void, ConfigError> AppConfig::loadFromFile(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        spdlog::error("AppConfig: Cannot open config file {}", path.string());
        return std::unexpected(ConfigError::FileNotFound);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return loadFromJsonText(buffer.str());
}

std::expected<void, ConfigError> AppConfig::loadFromJsonText(const std::string& text) {
    json j = json::parse(text, nullptr, false);
    if (j.is_discarded()) {
        spdlog::error("AppConfig: Config is not valid JSON");
        return std::unexpected(ConfigError::ParseFailed);
    }
    if (!j.is_object()) {
        spdlog::error("AppConfig: Config must be a JSON object");
        return std::unexpected(ConfigError::ParseFailed);
    }

    try {
        if (j.contains("logLevel")) logLevel = j.at("logLevel").get<std::string>();
        if (j.contains("logFile")) logFile = j.at("logFile").get<std::string>();
        if (j.contains("discoveryEnabled")) discoveryEnabled = j.at("discoveryEnabled").get<bool>();
        if (j.contains("discoveryTimeout")) discoveryTimeout = std::chrono::seconds(j.at("discoveryTimeout").get<int>());
        if (j.contains("searchTarget")) searchTarget = j.at("searchTarget").get<std::string>();
        if (j.contains("vendorFilter")) vendorFilter = j.at("vendorFilter").get<std::string>();
        if (j.contains("manualDeviceIps")) manualDeviceIps = j.at("manualDeviceIps").get<std::vector<std::string>>();
        if (j.contains("deviceHttpPort")) {
            auto port = j.at("deviceHttpPort").get<int>();
            if (port < 1 || port > 65535) {
                spdlog::error("AppConfig: deviceHttpPort {} out of range", port);
                return std::unexpected(ConfigError::InvalidValue);
            }
            deviceHttpPort = static_cast<std::uint16_t>(port);
        }
        if (j.contains("deviceRequestTimeout")) deviceRequestTimeout = std::chrono::seconds(j.at("deviceRequestTimeout").get<int>());
        if (j.contains("descriptorTimeout")) descriptorTimeout = std::chrono::seconds(j.at("descriptorTimeout").get<int>());
        if (j.contains("storePath")) storePath = j.at("storePath").get<std::string>();
        if (j.contains("mockMode")) mockMode = j.at("mockMode").get<bool>();
    } catch (const json::exception& e) {
        spdlog::error("AppConfig: Invalid config value: {}", e.what());
        return std::unexpected(ConfigError::InvalidValue);
    }
    return {};
}

std::expected<void, ConfigError> AppConfig::applyEnvironment() {
    if (auto v = env("STS_LOG_LEVEL")) logLevel = v;
    if (auto v = env("STS_LOG_FILE")) logFile = v;
    if (auto v = env("STS_STORE_PATH")) storePath = v;
    if (auto v = env("STS_VENDOR_FILTER")) vendorFilter = v;

    if (auto v = env("STS_DISCOVERY_ENABLED")) {
        auto flag = parseBool(v);
        if (!flag) {
            spdlog::error("AppConfig: STS_DISCOVERY_ENABLED='{}' is not a boolean", v);
            return std::unexpected(ConfigError::InvalidValue);
        }
        discoveryEnabled = *flag;
    }
    if (auto v = env("STS_MOCK_MODE")) {
        auto flag = parseBool(v);
        if (!flag) {
            spdlog::error("AppConfig: STS_MOCK_MODE='{}' is not a boolean", v);
            return std::unexpected(ConfigError::InvalidValue);
        }
        mockMode = *flag;
    }
    if (auto v = env("STS_DISCOVERY_TIMEOUT")) {
        auto seconds = parseInteger(v);
        if (!seconds) {
            spdlog::error("AppConfig: STS_DISCOVERY_TIMEOUT='{}' is not an integer", v);
            return std::unexpected(ConfigError::InvalidValue);
        }
        discoveryTimeout = std::chrono::seconds(*seconds);
    }
    if (auto v = env("STS_MANUAL_DEVICE_IPS")) {
        manualDeviceIps = Helpers::splitCommaList(v);
    }
    return {};
}

std::expected<void, ConfigError> AppConfig::validate() {
    if (!Logging::parseLevel(logLevel)) {
        spdlog::error("AppConfig: Unknown log level '{}'", logLevel);
        return std::unexpected(ConfigError::InvalidValue);
    }
    logLevel = Helpers::toLower(Helpers::trim(logLevel));

    if (discoveryTimeout.count() <= 0 || deviceRequestTimeout.count() <= 0 || descriptorTimeout.count() <= 0) {
        spdlog::error("AppConfig: Timeouts must be positive");
        return std::unexpected(ConfigError::InvalidValue);
    }
    if (deviceHttpPort == 0) {
        spdlog::error("AppConfig: deviceHttpPort must be non-zero");
        return std::unexpected(ConfigError::InvalidValue);
    }
    if (storePath.empty()) {
        spdlog::error("AppConfig: storePath must not be empty");
        return std::unexpected(ConfigError::InvalidValue);
    }

    std::vector<std::string> normalised;
    std::unordered_set<std::string> seen;
    for (const auto& entry : manualDeviceIps) {
        auto ip = Helpers::trim(entry);
        if (ip.empty()) {
            continue;
        }
        if (!Helpers::isValidIpv4(ip)) {
            spdlog::error("AppConfig: Invalid manual device IP '{}'", ip);
            return std::unexpected(ConfigError::InvalidValue);
        }
        if (seen.insert(ip).second) {
            normalised.push_back(ip);
        }
    }
    manualDeviceIps = std::move(normalised);
    return {};
}

SyncOptions AppConfig::toSyncOptions() const {
    SyncOptions options;
    options.discoveryEnabled = discoveryEnabled;
    options.discoveryTimeout = discoveryTimeout;
    options.manualIps = manualDeviceIps;
    return options;
}

} // namespace STS

#pragma once

#include <chrono>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <nlohmann/json_fwd.hpp> // For toJson declarations
#include "STS/Error.h"
#include "STS/IDeviceInfoClient.h"

namespace STS {

/**
 * @brief Persisted inventory entry for one speaker
 *
 * Keyed by deviceId. id is assigned by the store on first insert and stays
 * stable across updates.
 */
struct InventoryRecord {
    std::optional<std::int64_t> id;
    std::string deviceId;
    std::string ip;
    std::string name;
    std::string model;
    std::string macAddress;
    std::string firmwareVersion;
    std::string schemaVersion = "unknown";
    std::chrono::system_clock::time_point lastSeen{};

    /**
     * @brief Build a record from a device's identity
     * @param discoveredIp Address the device was reached at; used when the identity has none
     */
    static InventoryRecord fromIdentity(const DeviceIdentity& identity,
                                        const std::string& discoveredIp,
                                        std::chrono::system_clock::time_point seenAt = std::chrono::system_clock::now());

    /**
     * @brief Derive the schema version ("28.0.3") from a firmware string
     *
     * First whitespace-separated token, cut to three dot components.
     * Returns "unknown" for an empty firmware string.
     */
    static std::string schemaVersionFor(const std::string& firmwareVersion);

    nlohmann::json toJson() const;
    static std::expected<InventoryRecord, DeviceError> fromJson(const nlohmann::json& j);
};

} // namespace STS

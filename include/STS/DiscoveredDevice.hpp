#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace STS {

/// Well-known HTTP control port of the speakers.
constexpr std::uint16_t kDefaultControlPort = 8090;

/**
 * @brief A device reported by a discovery source
 *
 * Ephemeral: produced by discovery, consumed by SyncOrchestrator which
 * resolves the authoritative identity before anything is persisted.
 * Optional fields are unknown until the device itself is queried.
 */
struct DiscoveredDevice {
    std::string ip;
    std::uint16_t port = kDefaultControlPort;
    std::optional<std::string> name;
    std::optional<std::string> model;
    std::optional<std::string> macAddress;      ///< Dedup key from the description document, SSDP only
    std::optional<std::string> firmwareVersion;

    std::string baseUrl() const {
        return "http://" + ip + ":" + std::to_string(port);
    }
};

} // namespace STS

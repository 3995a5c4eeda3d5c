// include/STS/IDeviceInfoClient.h
#pragma once

#include <expected>
#include <optional>
#include <string>
#include "STS/Error.h"

namespace STS {

/**
 * @brief Authoritative identity reported by a device about itself
 *
 * Only deviceId is guaranteed. Everything else depends on firmware and
 * model and is carried as optional.
 */
struct DeviceIdentity {
    std::string deviceId;
    std::optional<std::string> name;
    std::optional<std::string> type;            ///< Marketing model, e.g. "SoundTouch 20"
    std::optional<std::string> macAddress;
    std::optional<std::string> ipAddress;
    std::optional<std::string> firmwareVersion;
    std::optional<std::string> moduleType;
    std::optional<std::string> variant;
    std::optional<std::string> variantMode;
};

/**
 * @brief Queries a device for its identity
 */
class IDeviceInfoClient {
public:
    virtual ~IDeviceInfoClient() = default;

    /**
     * @brief Fetch identity from the device at baseUrl
     * @param baseUrl "http://<ip>:<port>" of the device's control API
     * @return Identity or error (ConnectionFailed/Timeout for unreachable devices)
     */
    virtual std::expected<DeviceIdentity, DeviceError> getInfo(const std::string& baseUrl) = 0;
};

} // namespace STS

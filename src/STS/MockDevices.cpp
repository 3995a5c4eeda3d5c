#include "STS/MockDevices.hpp"
#include "STS/Helpers.h"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace STS {

const std::vector<MockDeviceSpec>& mockDevicePopulation() {
    static const std::vector<MockDeviceSpec> population = {
        {"AABBCC112233", "Living Room", "SoundTouch 20", "192.168.1.100", "28.0.12.46499"},
        {"DDEEFF445566", "Kitchen", "SoundTouch 10", "192.168.1.101", "28.0.12.46499"},
        {"112233445566", "Bedroom", "SoundTouch 30", "192.168.1.102", "28.0.12.46499"},
    };
    return population;
}

std::expected<std::vector<DiscoveredDevice>, DiscoveryError> MockDiscovery::discover(std::chrono::milliseconds) {
    std::vector<DiscoveredDevice> devices;
    for (const auto& spec : mockDevicePopulation()) {
        DiscoveredDevice device;
        device.ip = spec.ip;
        device.port = kDefaultControlPort;
        device.name = spec.name;
        device.model = spec.model;
        device.macAddress = spec.macAddress;
        device.firmwareVersion = spec.firmwareVersion;
        devices.push_back(std::move(device));
    }
    spdlog::info("MockDiscovery: Returning {} mock device(s)", devices.size());
    return devices;
}

std::expected<DeviceIdentity, DeviceError> MockDeviceInfoClient::getInfo(const std::string& baseUrl) {
    auto host = Helpers::hostFromUrl(baseUrl);
    const auto& population = mockDevicePopulation();
    auto it = std::find_if(population.begin(), population.end(),
                           [&](const MockDeviceSpec& spec) { return host && spec.ip == *host; });
    if (it == population.end()) {
        spdlog::debug("MockDeviceInfoClient: No mock device at {}", baseUrl);
        return std::unexpected(DeviceError::ConnectionFailed);
    }

    DeviceIdentity identity;
    identity.deviceId = it->macAddress;
    identity.name = it->name;
    identity.type = it->model;
    identity.macAddress = it->macAddress;
    identity.ipAddress = it->ip;
    identity.firmwareVersion = it->firmwareVersion;
    return identity;
}

} // namespace STS

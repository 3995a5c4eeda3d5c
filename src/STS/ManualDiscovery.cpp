#include "STS/ManualDiscovery.hpp"
#include <spdlog/spdlog.h>

namespace STS {

ManualDiscovery::ManualDiscovery(std::vector<std::string> deviceIps, std::uint16_t port)
    : deviceIps_(std::move(deviceIps))
    , port_(port)
{
}

std::vector<DiscoveredDevice> ManualDiscovery::resolve() const {
    std::vector<DiscoveredDevice> devices;
    devices.reserve(deviceIps_.size());
    for (const auto& ip : deviceIps_) {
        DiscoveredDevice device;
        device.ip = ip;
        device.port = port_;
        devices.push_back(std::move(device));
    }
    spdlog::info("ManualDiscovery: {} device(s) configured", devices.size());
    return devices;
}

std::expected<std::vector<DiscoveredDevice>, DiscoveryError> ManualDiscovery::discover(std::chrono::milliseconds) {
    return resolve();
}

} // namespace STS

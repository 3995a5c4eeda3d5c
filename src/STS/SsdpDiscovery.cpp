#include "STS/SsdpDiscovery.hpp"
#include <spdlog/spdlog.h>

namespace STS {

SsdpDiscovery::SsdpDiscovery(std::shared_ptr<IHttpClient> httpClient,
                             SsdpOptions options,
                             MulticastSocketFactory socketFactory)
    : options_(std::move(options))
    , probe_(std::move(socketFactory))
    , fetcher_(std::move(httpClient), options_.vendorFilter, options_.descriptorTimeout)
{
}

DiscoveredDevice SsdpDiscovery::toDiscoveredDevice(const DeviceDescriptor& descriptor, std::uint16_t port) {
    DiscoveredDevice device;
    device.ip = descriptor.ip;
    device.port = port;
    device.name = descriptor.friendlyName;
    device.model = descriptor.modelName;
    device.macAddress = descriptor.dedupKey;
    return device;
}

std::expected<std::vector<DiscoveredDevice>, DiscoveryError> SsdpDiscovery::discover(std::chrono::milliseconds timeout) {
    spdlog::info("SsdpDiscovery: Starting SSDP discovery (timeout: {} ms)", timeout.count());

    auto locations = probe_.probeAsync(options_.searchTarget, timeout).get();
    if (locations.empty()) {
        spdlog::info("SsdpDiscovery: No SSDP responses");
        return std::vector<DiscoveredDevice>{};
    }

    auto descriptors = fetcher_.fetchAll(locations);

    std::vector<DiscoveredDevice> devices;
    devices.reserve(descriptors.size());
    for (const auto& [key, descriptor] : descriptors) {
        devices.push_back(toDiscoveredDevice(descriptor, options_.devicePort));
    }
    spdlog::info("SsdpDiscovery: Found {} device(s)", devices.size());
    return devices;
}

} // namespace STS

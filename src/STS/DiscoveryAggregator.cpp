#include "STS/DiscoveryAggregator.hpp"
#include "STS/ManualDiscovery.hpp"
#include <exception>
#include <iterator>
#include <spdlog/spdlog.h>

namespace STS {

DiscoveryAggregator::DiscoveryAggregator(std::unique_ptr<IDeviceDiscovery> networkSource,
                                         std::uint16_t devicePort)
    : networkSource_(std::move(networkSource))
    , devicePort_(devicePort)
{
}

std::vector<DiscoveredDevice> DiscoveryAggregator::runSource(IDeviceDiscovery& source,
                                                             std::chrono::milliseconds timeout) {
    try {
        auto result = source.discover(timeout);
        if (!result) {
            spdlog::error("DiscoveryAggregator: Source '{}' failed: {}",
                          source.name(), make_error_code(result.error()).message());
            return {};
        }
        spdlog::debug("DiscoveryAggregator: Source '{}' returned {} device(s)", source.name(), result->size());
        return std::move(*result);
    } catch (const std::exception& e) {
        spdlog::error("DiscoveryAggregator: Source '{}' threw: {}", source.name(), e.what());
        return {};
    }
}

std::vector<DiscoveredDevice> DiscoveryAggregator::discover(bool enableMulticast,
                                                            const std::vector<std::string>& manualIps,
                                                            std::chrono::milliseconds timeout) {
    std::vector<DiscoveredDevice> devices;

    if (enableMulticast && networkSource_) {
        auto found = runSource(*networkSource_, timeout);
        devices.insert(devices.end(), std::make_move_iterator(found.begin()), std::make_move_iterator(found.end()));
    } else if (enableMulticast) {
        spdlog::warn("DiscoveryAggregator: Multicast requested but no network source configured");
    }

    if (!manualIps.empty()) {
        ManualDiscovery manual(manualIps, devicePort_);
        auto found = runSource(manual, timeout);
        devices.insert(devices.end(), std::make_move_iterator(found.begin()), std::make_move_iterator(found.end()));
    }

    spdlog::info("DiscoveryAggregator: {} device(s) in total", devices.size());
    return devices;
}

} // namespace STS

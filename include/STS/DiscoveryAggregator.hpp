#pragma once

#include "STS/IDeviceDiscovery.h"
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace STS {

/**
 * @brief Combines the network source with manually configured addresses
 *
 * A failing source contributes nothing; it never blocks the other one.
 * Results are concatenated without deduplication: a speaker found by SSDP
 * and also listed manually appears twice and is reconciled by deviceId
 * during sync.
 */
class DiscoveryAggregator {
public:
    /**
     * @param networkSource SSDP in production, MockDiscovery in mock mode; may be null
     * @param devicePort Port assigned to manually configured devices
     */
    explicit DiscoveryAggregator(std::unique_ptr<IDeviceDiscovery> networkSource,
                                 std::uint16_t devicePort = kDefaultControlPort);

    std::vector<DiscoveredDevice> discover(bool enableMulticast,
                                           const std::vector<std::string>& manualIps,
                                           std::chrono::milliseconds timeout);

private:
    std::vector<DiscoveredDevice> runSource(IDeviceDiscovery& source, std::chrono::milliseconds timeout);

    std::unique_ptr<IDeviceDiscovery> networkSource_;
    std::uint16_t devicePort_;
};

} // namespace STS

#pragma once

#include "STS/IDeviceDiscovery.h"
#include <cstdint>
#include <string>
#include <vector>

namespace STS {

/**
 * @brief Turns configured IP addresses into DiscoveredDevice records
 *
 * No network I/O. Name and model stay unknown until the sync step queries
 * the device. Duplicates are not removed here.
 */
class ManualDiscovery : public IDeviceDiscovery {
public:
    explicit ManualDiscovery(std::vector<std::string> deviceIps,
                             std::uint16_t port = kDefaultControlPort);

    std::vector<DiscoveredDevice> resolve() const;

    std::expected<std::vector<DiscoveredDevice>, DiscoveryError> discover(std::chrono::milliseconds timeout) override;
    std::string name() const override { return "manual"; }

private:
    std::vector<std::string> deviceIps_;
    std::uint16_t port_;
};

} // namespace STS

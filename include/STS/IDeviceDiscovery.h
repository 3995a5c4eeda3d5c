// include/STS/IDeviceDiscovery.h
#pragma once

#include <chrono>
#include <expected>
#include <string>
#include <vector>
#include "STS/DiscoveredDevice.hpp"
#include "STS/Error.h"

namespace STS {

/**
 * @brief Interface for one source of discovered devices
 *
 * Implementations cover SSDP multicast, manually configured addresses and the
 * mock population used without hardware. A source reports its own failure
 * through the error channel; DiscoveryAggregator decides what that means for
 * the overall result.
 */
class IDeviceDiscovery {
public:
    virtual ~IDeviceDiscovery() = default;

    /**
     * @brief Discover devices
     * @param timeout Time budget for the source; sources without network I/O ignore it
     * @return Discovered devices (possibly empty) or error
     */
    virtual std::expected<std::vector<DiscoveredDevice>, DiscoveryError> discover(std::chrono::milliseconds timeout) = 0;

    /// Short name used in log lines ("ssdp", "manual", "mock").
    virtual std::string name() const = 0;
};

} // namespace STS

#pragma once

#include "STS/DescriptorFetcher.hpp"
#include "STS/IDeviceDiscovery.h"
#include "STS/MulticastProbe.hpp"
#include <cstdint>
#include <memory>
#include <string>

namespace STS {

struct SsdpOptions {
    std::string searchTarget = kSsdpSearchAll;  ///< Broad search; the vendor filter narrows it down
    std::string vendorFilter = kDefaultVendorFilter;
    std::chrono::milliseconds descriptorTimeout = kDefaultDescriptorTimeout;
    std::uint16_t devicePort = kDefaultControlPort;
};

/**
 * @brief SSDP discovery: M-SEARCH, then description documents
 *
 * The blocking probe runs on its own worker thread; the description fetches
 * fan out once the response window has closed.
 */
class SsdpDiscovery : public IDeviceDiscovery {
public:
    SsdpDiscovery(std::shared_ptr<IHttpClient> httpClient,
                  SsdpOptions options = {},
                  MulticastSocketFactory socketFactory = {});

    std::expected<std::vector<DiscoveredDevice>, DiscoveryError> discover(std::chrono::milliseconds timeout) override;
    std::string name() const override { return "ssdp"; }

    /// Map a validated descriptor to the record handed to the sync step.
    static DiscoveredDevice toDiscoveredDevice(const DeviceDescriptor& descriptor, std::uint16_t port);

private:
    SsdpOptions options_;
    MulticastProbe probe_;
    DescriptorFetcher fetcher_;
};

} // namespace STS

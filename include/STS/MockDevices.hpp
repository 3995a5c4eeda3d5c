#pragma once

#include "STS/IDeviceDiscovery.h"
#include "STS/IDeviceInfoClient.h"
#include <string>
#include <vector>

namespace STS {

/// One entry of the fixed mock population.
struct MockDeviceSpec {
    std::string macAddress;
    std::string name;
    std::string model;
    std::string ip;
    std::string firmwareVersion;
};

/// The three speakers served in mock mode.
const std::vector<MockDeviceSpec>& mockDevicePopulation();

/**
 * @brief Discovery source returning the mock population
 *
 * Used in place of SSDP when mock mode is on, so the whole sync path can be
 * exercised without hardware.
 */
class MockDiscovery : public IDeviceDiscovery {
public:
    std::expected<std::vector<DiscoveredDevice>, DiscoveryError> discover(std::chrono::milliseconds timeout) override;
    std::string name() const override { return "mock"; }
};

/**
 * @brief Info client answering for the mock population
 *
 * deviceId is the MAC address. Any address outside the population behaves
 * like an unreachable device.
 */
class MockDeviceInfoClient : public IDeviceInfoClient {
public:
    std::expected<DeviceIdentity, DeviceError> getInfo(const std::string& baseUrl) override;
};

} // namespace STS

#pragma once

#include "STS/HttpClient.hpp"
#include "STS/IDeviceInfoClient.h"
#include <chrono>
#include <memory>
#include <string>

namespace STS {

/**
 * @brief IDeviceInfoClient backed by the device's "/info" HTTP endpoint
 *
 * Single attempt per call; retry policy belongs to whoever calls sync().
 */
class HttpDeviceInfoClient : public IDeviceInfoClient {
public:
    explicit HttpDeviceInfoClient(std::shared_ptr<IHttpClient> httpClient,
                                  std::chrono::milliseconds timeout = std::chrono::seconds(5));

    std::expected<DeviceIdentity, DeviceError> getInfo(const std::string& baseUrl) override;

    /**
     * @brief Parse an "<info>" document
     * @param fallbackIp Used when the document carries no ipAddress
     */
    static std::expected<DeviceIdentity, DeviceError> parseInfo(const std::string& body,
                                                                const std::string& fallbackIp);

private:
    std::shared_ptr<IHttpClient> httpClient_;
    std::chrono::milliseconds timeout_;
};

} // namespace STS

#include "STS/HttpDeviceInfoClient.hpp"
#include "STS/Helpers.h"
#include "STS/XmlDocument.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace STS {

namespace {

DeviceError toDeviceError(DiscoveryError e) {
    switch (e) {
        case DiscoveryError::Timeout: return DeviceError::Timeout;
        case DiscoveryError::HttpStatus: return DeviceError::HttpStatus;
        case DiscoveryError::MalformedXml: return DeviceError::MalformedResponse;
        default: return DeviceError::ConnectionFailed;
    }
}

} // namespace

HttpDeviceInfoClient::HttpDeviceInfoClient(std::shared_ptr<IHttpClient> httpClient,
                                           std::chrono::milliseconds timeout)
    : httpClient_(std::move(httpClient))
    , timeout_(timeout)
{
    if (!httpClient_) {
        throw std::invalid_argument("HttpDeviceInfoClient requires a valid IHttpClient.");
    }
}

std::expected<DeviceIdentity, DeviceError> HttpDeviceInfoClient::getInfo(const std::string& baseUrl) {
    std::string url = baseUrl;
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    url += "/info";

    spdlog::debug("HttpDeviceInfoClient: GET {}", url);
    auto response = httpClient_->get(url, timeout_);
    if (!response) {
        spdlog::debug("HttpDeviceInfoClient: {} failed: {}", url, make_error_code(response.error()).message());
        return std::unexpected(toDeviceError(response.error()));
    }
    return parseInfo(response->body, Helpers::hostFromUrl(baseUrl).value_or(""));
}

std::expected<DeviceIdentity, DeviceError> HttpDeviceInfoClient::parseInfo(const std::string& body,
                                                                           const std::string& fallbackIp) {
    auto document = XmlDocument::parse(body);
    if (!document) {
        return std::unexpected(DeviceError::MalformedResponse);
    }
    if (document->rootName() != "info") {
        spdlog::debug("HttpDeviceInfoClient: Unexpected root element <{}>", document->rootName());
        return std::unexpected(DeviceError::MalformedResponse);
    }

    auto deviceId = document->rootAttribute("deviceID");
    if (!deviceId) {
        return std::unexpected(DeviceError::MissingDeviceId);
    }

    DeviceIdentity identity;
    identity.deviceId = *deviceId;
    identity.name = document->findText("name");
    identity.type = document->findText("type");
    identity.firmwareVersion = document->findText("softwareVersion");
    identity.macAddress = document->findText("macAddress");
    identity.ipAddress = document->findText("ipAddress");
    if (!identity.ipAddress && !fallbackIp.empty()) {
        identity.ipAddress = fallbackIp;
    }
    identity.moduleType = document->findText("moduleType");
    identity.variant = document->findText("variant");
    identity.variantMode = document->findText("variantMode");
    return identity;
}

} // namespace STS

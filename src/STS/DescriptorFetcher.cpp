#include "STS/DescriptorFetcher.hpp"
#include "STS/Helpers.h"
#include "STS/XmlDocument.hpp"
#include <spdlog/spdlog.h>
#include <future>
#include <stdexcept>
#include <utility>
#include <vector>

namespace STS {

DescriptorFetcher::DescriptorFetcher(std::shared_ptr<IHttpClient> httpClient,
                                     std::string vendorFilter,
                                     std::chrono::milliseconds timeout)
    : httpClient_(std::move(httpClient))
    , vendorFilter_(std::move(vendorFilter))
    , timeout_(timeout)
{
    if (!httpClient_) {
        spdlog::critical("DescriptorFetcher: IHttpClient pointer is null.");
        throw std::invalid_argument("DescriptorFetcher requires a valid IHttpClient.");
    }
}

std::map<std::string, DeviceDescriptor> DescriptorFetcher::fetchAll(const std::set<std::string>& locations) const {
    std::map<std::string, DeviceDescriptor> devices;
    if (locations.empty()) {
        return devices;
    }

    std::vector<std::pair<std::string, std::future<std::expected<DeviceDescriptor, DiscoveryError>>>> pending;
    pending.reserve(locations.size());
    for (const auto& location : locations) {
        pending.emplace_back(location, std::async(std::launch::async, [this, location]() {
            return fetchOne(location);
        }));
    }

    for (auto& [location, future] : pending) {
        try {
            auto result = future.get();
            if (!result) {
                spdlog::debug("DescriptorFetcher: Skipping {}: {}", location,
                              make_error_code(result.error()).message());
                continue;
            }
            auto key = result->dedupKey;
            devices.insert_or_assign(std::move(key), std::move(*result));
        } catch (const std::exception& e) {
            spdlog::warn("DescriptorFetcher: Fetch of {} threw: {}", location, e.what());
        }
    }

    spdlog::info("DescriptorFetcher: {} of {} location(s) matched vendor '{}'",
                 devices.size(), locations.size(), vendorFilter_);
    return devices;
}

std::expected<DeviceDescriptor, DiscoveryError> DescriptorFetcher::fetchOne(const std::string& location) const {
    auto response = httpClient_->get(location, timeout_);
    if (!response) {
        return std::unexpected(response.error());
    }
    return parseDescriptor(location, response->body);
}

std::expected<DeviceDescriptor, DiscoveryError> DescriptorFetcher::parseDescriptor(const std::string& location,
                                                                                   const std::string& body) const {
    auto document = XmlDocument::parse(body);
    if (!document) {
        return std::unexpected(document.error());
    }

    auto manufacturer = document->findText("manufacturer");
    if (!manufacturer || !Helpers::containsIgnoreCase(*manufacturer, vendorFilter_)) {
        return std::unexpected(DiscoveryError::ManufacturerMismatch);
    }

    auto friendlyName = document->findText("friendlyName");
    auto modelName = document->findText("modelName");
    if (!friendlyName || !modelName) {
        spdlog::debug("DescriptorFetcher: {} from {} lacks friendlyName or modelName", *manufacturer, location);
        return std::unexpected(DiscoveryError::IncompleteDescriptor);
    }

    auto ip = Helpers::hostFromUrl(location);
    if (!ip) {
        return std::unexpected(DiscoveryError::InvalidLocation);
    }

    DeviceDescriptor descriptor;
    descriptor.location = location;
    descriptor.ip = *ip;
    descriptor.manufacturer = *manufacturer;
    descriptor.friendlyName = *friendlyName;
    descriptor.modelName = *modelName;
    if (auto serial = document->findText("serialNumber")) {
        descriptor.serialNumber = Helpers::toUpper(*serial);
        descriptor.dedupKey = *descriptor.serialNumber;
    } else {
        // No serial published: the IP stands in as the key. A device that
        // changes address between runs will appear under a new key.
        descriptor.dedupKey = descriptor.ip;
    }

    spdlog::info("DescriptorFetcher: Found {} device: {} ({}) at {}",
                 descriptor.manufacturer, descriptor.friendlyName, descriptor.modelName, descriptor.ip);
    return descriptor;
}

} // namespace STS

// include/STS/DescriptorFetcher.hpp
#pragma once

#include "STS/Error.h"
#include "STS/HttpClient.hpp"
#include <chrono>
#include <expected>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>

namespace STS {

constexpr const char* kDefaultVendorFilter = "bose";
constexpr std::chrono::milliseconds kDefaultDescriptorTimeout{5000};

/**
 * @brief Normalised identity parsed from a UPnP device description document
 */
struct DeviceDescriptor {
    std::string location;                       ///< URL the document was fetched from
    std::string ip;                             ///< Host part of location
    std::string manufacturer;
    std::string friendlyName;
    std::string modelName;
    std::optional<std::string> serialNumber;    ///< Uppercased, as published by the device
    std::string dedupKey;                       ///< serialNumber, or ip when the document has none
};

/**
 * @brief Fetches and validates description documents for SSDP locations
 *
 * Every location is fetched on its own thread; a failing location is skipped
 * and never affects the others.
 */
class DescriptorFetcher {
public:
    /**
     * @param httpClient Shared HTTP client, called concurrently
     * @param vendorFilter Case-insensitive substring the manufacturer must contain
     * @param timeout Per-request timeout
     */
    DescriptorFetcher(std::shared_ptr<IHttpClient> httpClient,
                      std::string vendorFilter = kDefaultVendorFilter,
                      std::chrono::milliseconds timeout = kDefaultDescriptorTimeout);
    ~DescriptorFetcher() = default;

    DescriptorFetcher(const DescriptorFetcher&) = delete;
    DescriptorFetcher& operator=(const DescriptorFetcher&) = delete;

    /**
     * @brief Fetch every location concurrently and keep the matching descriptors
     * @return Descriptors keyed by dedup key; a later location with the same key replaces an earlier one
     */
    std::map<std::string, DeviceDescriptor> fetchAll(const std::set<std::string>& locations) const;

    /// Fetch and parse a single location.
    std::expected<DeviceDescriptor, DiscoveryError> fetchOne(const std::string& location) const;

    /**
     * @brief Validate a description document already in memory
     *
     * Rejects (in order): bad XML, manufacturer missing or not matching the
     * vendor filter, missing friendlyName/modelName, location without a host.
     */
    std::expected<DeviceDescriptor, DiscoveryError> parseDescriptor(const std::string& location,
                                                                    const std::string& body) const;

    const std::string& vendorFilter() const { return vendorFilter_; }

private:
    std::shared_ptr<IHttpClient> httpClient_;
    std::string vendorFilter_;
    std::chrono::milliseconds timeout_;
};

} // namespace STS

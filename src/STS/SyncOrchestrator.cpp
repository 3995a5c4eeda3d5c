// src/STS/SyncOrchestrator.cpp

#include "STS/SyncOrchestrator.h"
#include <exception>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace STS {

nlohmann::json SyncResult::toJson() const {
    nlohmann::json j;
    j["discovered"] = discovered();
    j["synced"] = synced_;
    j["failed"] = failed_;
    return j;
}

SyncOrchestrator::SyncOrchestrator(std::unique_ptr<DiscoveryAggregator> aggregator,
                                   std::shared_ptr<IDeviceInfoClient> infoClient,
                                   std::shared_ptr<IDeviceStore> store,
                                   SyncOptions options) :
    aggregator_(std::move(aggregator)),
    infoClient_(std::move(infoClient)),
    store_(std::move(store)),
    options_(std::move(options)) {
    if (!aggregator_ || !infoClient_ || !store_) {
        throw std::invalid_argument("SyncOrchestrator requires an aggregator, info client and store.");
    }
}

std::expected<SyncResult, SyncError> SyncOrchestrator::sync() {
    std::unique_lock<std::mutex> lock(syncMutex_, std::try_to_lock);
    if (!lock.owns_lock()) {
        spdlog::warn("SyncOrchestrator: Sync already in progress, rejecting");
        return std::unexpected(SyncError::ConcurrentRun);
    }

    spdlog::info("SyncOrchestrator: Sync started (multicast: {}, manual IPs: {})",
                 options_.discoveryEnabled, options_.manualIps.size());

    auto devices = aggregator_->discover(options_.discoveryEnabled,
                                         options_.manualIps,
                                         options_.discoveryTimeout);

    int synced = 0;
    int failed = 0;
    for (const auto& device : devices) {
        if (syncDevice(device)) {
            ++synced;
        } else {
            ++failed;
        }
    }

    SyncResult result(synced, failed);
    spdlog::info("SyncOrchestrator: Sync complete: {} discovered, {} synced, {} failed",
                 result.discovered(), result.synced(), result.failed());
    return result;
}

bool SyncOrchestrator::syncDevice(const DiscoveredDevice& device) {
    try {
        auto identity = infoClient_->getInfo(device.baseUrl());
        if (!identity) {
            spdlog::error("SyncOrchestrator: Failed to query {}: {}",
                          device.ip, make_error_code(identity.error()).message());
            return false;
        }

        auto record = InventoryRecord::fromIdentity(*identity, device.ip);
        auto stored = store_->upsert(record);
        if (!stored) {
            spdlog::error("SyncOrchestrator: Failed to store {} ({}): {}",
                          identity->deviceId, device.ip, make_error_code(stored.error()).message());
            return false;
        }

        spdlog::info("SyncOrchestrator: Synced {} '{}' at {}", stored->deviceId, stored->name, stored->ip);
        return true;
    } catch (const std::exception& e) {
        spdlog::error("SyncOrchestrator: Device {} failed: {}", device.ip, e.what());
        return false;
    }
}

} // namespace STS

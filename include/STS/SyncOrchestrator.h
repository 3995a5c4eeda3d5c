// include/STS/SyncOrchestrator.h
#pragma once

#include <chrono>
#include <expected>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>
#include "STS/DeviceStore.hpp"
#include "STS/DiscoveryAggregator.hpp"
#include "STS/Error.h"
#include "STS/IDeviceInfoClient.h"

namespace STS {

/**
 * @brief Inputs for one sync run, already validated by the caller
 */
struct SyncOptions {
    bool discoveryEnabled = true;
    std::chrono::milliseconds discoveryTimeout = std::chrono::seconds(5);
    std::vector<std::string> manualIps;     ///< Deduplicated, valid IPv4 addresses
};

/**
 * @brief Outcome of one sync run
 *
 * Immutable. discovered() == synced() + failed() always holds.
 */
class SyncResult {
public:
    SyncResult(int synced, int failed)
        : synced_(synced), failed_(failed) {}

    int discovered() const { return synced_ + failed_; }
    int synced() const { return synced_; }
    int failed() const { return failed_; }

    nlohmann::json toJson() const;

private:
    int synced_;
    int failed_;
};

/**
 * @brief Discovers speakers and reconciles them into the inventory store
 *
 * One sync() may be in flight per instance. A second call made while one is
 * running fails immediately with SyncError::ConcurrentRun instead of
 * waiting. Devices are resolved and persisted one at a time; a failing
 * device is counted and skipped.
 */
class SyncOrchestrator {
public:
    /**
     * @brief Construct a new Sync Orchestrator
     * @param aggregator Discovery front end
     * @param infoClient Resolves each device's authoritative identity
     * @param store Inventory persistence
     * @param options Discovery inputs used by every run
     */
    SyncOrchestrator(std::unique_ptr<DiscoveryAggregator> aggregator,
                     std::shared_ptr<IDeviceInfoClient> infoClient,
                     std::shared_ptr<IDeviceStore> store,
                     SyncOptions options = {});

    /**
     * @brief Run discovery and persist every device that answers
     * @return Counts for the run, or ConcurrentRun if another run is in flight
     */
    std::expected<SyncResult, SyncError> sync();

    const SyncOptions& options() const { return options_; }

private:
    /// Resolve one device and upsert it. Returns true when the record was stored.
    bool syncDevice(const DiscoveredDevice& device);

    std::unique_ptr<DiscoveryAggregator> aggregator_;
    std::shared_ptr<IDeviceInfoClient> infoClient_;
    std::shared_ptr<IDeviceStore> store_;
    SyncOptions options_;
    std::mutex syncMutex_;                 ///< Held for the duration of a run
};

} // namespace STS

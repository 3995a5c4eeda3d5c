#include "STS/DeviceStore.hpp"
#include <algorithm>
#include <fstream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <system_error>

using json = nlohmann::json;

namespace STS {

// ---------------------------------------------------------------------------
// InMemoryDeviceStore
// ---------------------------------------------------------------------------

InventoryRecord InMemoryDeviceStore::applyUpsert(const InventoryRecord& record) {
    auto it = records_.find(record.deviceId);
    if (it == records_.end()) {
        InventoryRecord stored = record;
        stored.id = nextId_++;
        spdlog::debug("DeviceStore: Inserted {} (id {})", stored.deviceId, *stored.id);
        return records_.emplace(stored.deviceId, stored).first->second;
    }

    InventoryRecord& existing = it->second;
    std::string macAddress = existing.macAddress.empty() ? record.macAddress : existing.macAddress;
    auto id = existing.id;
    existing = record;
    existing.id = id;
    existing.macAddress = std::move(macAddress);
    spdlog::debug("DeviceStore: Updated {} (id {})", existing.deviceId, *existing.id);
    return existing;
}

std::expected<InventoryRecord, DeviceError> InMemoryDeviceStore::upsert(const InventoryRecord& record) {
    if (record.deviceId.empty()) {
        return std::unexpected(DeviceError::MissingDeviceId);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return applyUpsert(record);
}

std::vector<InventoryRecord> InMemoryDeviceStore::getAll() const {
    std::vector<InventoryRecord> all;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        all.reserve(records_.size());
        for (const auto& [deviceId, record] : records_) {
            all.push_back(record);
        }
    }
    std::stable_sort(all.begin(), all.end(), [](const InventoryRecord& a, const InventoryRecord& b) {
        return a.lastSeen > b.lastSeen;
    });
    return all;
}

std::optional<InventoryRecord> InMemoryDeviceStore::getByDeviceId(const std::string& deviceId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(deviceId);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::expected<std::size_t, DeviceError> InMemoryDeviceStore::deleteAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto count = records_.size();
    records_.clear();
    spdlog::info("DeviceStore: Deleted {} record(s)", count);
    return count;
}

// ---------------------------------------------------------------------------
// JsonFileDeviceStore
// ---------------------------------------------------------------------------

JsonFileDeviceStore::JsonFileDeviceStore(std::filesystem::path path)
    : path_(std::move(path))
{
}

std::expected<void, DeviceError> JsonFileDeviceStore::open() {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.clear();
    nextId_ = 1;

    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        spdlog::info("JsonFileDeviceStore: {} does not exist yet, starting empty", path_.string());
        return {};
    }

    std::ifstream in(path_);
    if (!in) {
        spdlog::error("JsonFileDeviceStore: Cannot read {}", path_.string());
        return std::unexpected(DeviceError::StorageFailed);
    }

    json document = json::parse(in, nullptr, false);
    if (document.is_discarded() || !document.is_object()) {
        spdlog::error("JsonFileDeviceStore: {} is not a valid store document", path_.string());
        return std::unexpected(DeviceError::StorageFailed);
    }

    auto devices = document.find("devices");
    if (devices == document.end() || !devices->is_array()) {
        spdlog::error("JsonFileDeviceStore: {} has no \"devices\" array", path_.string());
        return std::unexpected(DeviceError::StorageFailed);
    }

    std::int64_t maxId = 0;
    for (const auto& entry : *devices) {
        auto record = InventoryRecord::fromJson(entry);
        if (!record || !record->id) {
            spdlog::error("JsonFileDeviceStore: Corrupt record in {}", path_.string());
            records_.clear();
            return std::unexpected(DeviceError::StorageFailed);
        }
        maxId = std::max(maxId, *record->id);
        records_.insert_or_assign(record->deviceId, std::move(*record));
    }

    auto storedNext = document.value("nextId", std::int64_t{1});
    nextId_ = std::max(storedNext, maxId + 1);
    spdlog::info("JsonFileDeviceStore: Loaded {} record(s) from {}", records_.size(), path_.string());
    return {};
}

std::expected<void, DeviceError> JsonFileDeviceStore::persist() {
    json document;
    document["nextId"] = nextId_;
    json devices = json::array();
    for (const auto& [deviceId, record] : records_) {
        devices.push_back(record.toJson());
    }
    document["devices"] = std::move(devices);

    auto tmpPath = path_;
    tmpPath += ".tmp";
    {
        std::ofstream out(tmpPath, std::ios::trunc);
        if (!out) {
            spdlog::error("JsonFileDeviceStore: Cannot write {}", tmpPath.string());
            return std::unexpected(DeviceError::StorageFailed);
        }
        out << document.dump(2) << '\n';
        if (!out.flush()) {
            spdlog::error("JsonFileDeviceStore: Write to {} failed", tmpPath.string());
            return std::unexpected(DeviceError::StorageFailed);
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmpPath, path_, ec);
    if (ec) {
        spdlog::error("JsonFileDeviceStore: Rename to {} failed: {}", path_.string(), ec.message());
        std::filesystem::remove(tmpPath, ec);
        return std::unexpected(DeviceError::StorageFailed);
    }
    return {};
}

std::expected<InventoryRecord, DeviceError> JsonFileDeviceStore::upsert(const InventoryRecord& record) {
    if (record.deviceId.empty()) {
        return std::unexpected(DeviceError::MissingDeviceId);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto previous = records_;
    auto previousNextId = nextId_;
    auto stored = applyUpsert(record);
    if (auto written = persist(); !written) {
        // Keep memory and disk in agreement.
        records_ = std::move(previous);
        nextId_ = previousNextId;
        return std::unexpected(written.error());
    }
    return stored;
}

std::expected<std::size_t, DeviceError> JsonFileDeviceStore::deleteAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto previous = records_;
    auto count = records_.size();
    records_.clear();
    if (auto written = persist(); !written) {
        records_ = std::move(previous);
        return std::unexpected(written.error());
    }
    spdlog::info("JsonFileDeviceStore: Deleted {} record(s)", count);
    return count;
}

} // namespace STS

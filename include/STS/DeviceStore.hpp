#pragma once

#include "STS/Error.h"
#include "STS/InventoryRecord.hpp"
#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace STS {

/**
 * @brief Persistence boundary for inventory records
 *
 * One record per deviceId. upsert() on a known deviceId keeps the row id and
 * the first macAddress seen, and replaces every other field.
 */
class IDeviceStore {
public:
    virtual ~IDeviceStore() = default;

    /**
     * @brief Insert or update by deviceId
     * @return The stored record with its id assigned
     */
    virtual std::expected<InventoryRecord, DeviceError> upsert(const InventoryRecord& record) = 0;

    /// All records, most recently seen first.
    virtual std::vector<InventoryRecord> getAll() const = 0;

    virtual std::optional<InventoryRecord> getByDeviceId(const std::string& deviceId) const = 0;

    /// Remove every record; returns how many were removed.
    virtual std::expected<std::size_t, DeviceError> deleteAll() = 0;
};

/**
 * @brief Mutex-protected in-memory store
 */
class InMemoryDeviceStore : public IDeviceStore {
public:
    std::expected<InventoryRecord, DeviceError> upsert(const InventoryRecord& record) override;
    std::vector<InventoryRecord> getAll() const override;
    std::optional<InventoryRecord> getByDeviceId(const std::string& deviceId) const override;
    std::expected<std::size_t, DeviceError> deleteAll() override;

protected:
    /// Apply an upsert to the map. Caller holds mutex_.
    InventoryRecord applyUpsert(const InventoryRecord& record);

    mutable std::mutex mutex_;
    std::map<std::string, InventoryRecord> records_;
    std::int64_t nextId_ = 1;
};

/**
 * @brief In-memory store persisted to a JSON document
 *
 * Layout: {"nextId": n, "devices": [...]}. Every mutation rewrites the whole
 * document through a temporary file renamed over the target, so a crash
 * leaves either the old or the new content.
 */
class JsonFileDeviceStore : public InMemoryDeviceStore {
public:
    explicit JsonFileDeviceStore(std::filesystem::path path);

    /**
     * @brief Load the document if it exists
     * @return StorageFailed for an unreadable or corrupt file; a missing file is an empty store
     */
    std::expected<void, DeviceError> open();

    std::expected<InventoryRecord, DeviceError> upsert(const InventoryRecord& record) override;
    std::expected<std::size_t, DeviceError> deleteAll() override;

    const std::filesystem::path& path() const { return path_; }

private:
    /// Write the current state to disk. Caller holds mutex_.
    std::expected<void, DeviceError> persist();

    std::filesystem::path path_;
};

} // namespace STS

#include "STS/InventoryRecord.hpp"
#include "STS/Helpers.h"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <sstream>

using json = nlohmann::json;

namespace STS {

InventoryRecord InventoryRecord::fromIdentity(const DeviceIdentity& identity,
                                              const std::string& discoveredIp,
                                              std::chrono::system_clock::time_point seenAt) {
    InventoryRecord record;
    record.deviceId = identity.deviceId;
    // The address we actually reached wins over what the device reports about itself.
    record.ip = !discoveredIp.empty() ? discoveredIp : identity.ipAddress.value_or("");
    record.name = identity.name.value_or("");
    record.model = identity.type.value_or("");
    record.macAddress = identity.macAddress.value_or("");
    record.firmwareVersion = identity.firmwareVersion.value_or("");
    record.schemaVersion = schemaVersionFor(record.firmwareVersion);
    record.lastSeen = seenAt;
    return record;
}

std::string InventoryRecord::schemaVersionFor(const std::string& firmwareVersion) {
    std::istringstream stream(firmwareVersion);
    std::string token;
    if (!(stream >> token)) {
        return "unknown";
    }

    std::string result;
    int components = 0;
    std::size_t start = 0;
    while (start <= token.size() && components < 3) {
        auto dot = token.find('.', start);
        auto part = token.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
        if (components > 0) {
            result += '.';
        }
        result += part;
        ++components;
        if (dot == std::string::npos) {
            break;
        }
        start = dot + 1;
    }
    return result;
}

json InventoryRecord::toJson() const {
    json j;
    j["id"] = id ? json(*id) : json(nullptr);
    j["deviceId"] = deviceId;
    j["ip"] = ip;
    j["name"] = name;
    j["model"] = model;
    j["macAddress"] = macAddress;
    j["firmwareVersion"] = firmwareVersion;
    j["schemaVersion"] = schemaVersion;
    j["lastSeen"] = Helpers::formatIso8601(lastSeen);
    return j;
}

std::expected<InventoryRecord, DeviceError> InventoryRecord::fromJson(const json& j) {
    if (!j.is_object()) {
        return std::unexpected(DeviceError::MalformedResponse);
    }
    try {
        InventoryRecord record;
        if (j.contains("id") && !j.at("id").is_null()) {
            record.id = j.at("id").get<std::int64_t>();
        }
        record.deviceId = j.at("deviceId").get<std::string>();
        if (record.deviceId.empty()) {
            return std::unexpected(DeviceError::MissingDeviceId);
        }
        record.ip = j.value("ip", "");
        record.name = j.value("name", "");
        record.model = j.value("model", "");
        record.macAddress = j.value("macAddress", "");
        record.firmwareVersion = j.value("firmwareVersion", "");
        record.schemaVersion = j.value("schemaVersion", schemaVersionFor(record.firmwareVersion));

        auto lastSeen = Helpers::parseIso8601(j.value("lastSeen", ""));
        if (!lastSeen) {
            spdlog::warn("InventoryRecord: Record {} has no valid lastSeen", record.deviceId);
            return std::unexpected(DeviceError::MalformedResponse);
        }
        record.lastSeen = *lastSeen;
        return record;
    } catch (const json::exception& e) {
        spdlog::warn("InventoryRecord: Invalid record JSON: {}", e.what());
        return std::unexpected(DeviceError::MalformedResponse);
    }
}

} // namespace STS

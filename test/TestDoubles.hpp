// test/TestDoubles.hpp
#pragma once

#include <gmock/gmock.h>
#include <deque>
#include <mutex>
#include "STS/DeviceStore.hpp"
#include "STS/HttpClient.hpp"
#include "STS/IDeviceDiscovery.h"
#include "STS/IDeviceInfoClient.h"
#include "STS/MulticastSocket.hpp"

namespace STS::test {

class MockHttpClient : public IHttpClient {
public:
    MOCK_METHOD((std::expected<HttpResponse, DiscoveryError>), get,
                (const std::string& url, std::chrono::milliseconds timeout), (override));
};

class MockInfoClient : public IDeviceInfoClient {
public:
    MOCK_METHOD((std::expected<DeviceIdentity, DeviceError>), getInfo, (const std::string& baseUrl), (override));
};

class MockDiscoverySource : public IDeviceDiscovery {
public:
    MOCK_METHOD((std::expected<std::vector<DiscoveredDevice>, DiscoveryError>), discover,
                (std::chrono::milliseconds timeout), (override));
    MOCK_METHOD(std::string, name, (), (const, override));
};

class MockDeviceStore : public IDeviceStore {
public:
    MOCK_METHOD((std::expected<InventoryRecord, DeviceError>), upsert, (const InventoryRecord& record), (override));
    MOCK_METHOD(std::vector<InventoryRecord>, getAll, (), (const, override));
    MOCK_METHOD(std::optional<InventoryRecord>, getByDeviceId, (const std::string& deviceId), (const, override));
    MOCK_METHOD((std::expected<std::size_t, DeviceError>), deleteAll, (), (override));
};

/**
 * Socket that replays a fixed script of receive() results. Once the script
 * runs out it reports ReceiveFailed so the probe loop ends without waiting
 * for its deadline.
 */
class ScriptedSocket : public IMulticastSocket {
public:
    struct State {
        std::mutex mutex;
        bool opened = false;
        bool closed = false;
        std::vector<std::string> sent;
        std::string sentGroup;
        std::uint16_t sentPort = 0;
    };

    using ReceiveResult = std::expected<std::optional<std::string>, DiscoveryError>;

    ScriptedSocket(std::shared_ptr<State> state,
                   std::deque<ReceiveResult> script,
                   bool failOpen = false,
                   bool failSend = false)
        : state_(std::move(state)), script_(std::move(script)), failOpen_(failOpen), failSend_(failSend) {}

    std::expected<void, DiscoveryError> open() override {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (failOpen_) {
            return std::unexpected(DiscoveryError::SocketError);
        }
        state_->opened = true;
        return {};
    }

    std::expected<void, DiscoveryError> sendTo(const std::string& payload,
                                               const std::string& groupAddress,
                                               std::uint16_t port) override {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (failSend_) {
            return std::unexpected(DiscoveryError::SendFailed);
        }
        state_->sent.push_back(payload);
        state_->sentGroup = groupAddress;
        state_->sentPort = port;
        return {};
    }

    ReceiveResult receive(std::chrono::milliseconds) override {
        if (script_.empty()) {
            return std::unexpected(DiscoveryError::ReceiveFailed);
        }
        auto next = std::move(script_.front());
        script_.pop_front();
        return next;
    }

    void close() override {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->closed = true;
    }

private:
    std::shared_ptr<State> state_;
    std::deque<ReceiveResult> script_;
    bool failOpen_;
    bool failSend_;
};

inline DeviceIdentity makeIdentity(const std::string& deviceId, const std::string& name,
                                   const std::string& type = "SoundTouch 20",
                                   const std::string& firmware = "28.0.3.46454 epdbuild.trunk.hepdswbld04.2022-08-04T11:20:29") {
    DeviceIdentity identity;
    identity.deviceId = deviceId;
    identity.name = name;
    identity.type = type;
    identity.macAddress = deviceId;
    identity.firmwareVersion = firmware;
    return identity;
}

} // namespace STS::test

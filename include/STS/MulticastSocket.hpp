#pragma once

#include "STS/Error.h"
#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace STS {

/**
 * @brief Minimal UDP socket contract used by MulticastProbe
 *
 * Exists so the probe's request/collect loop can be driven by a scripted
 * socket in tests.
 */
class IMulticastSocket {
public:
    virtual ~IMulticastSocket() = default;

    virtual std::expected<void, DiscoveryError> open() = 0;

    virtual std::expected<void, DiscoveryError> sendTo(const std::string& payload,
                                                       const std::string& groupAddress,
                                                       std::uint16_t port) = 0;

    /**
     * @brief Wait up to maxWait for one datagram
     * @return The datagram bytes, std::nullopt if nothing arrived in time, or an error
     */
    virtual std::expected<std::optional<std::string>, DiscoveryError> receive(std::chrono::milliseconds maxWait) = 0;

    virtual void close() = 0;
};

/**
 * @brief POSIX UDP socket for SSDP M-SEARCH
 *
 * Enables SO_REUSEADDR and never binds a well-known port: the kernel picks an
 * ephemeral port on the first send, so port 1900 stays free for whatever
 * system service already owns it. The descriptor is closed on destruction.
 */
class UdpMulticastSocket : public IMulticastSocket {
public:
    UdpMulticastSocket() = default;
    ~UdpMulticastSocket() override;

    UdpMulticastSocket(const UdpMulticastSocket&) = delete;
    UdpMulticastSocket& operator=(const UdpMulticastSocket&) = delete;

    std::expected<void, DiscoveryError> open() override;
    std::expected<void, DiscoveryError> sendTo(const std::string& payload,
                                               const std::string& groupAddress,
                                               std::uint16_t port) override;
    std::expected<std::optional<std::string>, DiscoveryError> receive(std::chrono::milliseconds maxWait) override;
    void close() override;

private:
    int fd_ = -1;
};

using MulticastSocketFactory = std::function<std::unique_ptr<IMulticastSocket>()>;

} // namespace STS

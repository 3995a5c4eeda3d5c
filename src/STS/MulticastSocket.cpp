#include "STS/MulticastSocket.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace STS {

namespace {
constexpr size_t kMaxDatagramSize = 8192;
constexpr unsigned char kMulticastTtl = 4;
}

UdpMulticastSocket::~UdpMulticastSocket() {
    close();
}

std::expected<void, DiscoveryError> UdpMulticastSocket::open() {
    if (fd_ != -1) {
        return {};
    }
    fd_ = ::socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
    if (fd_ < 0) {
        spdlog::error("UdpMulticastSocket: socket() failed: {}", std::strerror(errno));
        fd_ = -1;
        return std::unexpected(DiscoveryError::SocketError);
    }

    int reuse = 1;
    if (::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) < 0) {
        spdlog::error("UdpMulticastSocket: Setting SO_REUSEADDR failed: {}", std::strerror(errno));
        close();
        return std::unexpected(DiscoveryError::SocketError);
    }

    unsigned char ttl = kMulticastTtl;
    if (::setsockopt(fd_, IPPROTO_IP, IP_MULTICAST_TTL, &ttl, sizeof(ttl)) < 0) {
        // Default TTL of 1 still reaches the local segment.
        spdlog::warn("UdpMulticastSocket: Setting IP_MULTICAST_TTL failed: {}", std::strerror(errno));
    }
    return {};
}

std::expected<void, DiscoveryError> UdpMulticastSocket::sendTo(const std::string& payload,
                                                               const std::string& groupAddress,
                                                               std::uint16_t port) {
    if (fd_ < 0) {
        return std::unexpected(DiscoveryError::SocketError);
    }
    sockaddr_in dest{};
    dest.sin_family = AF_INET;
    dest.sin_port = htons(port);
    if (::inet_pton(AF_INET, groupAddress.c_str(), &dest.sin_addr) != 1) {
        spdlog::error("UdpMulticastSocket: Invalid group address '{}'", groupAddress);
        return std::unexpected(DiscoveryError::SendFailed);
    }

    ssize_t sent = ::sendto(fd_, payload.data(), payload.size(), 0,
                            reinterpret_cast<const sockaddr*>(&dest), sizeof(dest));
    if (sent < 0 || static_cast<size_t>(sent) != payload.size()) {
        spdlog::error("UdpMulticastSocket: sendto {}:{} failed: {}", groupAddress, port, std::strerror(errno));
        return std::unexpected(DiscoveryError::SendFailed);
    }
    return {};
}

std::expected<std::optional<std::string>, DiscoveryError> UdpMulticastSocket::receive(std::chrono::milliseconds maxWait) {
    if (fd_ < 0) {
        return std::unexpected(DiscoveryError::SocketError);
    }
    pollfd pfd{};
    pfd.fd = fd_;
    pfd.events = POLLIN;

    int timeoutMs = static_cast<int>(std::max<std::chrono::milliseconds::rep>(0, maxWait.count()));
    int ret = ::poll(&pfd, 1, timeoutMs);
    if (ret == 0) {
        return std::optional<std::string>{};
    }
    if (ret < 0) {
        if (errno == EINTR) {
            return std::optional<std::string>{};
        }
        spdlog::debug("UdpMulticastSocket: poll failed: {}", std::strerror(errno));
        return std::unexpected(DiscoveryError::ReceiveFailed);
    }

    std::string buffer(kMaxDatagramSize, '\0');
    sockaddr_in from{};
    socklen_t fromLen = sizeof(from);
    ssize_t got = ::recvfrom(fd_, buffer.data(), buffer.size(), 0,
                             reinterpret_cast<sockaddr*>(&from), &fromLen);
    if (got < 0) {
        spdlog::debug("UdpMulticastSocket: recvfrom failed: {}", std::strerror(errno));
        return std::unexpected(DiscoveryError::ReceiveFailed);
    }
    buffer.resize(static_cast<size_t>(got));

    char fromAddr[INET_ADDRSTRLEN] = {};
    ::inet_ntop(AF_INET, &from.sin_addr, fromAddr, sizeof(fromAddr));
    spdlog::trace("UdpMulticastSocket: {} bytes from {}", got, fromAddr);
    return std::optional<std::string>{std::move(buffer)};
}

void UdpMulticastSocket::close() {
    if (fd_ != -1) {
        ::close(fd_);
        fd_ = -1;
    }
}

} // namespace STS

// include/STS/MulticastProbe.hpp
#pragma once

#include "STS/MulticastSocket.hpp"
#include <chrono>
#include <cstdint>
#include <future>
#include <optional>
#include <set>
#include <string>
#include <string_view>

namespace STS {

constexpr const char* kSsdpMulticastAddress = "239.255.255.250";
constexpr std::uint16_t kSsdpPort = 1900;
constexpr const char* kSsdpSearchAll = "ssdp:all";
/// Upper bound on the MX delay we ask responders to honour.
constexpr int kMaxMxSeconds = 3;

/**
 * @brief Sends one SSDP M-SEARCH and collects LOCATION headers
 *
 * Stateless between calls: every probe opens, uses and releases its own
 * socket. Network failures never escape; the caller gets whatever locations
 * were collected before the failure, possibly none.
 */
class MulticastProbe {
public:
    /**
     * @brief Construct a probe
     * @param socketFactory Creates the socket for each probe. Defaults to UdpMulticastSocket.
     */
    explicit MulticastProbe(MulticastSocketFactory socketFactory = {});
    ~MulticastProbe() = default;

    /**
     * @brief Send M-SEARCH and collect responses for one fixed window
     *
     * The window is a single deadline measured from the send, not reset per
     * packet. It is never shorter than the MX value put in the request.
     * @param searchTarget Value of the ST header
     * @param responseWindow How long to collect responses
     * @return Distinct LOCATION URLs, empty on any socket failure before the first response
     */
    std::set<std::string> probe(const std::string& searchTarget,
                                std::chrono::milliseconds responseWindow) const;

    /**
     * @brief Run probe() on a dedicated worker thread
     *
     * The future becomes ready only after the response window has elapsed or
     * the socket failed.
     */
    std::future<std::set<std::string>> probeAsync(std::string searchTarget,
                                                  std::chrono::milliseconds responseWindow) const;

    /// MX value used for a given response window: whole seconds, clamped to [1, kMaxMxSeconds].
    static int mxSecondsFor(std::chrono::milliseconds responseWindow);

    static std::string buildSearchRequest(std::string_view searchTarget, int mxSeconds);

    /**
     * @brief Extract the LOCATION header value from a raw SSDP response
     *
     * Header names match case-insensitively; the value is the trimmed text
     * after the first colon. Undecodable bytes are dropped, never fatal.
     */
    static std::optional<std::string> parseLocation(std::string_view datagram);

private:
    MulticastSocketFactory socketFactory_;
};

} // namespace STS

#include "STS/MulticastProbe.hpp"
#include "STS/Helpers.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <sstream>

namespace STS {

MulticastProbe::MulticastProbe(MulticastSocketFactory socketFactory)
    : socketFactory_(std::move(socketFactory))
{
    if (!socketFactory_) {
        socketFactory_ = [] { return std::make_unique<UdpMulticastSocket>(); };
    }
}

int MulticastProbe::mxSecondsFor(std::chrono::milliseconds responseWindow) {
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(responseWindow).count();
    return static_cast<int>(std::clamp<std::chrono::seconds::rep>(seconds, 1, kMaxMxSeconds));
}

std::string MulticastProbe::buildSearchRequest(std::string_view searchTarget, int mxSeconds) {
    std::ostringstream msg;
    msg << "M-SEARCH * HTTP/1.1\r\n"
        << "HOST: " << kSsdpMulticastAddress << ":" << kSsdpPort << "\r\n"
        << "MAN: \"ssdp:discover\"\r\n"
        << "MX: " << mxSeconds << "\r\n"
        << "ST: " << searchTarget << "\r\n"
        << "\r\n";
    return msg.str();
}

std::optional<std::string> MulticastProbe::parseLocation(std::string_view datagram) {
    const std::string text = Helpers::decodeLenient(datagram);
    std::string_view view(text);
    size_t pos = 0;
    while (pos < view.size()) {
        auto eol = view.find('\n', pos);
        std::string_view line = view.substr(pos, eol == std::string_view::npos ? std::string_view::npos : eol - pos);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        if (Helpers::startsWithIgnoreCase(line, "location:")) {
            auto value = Helpers::trim(line.substr(line.find(':') + 1));
            if (value.empty()) {
                return std::nullopt;
            }
            return value;
        }
        if (eol == std::string_view::npos) {
            break;
        }
        pos = eol + 1;
    }
    return std::nullopt;
}

std::set<std::string> MulticastProbe::probe(const std::string& searchTarget,
                                            std::chrono::milliseconds responseWindow) const {
    std::set<std::string> locations;

    const int mx = mxSecondsFor(responseWindow);
    const auto window = std::max<std::chrono::milliseconds>(responseWindow, std::chrono::seconds(mx));

    auto socket = socketFactory_();
    if (!socket) {
        spdlog::error("MulticastProbe: Socket factory returned no socket");
        return locations;
    }

    if (auto opened = socket->open(); !opened) {
        spdlog::error("MulticastProbe: Failed to open socket: {}", make_error_code(opened.error()).message());
        socket->close();
        return locations;
    }

    const std::string request = buildSearchRequest(searchTarget, mx);
    if (auto sent = socket->sendTo(request, kSsdpMulticastAddress, kSsdpPort); !sent) {
        spdlog::error("MulticastProbe: M-SEARCH send failed: {}", make_error_code(sent.error()).message());
        socket->close();
        return locations;
    }
    spdlog::debug("MulticastProbe: Sent M-SEARCH (ST={}, MX={}), collecting for {} ms",
                  searchTarget, mx, window.count());

    const auto deadline = std::chrono::steady_clock::now() + window;
    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            break;
        }
        auto received = socket->receive(remaining);
        if (!received) {
            spdlog::debug("MulticastProbe: Receive failed, keeping {} location(s): {}",
                          locations.size(), make_error_code(received.error()).message());
            break;
        }
        if (!received->has_value()) {
            continue; // woke up without data; the deadline check decides
        }
        if (auto location = parseLocation(received->value())) {
            if (locations.insert(*location).second) {
                spdlog::debug("MulticastProbe: Found SSDP device at {}", *location);
            }
        }
    }

    socket->close();
    spdlog::info("MulticastProbe: M-SEARCH found {} location(s)", locations.size());
    return locations;
}

std::future<std::set<std::string>> MulticastProbe::probeAsync(std::string searchTarget,
                                                              std::chrono::milliseconds responseWindow) const {
    return std::async(std::launch::async,
                      [this, target = std::move(searchTarget), responseWindow]() {
                          return probe(target, responseWindow);
                      });
}

} // namespace STS

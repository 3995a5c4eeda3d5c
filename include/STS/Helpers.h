// include/STS/Helpers.h
#ifndef STS_HELPERS_H
#define STS_HELPERS_H

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace STS {

class Helpers {
public:
    static std::string trim(std::string_view s);
    static std::string toUpper(std::string_view s);
    static std::string toLower(std::string_view s);
    static bool containsIgnoreCase(std::string_view haystack, std::string_view needle);
    static bool startsWithIgnoreCase(std::string_view s, std::string_view prefix);

    /**
     * @brief Extract the host part of an absolute URL
     *
     * Handles "scheme://[user@]host[:port][/path]" and bracketed IPv6 hosts
     * ("http://[fe80::1]:8090/"). The brackets are stripped.
     * @return Host, or std::nullopt if the URL has no scheme separator or an empty host
     */
    static std::optional<std::string> hostFromUrl(std::string_view url);

    static bool isValidIpv4(std::string_view s);

    /**
     * @brief Decode a datagram as UTF-8 text, dropping invalid byte sequences
     * @param bytes Raw bytes as received from the socket
     * @return The input with every ill-formed sequence removed; never throws
     */
    static std::string decodeLenient(std::string_view bytes);

    /// Split on commas, trimming entries and dropping empty ones.
    static std::vector<std::string> splitCommaList(std::string_view s);

    static std::string formatIso8601(std::chrono::system_clock::time_point tp);
    static std::optional<std::chrono::system_clock::time_point> parseIso8601(std::string_view s);
};

} // namespace STS

#endif // STS_HELPERS_H

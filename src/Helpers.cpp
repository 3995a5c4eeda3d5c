// src/Helpers.cpp
#include "STS/Helpers.h"
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <arpa/inet.h>

namespace STS {

    std::string Helpers::trim(std::string_view s) {
        auto isSpace = [](unsigned char c) { return std::isspace(c) != 0; };
        size_t begin = 0;
        size_t end = s.size();
        while (begin < end && isSpace(static_cast<unsigned char>(s[begin]))) ++begin;
        while (end > begin && isSpace(static_cast<unsigned char>(s[end - 1]))) --end;
        return std::string(s.substr(begin, end - begin));
    }

    std::string Helpers::toUpper(std::string_view s) {
        std::string out(s);
        std::transform(out.begin(), out.end(), out.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return out;
    }

    std::string Helpers::toLower(std::string_view s) {
        std::string out(s);
        std::transform(out.begin(), out.end(), out.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return out;
    }

    bool Helpers::containsIgnoreCase(std::string_view haystack, std::string_view needle) {
        if (needle.empty()) {
            return true;
        }
        return toLower(haystack).find(toLower(needle)) != std::string::npos;
    }

    bool Helpers::startsWithIgnoreCase(std::string_view s, std::string_view prefix) {
        if (s.size() < prefix.size()) {
            return false;
        }
        return toLower(s.substr(0, prefix.size())) == toLower(prefix);
    }

    std::optional<std::string> Helpers::hostFromUrl(std::string_view url) {
        auto schemeEnd = url.find("://");
        if (schemeEnd == std::string_view::npos || schemeEnd == 0) {
            return std::nullopt;
        }
        std::string_view rest = url.substr(schemeEnd + 3);

        // Authority ends at the first '/', '?' or '#'
        auto authorityEnd = rest.find_first_of("/?#");
        std::string_view authority = rest.substr(0, authorityEnd);

        auto at = authority.rfind('@');
        if (at != std::string_view::npos) {
            authority = authority.substr(at + 1);
        }

        std::string_view host;
        if (!authority.empty() && authority.front() == '[') {
            auto close = authority.find(']');
            if (close == std::string_view::npos) {
                return std::nullopt;
            }
            host = authority.substr(1, close - 1);
        } else {
            host = authority.substr(0, authority.find(':'));
        }

        std::string trimmed = trim(host);
        if (trimmed.empty()) {
            return std::nullopt;
        }
        return trimmed;
    }

    bool Helpers::isValidIpv4(std::string_view s) {
        std::string candidate(s);
        in_addr addr{};
        return inet_pton(AF_INET, candidate.c_str(), &addr) == 1;
    }

    std::string Helpers::decodeLenient(std::string_view bytes) {
        std::string out;
        out.reserve(bytes.size());
        size_t i = 0;
        const size_t n = bytes.size();
        while (i < n) {
            const auto lead = static_cast<uint8_t>(bytes[i]);
            size_t len = 0;
            uint32_t minCodePoint = 0;
            if (lead < 0x80) {
                out.push_back(static_cast<char>(lead));
                ++i;
                continue;
            } else if ((lead & 0xE0) == 0xC0) {
                len = 2; minCodePoint = 0x80;
            } else if ((lead & 0xF0) == 0xE0) {
                len = 3; minCodePoint = 0x800;
            } else if ((lead & 0xF8) == 0xF0) {
                len = 4; minCodePoint = 0x10000;
            } else {
                ++i; // stray continuation or invalid lead byte
                continue;
            }
            if (i + len > n) {
                ++i;
                continue;
            }
            uint32_t cp = lead & (0xFF >> (len + 1));
            bool valid = true;
            for (size_t k = 1; k < len; ++k) {
                const auto cont = static_cast<uint8_t>(bytes[i + k]);
                if ((cont & 0xC0) != 0x80) {
                    valid = false;
                    break;
                }
                cp = (cp << 6) | (cont & 0x3F);
            }
            if (!valid || cp < minCodePoint || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
                ++i;
                continue;
            }
            out.append(bytes.substr(i, len));
            i += len;
        }
        return out;
    }

    std::vector<std::string> Helpers::splitCommaList(std::string_view s) {
        std::vector<std::string> out;
        size_t start = 0;
        while (start <= s.size()) {
            auto comma = s.find(',', start);
            auto piece = trim(s.substr(start, comma == std::string_view::npos ? std::string_view::npos : comma - start));
            if (!piece.empty()) {
                out.push_back(std::move(piece));
            }
            if (comma == std::string_view::npos) {
                break;
            }
            start = comma + 1;
        }
        return out;
    }

    std::string Helpers::formatIso8601(std::chrono::system_clock::time_point tp) {
        std::time_t t = std::chrono::system_clock::to_time_t(tp);
        std::tm tm{};
        gmtime_r(&t, &tm);
        char buf[32];
        std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
        return buf;
    }

    std::optional<std::chrono::system_clock::time_point> Helpers::parseIso8601(std::string_view s) {
        std::string text(s);
        std::tm tm{};
        int consumed = 0;
        if (std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
                        &tm.tm_year, &tm.tm_mon, &tm.tm_mday,
                        &tm.tm_hour, &tm.tm_min, &tm.tm_sec, &consumed) != 6) {
            return std::nullopt;
        }
        tm.tm_year -= 1900;
        tm.tm_mon -= 1;
        std::time_t t = timegm(&tm);
        if (t == static_cast<std::time_t>(-1)) {
            return std::nullopt;
        }
        return std::chrono::system_clock::from_time_t(t);
    }

} // namespace STS

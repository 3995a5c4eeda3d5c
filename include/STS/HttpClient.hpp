#pragma once

#include "STS/Error.h"
#include <chrono>
#include <expected>
#include <string>

namespace STS {

struct HttpResponse {
    long status = 0;
    std::string body;
};

/**
 * @brief Blocking HTTP GET used for description documents and device queries
 *
 * Implementations must allow concurrent calls from several threads.
 */
class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    /**
     * @brief GET a URL
     * @return The response for 2xx statuses; HttpStatus for anything else,
     *         Timeout or ConnectionFailed for transport failures
     */
    virtual std::expected<HttpResponse, DiscoveryError> get(const std::string& url,
                                                            std::chrono::milliseconds timeout) = 0;
};

/**
 * @brief libcurl implementation, one easy handle per request
 */
class CurlHttpClient : public IHttpClient {
public:
    CurlHttpClient();
    ~CurlHttpClient() override = default;

    std::expected<HttpResponse, DiscoveryError> get(const std::string& url,
                                                    std::chrono::milliseconds timeout) override;

    /// Response bodies larger than this are treated as a transfer failure.
    static constexpr size_t kMaxBodyBytes = 1024 * 1024;
};

} // namespace STS

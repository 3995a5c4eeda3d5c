#include "STS/HttpClient.hpp"
#include <spdlog/spdlog.h>
#include <curl/curl.h>
#include <memory>
#include <mutex>

namespace STS {

namespace {

std::once_flag g_curlInitFlag;

void ensureCurlGlobalInit() {
    std::call_once(g_curlInitFlag, [] {
        CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (rc != CURLE_OK) {
            spdlog::critical("CurlHttpClient: curl_global_init failed: {}", curl_easy_strerror(rc));
        }
    });
}

struct CurlEasyDeleter {
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    const size_t bytes = size * nmemb;
    if (body->size() + bytes > CurlHttpClient::kMaxBodyBytes) {
        return 0; // aborts the transfer with CURLE_WRITE_ERROR
    }
    body->append(ptr, bytes);
    return bytes;
}

DiscoveryError mapCurlError(CURLcode rc) {
    switch (rc) {
        case CURLE_OPERATION_TIMEDOUT:
            return DiscoveryError::Timeout;
        default:
            return DiscoveryError::ConnectionFailed;
    }
}

} // namespace

CurlHttpClient::CurlHttpClient() {
    ensureCurlGlobalInit();
}

std::expected<HttpResponse, DiscoveryError> CurlHttpClient::get(const std::string& url,
                                                                std::chrono::milliseconds timeout) {
    std::unique_ptr<CURL, CurlEasyDeleter> curl(curl_easy_init());
    if (!curl) {
        spdlog::error("CurlHttpClient: curl_easy_init failed");
        return std::unexpected(DiscoveryError::ConnectionFailed);
    }

    HttpResponse response;
    char errorBuffer[CURL_ERROR_SIZE] = {};

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, 3L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L); // required for timeouts in multi-threaded use
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, errorBuffer);

    CURLcode rc = curl_easy_perform(curl.get());
    if (rc != CURLE_OK) {
        spdlog::debug("CurlHttpClient: GET {} failed: {}", url,
                      errorBuffer[0] != '\0' ? errorBuffer : curl_easy_strerror(rc));
        return std::unexpected(mapCurlError(rc));
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    if (response.status < 200 || response.status >= 300) {
        spdlog::debug("CurlHttpClient: GET {} returned HTTP {}", url, response.status);
        return std::unexpected(DiscoveryError::HttpStatus);
    }
    return response;
}

} // namespace STS

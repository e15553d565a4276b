// Courier - HTTP Client
// Streaming HTTP downloads using cpr

#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>

namespace courier::utils {

/**
 * @brief HTTP response structure
 */
struct HttpResponse {
    int statusCode{0};
    std::map<std::string, std::string> headers;   // keys lower-cased
    std::string error;                             // transport error, empty if none
    bool aborted{false};                           // progress callback asked to stop
    double downloadTime{0.0};

    bool isSuccess() const {
        return error.empty() && !aborted && statusCode >= 200 && statusCode < 300;
    }

    bool isTooManyRequests() const { return statusCode == 429; }
    bool isServiceUnavailable() const { return statusCode == 503; }
    bool isClientError() const { return statusCode >= 400 && statusCode < 500; }
    bool isServerError() const { return statusCode >= 500; }

    /**
     * Header value by case-insensitive name, empty if absent
     */
    std::string header(const std::string& name) const;
};

/**
 * @brief HTTP request options
 */
struct HttpOptions {
    std::map<std::string, std::string> headers;
    int timeoutSeconds{0};          // 0 = no overall limit
    int connectTimeoutSeconds{10};
    bool verifySSL{true};
    std::string userAgent{"Courier/1.0"};

    // Progress callback; returning false aborts the transfer
    std::function<bool(std::int64_t downloaded, std::int64_t total)> progressCallback;
};

/**
 * @brief HTTP client for file downloads
 */
class HttpClient {
public:
    HttpClient() = default;

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    static HttpClient& instance();

    void setDefaultOptions(const HttpOptions& options);
    HttpOptions defaultOptions() const;

    /**
     * Stream url into destination. The file is truncated first. The caller
     * decides what to do with the file when the response is not a success.
     */
    HttpResponse downloadFile(const std::string& url, const std::string& destination,
                              const HttpOptions& options);

    /**
     * Last path segment of a URL without query or fragment, empty if none
     */
    static std::string fileNameFromUrl(const std::string& url);

private:
    mutable std::mutex m_mutex;
    HttpOptions m_defaultOptions;
};

} // namespace courier::utils

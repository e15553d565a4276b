/**
 * HttpClient.cpp
 *
 * HTTP client implementation using cpr (which wraps libcurl).
 */

#include "HttpClient.hpp"
#include "StringUtils.hpp"

#include <cpr/cpr.h>
#include <fstream>

namespace courier::utils {

std::string HttpResponse::header(const std::string& name) const {
    auto it = headers.find(StringUtils::toLower(name));
    return it != headers.end() ? it->second : std::string{};
}

HttpClient& HttpClient::instance() {
    static HttpClient inst;
    return inst;
}

void HttpClient::setDefaultOptions(const HttpOptions& options) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_defaultOptions = options;
}

HttpOptions HttpClient::defaultOptions() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_defaultOptions;
}

HttpResponse HttpClient::downloadFile(const std::string& url, const std::string& destination,
                                      const HttpOptions& options) {
    HttpResponse result;

    std::ofstream file(destination, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        result.error = "Failed to open output file: " + destination;
        return result;
    }

    cpr::Header header;
    for (const auto& [key, value] : options.headers) {
        header[key] = value;
    }

    bool aborted = false;
    auto progress = options.progressCallback;

    cpr::Response response = cpr::Download(
        file,
        cpr::Url{url},
        header,
        cpr::UserAgent{options.userAgent},
        cpr::Timeout{options.timeoutSeconds * 1000},
        cpr::ConnectTimeout{options.connectTimeoutSeconds * 1000},
        cpr::VerifySsl{options.verifySSL},
        cpr::ProgressCallback([&](cpr::cpr_off_t downloadTotal, cpr::cpr_off_t downloadNow,
                                  cpr::cpr_off_t /*uploadTotal*/, cpr::cpr_off_t /*uploadNow*/,
                                  intptr_t /*userdata*/) -> bool {
            if (progress && !progress(static_cast<std::int64_t>(downloadNow),
                                      static_cast<std::int64_t>(downloadTotal))) {
                aborted = true;
                return false;
            }
            return true;
        })
    );

    file.close();

    result.statusCode = static_cast<int>(response.status_code);
    result.downloadTime = response.elapsed;
    result.aborted = aborted;
    for (const auto& [key, value] : response.header) {
        result.headers[StringUtils::toLower(key)] = value;
    }
    if (response.error.code != cpr::ErrorCode::OK && !aborted) {
        result.error = response.error.message.empty()
            ? std::string("Network error")
            : response.error.message;
    }

    return result;
}

std::string HttpClient::fileNameFromUrl(const std::string& url) {
    std::string path = url;
    auto cut = path.find_first_of("?#");
    if (cut != std::string::npos) {
        path = path.substr(0, cut);
    }
    auto scheme = path.find("://");
    if (scheme != std::string::npos) {
        path = path.substr(scheme + 3);
        auto slash = path.find('/');
        path = slash == std::string::npos ? std::string{} : path.substr(slash);
    }
    auto last = path.find_last_of('/');
    return last == std::string::npos ? path : path.substr(last + 1);
}

} // namespace courier::utils

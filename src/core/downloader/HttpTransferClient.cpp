/**
 * HttpTransferClient.cpp
 */

#include "HttpTransferClient.hpp"
#include "../Logger.hpp"
#include "../../utils/FileUtils.hpp"
#include "../../utils/StringUtils.hpp"

namespace courier::core::downloader {

HttpTransferClient::HttpTransferClient(utils::HttpOptions options)
    : m_options(std::move(options)) {
}

int HttpTransferClient::parseRetryAfter(const std::string& value) {
    auto seconds = utils::StringUtils::parseInt(utils::StringUtils::trim(value));
    if (!seconds || *seconds < 0) {
        return kDefaultRetryAfterSeconds;
    }
    return *seconds;
}

std::string HttpTransferClient::transfer(const TransferSource& source,
                                         const std::string& destinationPath,
                                         const TransferProgressCallback& onProgress,
                                         const CancellationToken& token) {
    if (token.isCancelled()) {
        throw TransferCancelledError();
    }

    utils::HttpOptions options = m_options;
    for (const auto& [key, value] : source.headers) {
        options.headers[key] = value;
    }
    options.progressCallback = [&](std::int64_t downloaded, std::int64_t total) {
        if (token.isCancelled()) {
            return false;
        }
        if (onProgress && downloaded >= 0) {
            onProgress(static_cast<std::uint64_t>(downloaded),
                       static_cast<std::uint64_t>(total > 0 ? total : 0));
        }
        return true;
    };

    auto response = utils::HttpClient::instance().downloadFile(source.location, destinationPath, options);

    if (response.aborted || token.isCancelled()) {
        throw TransferCancelledError();
    }

    if (!response.error.empty()) {
        utils::FileUtils::deleteFile(destinationPath);
        throw TransferError(response.error);
    }

    if (response.isSuccess()) {
        Logger::instance().debug("Fetched {} in {:.2f}s", source.location, response.downloadTime);
        return destinationPath;
    }

    utils::FileUtils::deleteFile(destinationPath);

    if (response.isTooManyRequests() || response.isServiceUnavailable()) {
        int wait = parseRetryAfter(response.header("Retry-After"));
        Logger::instance().debug("HTTP {} from {}, retry after {}s", response.statusCode, source.location, wait);
        throw RateLimitedError(wait);
    }

    if (response.isClientError()) {
        throw PermanentTransferError("HTTP " + std::to_string(response.statusCode));
    }

    if (response.isServerError()) {
        throw TransferError("Server error (HTTP " + std::to_string(response.statusCode) + ")");
    }

    throw TransferError("Unexpected HTTP " + std::to_string(response.statusCode));
}

} // namespace courier::core::downloader

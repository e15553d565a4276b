#pragma once

/**
 * HttpTransferClient.hpp
 *
 * TransferClient over HTTP(S), mapping response codes onto the transfer
 * error taxonomy.
 */

#include "TransferClient.hpp"
#include "../../utils/HttpClient.hpp"

namespace courier::core::downloader {

class HttpTransferClient : public TransferClient {
public:
    // Wait used when a 429/503 response carries no usable Retry-After
    static constexpr int kDefaultRetryAfterSeconds = 30;

    explicit HttpTransferClient(utils::HttpOptions options = {});

    std::string transfer(const TransferSource& source,
                         const std::string& destinationPath,
                         const TransferProgressCallback& onProgress,
                         const CancellationToken& token) override;

    /**
     * Seconds requested by a Retry-After header value (delta-seconds form)
     */
    static int parseRetryAfter(const std::string& value);

private:
    utils::HttpOptions m_options;
};

} // namespace courier::core::downloader

#pragma once

/**
 * TransferClient.hpp
 *
 * Interface to the component that actually moves bytes from a remote
 * source to a local file, and the errors it reports.
 */

#include "CancellationToken.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <stdexcept>
#include <string>

namespace courier::core::downloader {

/**
 * Where a transfer reads from
 */
struct TransferSource {
    // Remote location (URL for the HTTP client)
    std::string location;

    // Extra request headers (optional)
    std::map<std::string, std::string> headers;
};

/**
 * Progress callback: bytes done, total bytes (0 = unknown)
 */
using TransferProgressCallback = std::function<void(std::uint64_t bytesDone, std::uint64_t bytesTotal)>;

/**
 * Base class for transient transfer failures (retried with backoff)
 */
class TransferError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * The remote service asked us to slow down
 */
class RateLimitedError : public TransferError {
public:
    explicit RateLimitedError(int waitSeconds)
        : TransferError("A wait of " + std::to_string(waitSeconds) + " seconds is required")
        , m_waitSeconds(waitSeconds) {}

    int waitSeconds() const { return m_waitSeconds; }

private:
    int m_waitSeconds;
};

/**
 * Failure that retrying cannot fix (missing file, access denied, ...)
 */
class PermanentTransferError : public TransferError {
public:
    using TransferError::TransferError;
};

/**
 * The transfer stopped because its token was cancelled
 */
class TransferCancelledError : public std::runtime_error {
public:
    TransferCancelledError() : std::runtime_error("Transfer cancelled") {}
};

/**
 * TransferClient - byte transfer capability
 */
class TransferClient {
public:
    virtual ~TransferClient() = default;

    /**
     * Transfer source into destinationPath.
     * @param source Remote source
     * @param destinationPath Local file to write
     * @param onProgress Called as bytes arrive
     * @param token Checked between chunks; cancellation aborts the transfer
     * @return Path of the written file
     * @throws RateLimitedError, PermanentTransferError, TransferCancelledError,
     *         or any other std::exception for transient failures
     */
    virtual std::string transfer(const TransferSource& source,
                                 const std::string& destinationPath,
                                 const TransferProgressCallback& onProgress,
                                 const CancellationToken& token) = 0;
};

} // namespace courier::core::downloader

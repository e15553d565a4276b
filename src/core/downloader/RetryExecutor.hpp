#pragma once

/**
 * RetryExecutor.hpp
 *
 * Runs a task's transfer with bounded retries: exponential backoff for
 * ordinary failures and the server's requested wait for rate limits.
 */

#include "Clock.hpp"
#include "DownloadTask.hpp"
#include "PresentationSurface.hpp"
#include "ProgressTracker.hpp"
#include "TransferClient.hpp"

#include <cstdint>
#include <string>
#include <variant>

namespace courier::core::downloader {

struct TransferCompleted {
    std::string path;
    std::uint64_t size{0};
};

struct TransferFailed {
    std::string reason;
};

struct TransferCancelled {};

/**
 * Result of RetryExecutor::run
 */
using TransferOutcome = std::variant<TransferCompleted, TransferFailed, TransferCancelled>;

class RetryExecutor {
public:
    /**
     * @param client Transfer implementation
     * @param surface Receives rate-limit notices
     * @param clock Time source for progress sampling
     * @param sleeper Performs backoff and rate-limit waits
     * @param maxRetries Total attempts (values below 1 mean 1)
     */
    RetryExecutor(TransferClient& client,
                  PresentationSurface& surface,
                  const Clock& clock,
                  Sleeper& sleeper,
                  int maxRetries);

    /**
     * Transfer task.source into task.destination.
     * Never throws for transfer problems; they are folded into the outcome.
     */
    TransferOutcome run(DownloadTask& task);

    int maxRetries() const { return m_maxRetries; }

    /**
     * Backoff before the retry following a failed attempt (0-based): 2^attempt seconds
     */
    static std::chrono::milliseconds backoffDelay(int attempt);

private:
    TransferClient& m_client;
    PresentationSurface& m_surface;
    const Clock& m_clock;
    Sleeper& m_sleeper;
    ProgressTracker m_tracker;
    int m_maxRetries;
};

} // namespace courier::core::downloader

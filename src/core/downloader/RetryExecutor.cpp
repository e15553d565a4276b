/**
 * RetryExecutor.cpp
 */

#include "RetryExecutor.hpp"
#include "StatusMessages.hpp"
#include "../Logger.hpp"
#include "../../utils/FileUtils.hpp"

#include <algorithm>
#include <mutex>

namespace courier::core::downloader {

RetryExecutor::RetryExecutor(TransferClient& client,
                             PresentationSurface& surface,
                             const Clock& clock,
                             Sleeper& sleeper,
                             int maxRetries)
    : m_client(client)
    , m_surface(surface)
    , m_clock(clock)
    , m_sleeper(sleeper)
    , m_maxRetries(std::max(1, maxRetries)) {
}

std::chrono::milliseconds RetryExecutor::backoffDelay(int attempt) {
    return std::chrono::milliseconds(1000LL << std::clamp(attempt, 0, 30));
}

TransferOutcome RetryExecutor::run(DownloadTask& task) {
    auto& logger = Logger::instance();
    std::string lastError = "Download failed";

    for (int attempt = 0; attempt < m_maxRetries; ++attempt) {
        if (task.cancellation.isCancelled()) {
            return TransferCancelled{};
        }

        task.transition(DownloadStatus::Waiting, DownloadStatus::Downloading);
        m_tracker.beginAttempt(task, m_clock.now());

        try {
            auto onProgress = [this, &task](std::uint64_t done, std::uint64_t total) {
                m_tracker.onProgress(task, done, total, m_clock.now());
            };

            std::string path = m_client.transfer(task.source, task.destination, onProgress, task.cancellation);

            if (task.cancellation.isCancelled()) {
                return TransferCancelled{};
            }

            const auto size = utils::FileUtils::getFileSize(path);
            if (utils::FileUtils::fileExists(path) && size > 0) {
                return TransferCompleted{path, static_cast<std::uint64_t>(size)};
            }
            throw TransferError("Download failed - file not saved");

        } catch (const RateLimitedError& e) {
            const int wait = std::max(0, e.waitSeconds());
            logger.warn("Rate limited on {}, waiting {}s (attempt {}/{})",
                        task.id, wait, attempt + 1, m_maxRetries);

            {
                std::lock_guard<std::mutex> guard(task.renderMutex);
                task.transition(DownloadStatus::Downloading, DownloadStatus::Waiting);
                m_surface.render(task.surface, StatusMessages::rateLimited(wait, attempt + 1, m_maxRetries));
            }

            if (!m_sleeper.sleepFor(std::chrono::seconds(wait), task.cancellation)) {
                return TransferCancelled{};
            }
            lastError = e.what();

        } catch (const TransferCancelledError&) {
            return TransferCancelled{};

        } catch (const PermanentTransferError& e) {
            logger.error("Download {} failed permanently: {}", task.id, e.what());
            return TransferFailed{e.what()};

        } catch (const std::exception& e) {
            if (task.cancellation.isCancelled()) {
                return TransferCancelled{};
            }
            lastError = e.what();
            if (attempt + 1 >= m_maxRetries) {
                break;
            }

            auto delay = backoffDelay(attempt);
            logger.warn("Download attempt {} for {} failed: {} (retrying in {}s)",
                        attempt + 1, task.id, e.what(), delay.count() / 1000);
            if (!m_sleeper.sleepFor(delay, task.cancellation)) {
                return TransferCancelled{};
            }
        }
    }

    logger.error("Download {} failed after {} attempts: {}", task.id, m_maxRetries, lastError);
    return TransferFailed{lastError};
}

} // namespace courier::core::downloader

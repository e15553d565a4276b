#pragma once

/**
 * DownloadTask.hpp
 *
 * Live state of one admitted download.
 */

#include "CancellationToken.hpp"
#include "Clock.hpp"
#include "PresentationSurface.hpp"
#include "TransferClient.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace courier::core::downloader {

/**
 * Download task status
 */
enum class DownloadStatus {
    Queued,
    Downloading,
    Waiting,
    Completed,
    Failed,
    Cancelled
};

inline const char* toString(DownloadStatus status) {
    switch (status) {
        case DownloadStatus::Queued:      return "queued";
        case DownloadStatus::Downloading: return "downloading";
        case DownloadStatus::Waiting:     return "waiting";
        case DownloadStatus::Completed:   return "completed";
        case DownloadStatus::Failed:      return "failed";
        case DownloadStatus::Cancelled:   return "cancelled";
    }
    return "unknown";
}

/**
 * Statuses that hold a concurrency slot
 */
inline bool occupiesSlot(DownloadStatus status) {
    return status == DownloadStatus::Downloading || status == DownloadStatus::Waiting;
}

inline bool isTerminal(DownloadStatus status) {
    return status == DownloadStatus::Completed ||
           status == DownloadStatus::Failed ||
           status == DownloadStatus::Cancelled;
}

/**
 * DownloadTask - one running or finished transfer
 *
 * Owned by the coordinator's registry through a DownloadTaskPtr. The
 * executor and reporter keep their own handle and stop once the task has
 * left the registry.
 */
struct DownloadTask {
    // Task ID (assigned at admission)
    std::string id;

    // Final file name, absolute destination and path below the download root
    std::string filename;
    std::string destination;
    std::string relativePath;

    TransferSource source;
    SurfaceRef surface;

    SteadyTime createdAt{};

    std::atomic<DownloadStatus> status{DownloadStatus::Downloading};

    // Progress, written only by the task's executor thread
    std::atomic<std::uint64_t> size{0};
    std::atomic<std::uint64_t> downloaded{0};
    std::atomic<double> speed{0.0};
    std::atomic<bool> initialPhase{true};
    SteadyTime lastProgressAt{};
    SteadyTime speedSampleAt{};
    std::uint64_t speedSampleBytes{0};

    // Set by the reporter when the surface pushes back
    std::atomic<bool> rateLimited{false};

    // Guarded by the coordinator mutex
    SteadyTime finishedAt{};
    std::string error;

    // Reporter only
    std::string lastMessage;

    // Held across every push to the task's surface together with the
    // liveness check (reporter) or the terminal transition (coordinator)
    std::mutex renderMutex;

    CancellationToken cancellation;

    DownloadTask() = default;
    DownloadTask(const DownloadTask&) = delete;
    DownloadTask& operator=(const DownloadTask&) = delete;

    /**
     * Atomically move from one status to another.
     * @return false if the task was not in `from`
     */
    bool transition(DownloadStatus from, DownloadStatus to) {
        return status.compare_exchange_strong(from, to);
    }

    bool isComplete() const {
        return isTerminal(status.load());
    }

    bool isSuccess() const {
        return status.load() == DownloadStatus::Completed;
    }
};

using DownloadTaskPtr = std::shared_ptr<DownloadTask>;

} // namespace courier::core::downloader

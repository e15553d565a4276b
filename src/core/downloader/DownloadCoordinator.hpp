#pragma once

/**
 * DownloadCoordinator.hpp
 *
 * Concurrency-bounded download manager. Admits requests into a fixed number
 * of slots, queues the rest in FIFO order, runs each transfer with retries,
 * reports progress and reclaims finished tasks.
 */

#include "Clock.hpp"
#include "DownloadQueue.hpp"
#include "DownloadTask.hpp"
#include "PresentationSurface.hpp"
#include "ProgressReporter.hpp"
#include "RetryExecutor.hpp"
#include "TransferClient.hpp"
#include "../ThreadPool.hpp"
#include "../Timer.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace courier::core {
class Config;
}

namespace courier::core::downloader {

/**
 * Coordinator tuning, usually read from Config
 */
struct CoordinatorSettings {
    std::filesystem::path downloadDirectory{"downloads"};
    int maxConcurrent{5};
    int maxRetries{3};
    std::chrono::milliseconds progressThrottle{1000};
    std::chrono::milliseconds cleanupDelay{5000};
    std::chrono::seconds staleAfter{30};
    std::chrono::seconds sweepInterval{10};

    /**
     * Read the "downloads.*" keys. maxConcurrent and maxRetries are raised
     * to 1 when configured lower.
     */
    static CoordinatorSettings fromConfig(const Config& config);
};

/**
 * What a requester asks for
 */
struct DownloadRequest {
    TransferSource source;
    SurfaceRef surface;
    std::string filename;
};

struct AdmissionStarted {};

struct AdmissionQueued {
    size_t position{0};
};

/**
 * Result of submit(): the new id and how it was admitted
 */
struct SubmitResult {
    std::string taskId;
    std::variant<AdmissionStarted, AdmissionQueued> admission;

    bool isQueued() const { return std::holds_alternative<AdmissionQueued>(admission); }
};

struct CancelResult {
    bool success{false};
    std::string taskId;
    std::string filename;
    bool wasQueued{false};
    std::string message;   // Reason when success is false
};

struct ActiveDownloadInfo {
    std::string filename;
    std::uint64_t downloaded{0};
    std::uint64_t size{0};
    DownloadStatus status{DownloadStatus::Downloading};
    double speed{0.0};
};

struct QueuedDownloadInfo {
    std::string taskId;
    std::string filename;
    size_t position{0};
    WallTime enqueuedAt{};
};

struct CoordinatorStats {
    size_t active{0};     // tasks holding a slot
    size_t queued{0};
    size_t tracked{0};    // registry entries, finished ones included
    int maxConcurrent{0};
};

/**
 * Hands the final file to whoever catalogues downloads
 */
using CompletionCallback = std::function<void(
    const std::string& taskId,
    const std::string& path,
    std::uint64_t size
)>;

class DownloadCoordinator {
public:
    /**
     * @param settings Limits and paths
     * @param client Performs transfers; must outlive the coordinator
     * @param surface Shows status text; must outlive the coordinator
     * @param clock Time source (tests pass a manual clock)
     * @param sleeper Executes backoff and reporter pauses
     */
    DownloadCoordinator(CoordinatorSettings settings,
                        TransferClient& client,
                        PresentationSurface& surface,
                        std::shared_ptr<const Clock> clock = std::make_shared<SystemClock>(),
                        std::shared_ptr<Sleeper> sleeper = std::make_shared<TokenSleeper>());

    ~DownloadCoordinator();

    DownloadCoordinator(const DownloadCoordinator&) = delete;
    DownloadCoordinator& operator=(const DownloadCoordinator&) = delete;

    /**
     * Admit a request: start it if a slot is free, otherwise queue it.
     * Returns without waiting for the transfer.
     * @throws std::runtime_error after shutdown()
     */
    SubmitResult submit(DownloadRequest request);

    /**
     * Cancel a running or queued download
     */
    CancelResult cancel(const std::string& taskId);

    /**
     * Tasks holding a slot, keyed by id
     */
    std::map<std::string, ActiveDownloadInfo> listActive();

    /**
     * Queued requests in queue order. Prunes stale tasks first, like
     * listActive().
     */
    std::vector<QueuedDownloadInfo> listQueued();

    /**
     * Remove cancelled tasks and tasks finished longer ago than staleAfter,
     * then fill free slots from the queue.
     * @return Number of registry entries removed
     */
    size_t pruneCompleted();

    CoordinatorStats stats() const;

    /**
     * Registry status of id, Queued if it is waiting in the queue,
     * nullopt if unknown
     */
    std::optional<DownloadStatus> statusOf(const std::string& taskId) const;

    /**
     * Whether id is in the registry
     */
    bool isTracked(const std::string& taskId) const;

    /**
     * Destination path of a registered task, empty if unknown
     */
    std::string destinationOf(const std::string& taskId) const;

    void setCompletionCallback(CompletionCallback callback);

    /**
     * Block until no task holds a slot and the queue is empty
     * @return false on timeout
     */
    bool waitUntilIdle(std::chrono::milliseconds timeout);

    /**
     * Cancel everything and stop worker threads. Idempotent.
     */
    void shutdown();

    const CoordinatorSettings& settings() const { return m_settings; }

private:
    size_t activeCountLocked() const;
    size_t pruneLocked(SteadyTime now);
    std::string generateIdLocked() const;
    bool isDestinationTakenLocked(const std::filesystem::path& path) const;

    void startLocked(const std::string& id, TransferSource source, SurfaceRef surface,
                     const std::string& filename);
    void drainLocked();
    void broadcastPositionsLocked(size_t fromIndex);

    void runTask(const DownloadTaskPtr& task);
    void finishTask(const DownloadTaskPtr& task, const TransferOutcome& outcome);
    bool markFinished(DownloadTask& task, DownloadStatus status);

    void scheduleRemoval(const std::string& taskId);
    void removeIfFinished(const std::string& taskId);

private:
    CoordinatorSettings m_settings;
    TransferClient& m_client;
    PresentationSurface& m_surface;
    std::shared_ptr<const Clock> m_clock;
    std::shared_ptr<Sleeper> m_sleeper;

    // Registry and queue, guarded by m_mutex
    mutable std::mutex m_mutex;
    std::unordered_map<std::string, DownloadTaskPtr> m_tasks;
    DownloadQueue m_queue;
    bool m_shuttingDown{false};
    std::condition_variable m_idleCondition;

    UpdateThrottle m_throttle;
    ProgressReporter m_reporter;
    CompletionCallback m_onComplete;

    Timer m_timer;
    std::unique_ptr<ThreadPool> m_pool;
};

} // namespace courier::core::downloader

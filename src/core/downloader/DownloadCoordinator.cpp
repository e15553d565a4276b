/**
 * DownloadCoordinator.cpp
 *
 * Implementation of the concurrency-bounded download coordinator.
 */

#include "DownloadCoordinator.hpp"
#include "StatusMessages.hpp"
#include "../Config.hpp"
#include "../Logger.hpp"
#include "../../utils/FileUtils.hpp"
#include "../../utils/StringUtils.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <stdexcept>

namespace courier::core::downloader {

namespace {

const char* kUnnamedFile = "unnamed_file";

} // namespace

CoordinatorSettings CoordinatorSettings::fromConfig(const Config& config) {
    CoordinatorSettings settings;

    settings.downloadDirectory = config.get<std::string>("downloads.directory", "downloads");
    settings.maxConcurrent = config.get<int>("downloads.maxConcurrent", 5);
    settings.maxRetries = config.get<int>("downloads.maxRetries", 3);
    settings.progressThrottle = std::chrono::milliseconds(
        std::max(0, config.get<int>("downloads.progressThrottleMs", 1000)));
    settings.cleanupDelay = std::chrono::seconds(
        std::max(0, config.get<int>("downloads.cleanupDelaySeconds", 5)));
    settings.staleAfter = std::chrono::seconds(
        std::max(0, config.get<int>("downloads.staleAfterSeconds", 30)));
    settings.sweepInterval = std::chrono::seconds(
        std::max(1, config.get<int>("downloads.sweepIntervalSeconds", 10)));

    if (settings.maxConcurrent < 1) {
        Logger::instance().warn("downloads.maxConcurrent={} is invalid, using 1", settings.maxConcurrent);
        settings.maxConcurrent = 1;
    }
    if (settings.maxRetries < 1) {
        Logger::instance().warn("downloads.maxRetries={} is invalid, using 1", settings.maxRetries);
        settings.maxRetries = 1;
    }

    return settings;
}

DownloadCoordinator::DownloadCoordinator(CoordinatorSettings settings,
                                         TransferClient& client,
                                         PresentationSurface& surface,
                                         std::shared_ptr<const Clock> clock,
                                         std::shared_ptr<Sleeper> sleeper)
    : m_settings(std::move(settings))
    , m_client(client)
    , m_surface(surface)
    , m_clock(std::move(clock))
    , m_sleeper(std::move(sleeper))
    , m_throttle(m_settings.progressThrottle)
    , m_reporter(m_surface, m_throttle, *m_clock, *m_sleeper) {

    m_settings.maxConcurrent = std::max(1, m_settings.maxConcurrent);
    m_settings.maxRetries = std::max(1, m_settings.maxRetries);

    // One executor and one reporter per slot, plus headroom for jobs that
    // are still winding down after their task left the registry
    m_pool = std::make_unique<ThreadPool>(static_cast<size_t>(m_settings.maxConcurrent) * 2 + 2, "download-pool");

    const auto sweep = std::chrono::duration_cast<std::chrono::milliseconds>(m_settings.sweepInterval);
    m_timer.addPeriodicTask(sweep, sweep, [this] {
        size_t removed = pruneCompleted();
        if (removed > 0) {
            Logger::instance().debug("Periodic cleanup removed {} finished downloads", removed);
        }
    });
    m_timer.start();

    Logger::instance().info("DownloadCoordinator initialized (max concurrent: {}, retries: {}, directory: {})",
                            m_settings.maxConcurrent, m_settings.maxRetries,
                            m_settings.downloadDirectory.string());
}

DownloadCoordinator::~DownloadCoordinator() {
    shutdown();
}

SubmitResult DownloadCoordinator::submit(DownloadRequest request) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_shuttingDown) {
        throw std::runtime_error("DownloadCoordinator is shut down");
    }

    pruneLocked(m_clock->now());

    const std::string id = generateIdLocked();
    std::string filename = utils::StringUtils::sanitizeFileName(
        request.filename.empty() ? kUnnamedFile : request.filename);

    if (activeCountLocked() < static_cast<size_t>(m_settings.maxConcurrent)) {
        startLocked(id, std::move(request.source), std::move(request.surface), filename);
        return {id, AdmissionStarted{}};
    }

    QueuedDownload entry;
    entry.id = id;
    entry.source = std::move(request.source);
    entry.surface = request.surface;
    entry.filename = filename;
    entry.enqueuedAt = m_clock->wallNow();

    const size_t position = m_queue.push(std::move(entry));
    m_surface.render(request.surface, StatusMessages::queued(filename, position, id, true));

    Logger::instance().info("Queued download {} ({}) at position {}", id, filename, position);
    return {id, AdmissionQueued{position}};
}

CancelResult DownloadCoordinator::cancel(const std::string& taskId) {
    std::unique_lock<std::mutex> lock(m_mutex);

    CancelResult result;
    result.taskId = taskId;

    auto it = m_tasks.find(taskId);
    if (it != m_tasks.end()) {
        DownloadTaskPtr task = it->second;
        const DownloadStatus status = task->status.load();

        if (status == DownloadStatus::Completed || status == DownloadStatus::Failed) {
            result.filename = task->filename;
            result.message = fmt::format("Download {} has already finished", taskId);
            return result;
        }

        task->status = DownloadStatus::Cancelled;
        task->finishedAt = m_clock->now();
        task->cancellation.cancel();

        if (utils::FileUtils::deleteFile(task->destination)) {
            Logger::instance().info("Removed partial file {}", task->destination);
        }

        m_tasks.erase(it);
        Logger::instance().info("Cancelled download {} ({})", taskId, task->filename);

        result.success = true;
        result.filename = task->filename;

        drainLocked();
        lock.unlock();
        m_idleCondition.notify_all();
        return result;
    }

    auto position = m_queue.positionOf(taskId);
    if (position) {
        auto entry = m_queue.remove(taskId);
        Logger::instance().info("Removed queued download {} ({})", taskId, entry->filename);
        m_surface.release(entry->surface);

        // Everything behind the removed entry moved up by one
        broadcastPositionsLocked(*position - 1);

        result.success = true;
        result.filename = entry->filename;
        result.wasQueued = true;

        lock.unlock();
        m_idleCondition.notify_all();
        return result;
    }

    result.message = "No download found with ID: " + taskId;
    return result;
}

std::map<std::string, ActiveDownloadInfo> DownloadCoordinator::listActive() {
    std::lock_guard<std::mutex> lock(m_mutex);

    pruneLocked(m_clock->now());

    std::map<std::string, ActiveDownloadInfo> active;
    for (const auto& [id, task] : m_tasks) {
        const DownloadStatus status = task->status.load();
        if (!occupiesSlot(status)) {
            continue;
        }

        ActiveDownloadInfo info;
        info.filename = task->filename;
        info.downloaded = task->downloaded.load();
        info.size = task->size.load();
        info.status = status;
        info.speed = task->speed.load();
        active.emplace(id, std::move(info));
    }
    return active;
}

std::vector<QueuedDownloadInfo> DownloadCoordinator::listQueued() {
    std::lock_guard<std::mutex> lock(m_mutex);

    pruneLocked(m_clock->now());

    std::vector<QueuedDownloadInfo> queued;
    queued.reserve(m_queue.size());

    size_t position = 1;
    for (const auto& entry : m_queue.entries()) {
        queued.push_back({entry.id, entry.filename, position++, entry.enqueuedAt});
    }
    return queued;
}

size_t DownloadCoordinator::pruneCompleted() {
    size_t removed = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        removed = pruneLocked(m_clock->now());
        drainLocked();
    }
    if (removed > 0) {
        m_idleCondition.notify_all();
    }
    return removed;
}

CoordinatorStats DownloadCoordinator::stats() const {
    std::lock_guard<std::mutex> lock(m_mutex);

    CoordinatorStats stats;
    stats.active = activeCountLocked();
    stats.queued = m_queue.size();
    stats.tracked = m_tasks.size();
    stats.maxConcurrent = m_settings.maxConcurrent;
    return stats;
}

std::optional<DownloadStatus> DownloadCoordinator::statusOf(const std::string& taskId) const {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_tasks.find(taskId);
    if (it != m_tasks.end()) {
        return it->second->status.load();
    }
    if (m_queue.contains(taskId)) {
        return DownloadStatus::Queued;
    }
    return std::nullopt;
}

bool DownloadCoordinator::isTracked(const std::string& taskId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_tasks.count(taskId) > 0;
}

std::string DownloadCoordinator::destinationOf(const std::string& taskId) const {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_tasks.find(taskId);
    return it != m_tasks.end() ? it->second->destination : std::string();
}

void DownloadCoordinator::setCompletionCallback(CompletionCallback callback) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_onComplete = std::move(callback);
}

bool DownloadCoordinator::waitUntilIdle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_idleCondition.wait_for(lock, timeout, [this] {
        return activeCountLocked() == 0 && m_queue.empty();
    });
}

void DownloadCoordinator::shutdown() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_shuttingDown) {
            return;
        }
        m_shuttingDown = true;

        Logger::instance().info("Shutting down DownloadCoordinator ({} running, {} queued)",
                                activeCountLocked(), m_queue.size());

        for (auto& [id, task] : m_tasks) {
            task->cancellation.cancel();
        }
        for (const auto& entry : m_queue.entries()) {
            m_surface.release(entry.surface);
        }
        m_queue.clear();
    }

    m_timer.stop();

    // Running executors observe their cancelled tokens and wind down
    m_pool->shutdown();

    m_idleCondition.notify_all();
}

// -- Internals (m_mutex held unless noted) --

size_t DownloadCoordinator::activeCountLocked() const {
    return static_cast<size_t>(std::count_if(m_tasks.begin(), m_tasks.end(), [](const auto& entry) {
        return occupiesSlot(entry.second->status.load());
    }));
}

size_t DownloadCoordinator::pruneLocked(SteadyTime now) {
    size_t removed = 0;

    for (auto it = m_tasks.begin(); it != m_tasks.end();) {
        const DownloadTask& task = *it->second;
        const DownloadStatus status = task.status.load();

        bool remove = status == DownloadStatus::Cancelled;
        if (status == DownloadStatus::Completed || status == DownloadStatus::Failed) {
            remove = now - task.finishedAt > m_settings.staleAfter;
        }

        if (remove) {
            Logger::instance().debug("Pruned {} download {}", toString(status), it->first);
            it = m_tasks.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }

    return removed;
}

std::string DownloadCoordinator::generateIdLocked() const {
    std::string id;
    do {
        id = utils::StringUtils::generateShortId(8);
    } while (m_tasks.count(id) > 0 || m_queue.contains(id));
    return id;
}

bool DownloadCoordinator::isDestinationTakenLocked(const std::filesystem::path& path) const {
    return std::any_of(m_tasks.begin(), m_tasks.end(), [&path](const auto& entry) {
        return !entry.second->isComplete() && std::filesystem::path(entry.second->destination) == path;
    });
}

void DownloadCoordinator::startLocked(const std::string& id,
                                      TransferSource source,
                                      SurfaceRef surface,
                                      const std::string& filename) {
    auto task = std::make_shared<DownloadTask>();
    task->id = id;
    task->filename = filename;
    task->source = std::move(source);
    task->surface = std::move(surface);
    task->createdAt = m_clock->now();
    task->lastProgressAt = task->createdAt;
    task->speedSampleAt = task->createdAt;

    try {
        const auto folder = m_settings.downloadDirectory /
                            utils::StringUtils::formatDate(m_clock->wallNow(), "%Y%m%d");
        utils::FileUtils::ensureDirectory(folder);

        const auto path = utils::FileUtils::uniqueFilePath(folder, filename,
            [this](const std::filesystem::path& candidate) {
                return isDestinationTakenLocked(candidate);
            });

        task->destination = path.string();
        task->filename = path.filename().string();
        task->relativePath = utils::FileUtils::relativePath(path, m_settings.downloadDirectory);

    } catch (const std::filesystem::filesystem_error& e) {
        Logger::instance().error("Cannot prepare destination for {}: {}", id, e.what());

        task->status = DownloadStatus::Failed;
        task->error = e.what();
        task->finishedAt = task->createdAt;
        m_tasks[id] = task;

        m_surface.render(task->surface, StatusMessages::failed(e.what()));
        m_surface.release(task->surface);
        scheduleRemoval(id);
        return;
    }

    m_tasks[id] = task;
    m_surface.render(task->surface, StatusMessages::starting(task->filename, id));

    Logger::instance().info("Starting download {}: {} -> {}", id, task->source.location, task->destination);

    m_pool->post([this, task] {
        runTask(task);
    });
    m_pool->post([this, task] {
        m_reporter.run(task, [this](const std::string& taskId) {
            return isTracked(taskId);
        });
    });
}

void DownloadCoordinator::drainLocked() {
    if (m_shuttingDown) {
        return;
    }

    while (!m_queue.empty() && activeCountLocked() < static_cast<size_t>(m_settings.maxConcurrent)) {
        auto next = m_queue.popFront();
        Logger::instance().info("Promoting queued download {} ({})", next->id, next->filename);

        startLocked(next->id, std::move(next->source), std::move(next->surface), next->filename);
        broadcastPositionsLocked(0);
    }
}

void DownloadCoordinator::broadcastPositionsLocked(size_t fromIndex) {
    const auto& entries = m_queue.entries();

    for (size_t i = fromIndex; i < entries.size(); ++i) {
        const auto& entry = entries[i];
        auto status = m_surface.render(entry.surface,
                                       StatusMessages::queued(entry.filename, i + 1, entry.id, false));
        if (status == RenderStatus::Failed || status == RenderStatus::RateLimited) {
            Logger::instance().debug("Queue position update for {} was not delivered", entry.id);
        }
    }
}

// Runs on a pool worker, m_mutex not held
void DownloadCoordinator::runTask(const DownloadTaskPtr& task) {
    TransferOutcome outcome;

    try {
        RetryExecutor executor(m_client, m_surface, *m_clock, *m_sleeper, m_settings.maxRetries);
        outcome = executor.run(*task);
    } catch (const std::exception& e) {
        Logger::instance().error("Download {} aborted: {}", task->id, e.what());
        outcome = TransferFailed{e.what()};
    }

    finishTask(task, outcome);
}

bool DownloadCoordinator::markFinished(DownloadTask& task, DownloadStatus status) {
    DownloadStatus current = task.status.load();
    while (occupiesSlot(current)) {
        if (task.status.compare_exchange_weak(current, status)) {
            task.finishedAt = m_clock->now();
            return true;
        }
    }
    return false;
}

// Runs on a pool worker, m_mutex not held
void DownloadCoordinator::finishTask(const DownloadTaskPtr& task, const TransferOutcome& outcome) {
    auto& logger = Logger::instance();

    const auto* done = std::get_if<TransferCompleted>(&outcome);
    CompletionCallback onComplete;
    bool recorded = false;

    {
        // Lock order: renderMutex, then m_mutex. The reporter checks for a
        // terminal task under renderMutex, so nothing renders after this block.
        std::lock_guard<std::mutex> render(task->renderMutex);

        if (done) {
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                if (markFinished(*task, DownloadStatus::Completed)) {
                    task->size = done->size;
                    task->downloaded = done->size;
                    onComplete = m_onComplete;
                    recorded = true;
                }
            }

            if (recorded) {
                logger.info("Download {} completed: {} ({})", task->id, done->path,
                            utils::StringUtils::formatBytes(static_cast<double>(done->size)));
                m_surface.render(task->surface, StatusMessages::completed(task->relativePath, done->size));
            }

        } else if (auto* failed = std::get_if<TransferFailed>(&outcome)) {
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                if (markFinished(*task, DownloadStatus::Failed)) {
                    task->error = failed->reason;
                    recorded = true;
                }
            }

            if (recorded) {
                logger.error("Download {} failed: {}", task->id, failed->reason);
                m_surface.render(task->surface, StatusMessages::failed(failed->reason));
            }

        } else {
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                markFinished(*task, DownloadStatus::Cancelled);

                // The path may already belong to a newer task after cancel() freed it
                if (!isDestinationTakenLocked(task->destination) &&
                    utils::FileUtils::deleteFile(task->destination)) {
                    logger.info("Removed partial file {}", task->destination);
                }

                auto it = m_tasks.find(task->id);
                if (it != m_tasks.end() && it->second == task) {
                    m_tasks.erase(it);
                }
            }

            logger.info("Download {} cancelled", task->id);
            m_surface.render(task->surface, StatusMessages::cancelled(task->filename));
        }

        // Release the reporter
        task->cancellation.cancel();
        m_surface.release(task->surface);
    }

    if (recorded && onComplete) {
        try {
            onComplete(task->id, done->path, done->size);
        } catch (const std::exception& e) {
            logger.error("Completion handler failed for {}: {}", task->id, e.what());
        }
    }
    if (recorded) {
        scheduleRemoval(task->id);
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        drainLocked();
    }
    m_idleCondition.notify_all();
}

void DownloadCoordinator::scheduleRemoval(const std::string& taskId) {
    m_timer.addOnceTask(m_settings.cleanupDelay, [this, taskId] {
        removeIfFinished(taskId);
    });
}

void DownloadCoordinator::removeIfFinished(const std::string& taskId) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        auto it = m_tasks.find(taskId);
        if (it == m_tasks.end() || !it->second->isComplete()) {
            return;
        }
        m_tasks.erase(it);
        Logger::instance().debug("Removed finished download {} from registry", taskId);
    }
    m_idleCondition.notify_all();
}

} // namespace courier::core::downloader

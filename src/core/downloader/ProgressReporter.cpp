/**
 * ProgressReporter.cpp
 */

#include "ProgressReporter.hpp"
#include "StatusMessages.hpp"
#include "../Logger.hpp"

namespace courier::core::downloader {

// -- UpdateThrottle --

UpdateThrottle::UpdateThrottle(std::chrono::milliseconds interval)
    : m_interval(interval) {
}

bool UpdateThrottle::tryAcquire(SteadyTime now) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_last && now - *m_last < m_interval) {
        return false;
    }
    m_last = now;
    return true;
}

// -- ProgressReporter --

ProgressReporter::ProgressReporter(PresentationSurface& surface,
                                   UpdateThrottle& throttle,
                                   const Clock& clock,
                                   Sleeper& sleeper)
    : m_surface(surface)
    , m_throttle(throttle)
    , m_clock(clock)
    , m_sleeper(sleeper) {
}

std::chrono::milliseconds ProgressReporter::intervalFor(const DownloadTask& task) {
    constexpr std::uint64_t MiB = 1024 * 1024;
    const std::uint64_t size = task.size.load();

    if (task.initialPhase.load() || size < 100 * MiB) {
        return std::chrono::seconds(1);
    }
    if (size <= 500 * MiB) {
        return std::chrono::seconds(2);
    }
    return std::chrono::seconds(3);
}

std::optional<std::chrono::milliseconds> ProgressReporter::step(DownloadTask& task, bool registered) {
    if (!registered || task.isComplete() || task.cancellation.isCancelled()) {
        return std::nullopt;
    }

    if (task.rateLimited.exchange(false)) {
        return std::chrono::duration_cast<std::chrono::milliseconds>(kRateLimitPause);
    }

    {
        std::lock_guard<std::mutex> guard(task.renderMutex);

        // The task may have finished while the text was pending
        if (task.isComplete() || task.cancellation.isCancelled()) {
            return std::nullopt;
        }

        if (task.status.load() == DownloadStatus::Downloading) {
            std::string text = StatusMessages::progress(task);

            if (text != task.lastMessage && m_throttle.tryAcquire(m_clock.now())) {
                switch (m_surface.render(task.surface, text)) {
                    case RenderStatus::Ok:
                    case RenderStatus::NotModified:
                        task.lastMessage = std::move(text);
                        break;
                    case RenderStatus::RateLimited:
                        Logger::instance().warn("Surface is rate limiting updates for {}", task.id);
                        task.rateLimited = true;
                        break;
                    case RenderStatus::Failed:
                        Logger::instance().debug("Progress update for {} was not delivered", task.id);
                        break;
                }
            }
        }
    }

    return intervalFor(task);
}

void ProgressReporter::run(const DownloadTaskPtr& task, const RegistryProbe& isRegistered) {
    Logger::instance().debug("Progress reporter started for {}", task->id);

    try {
        while (true) {
            auto pause = step(*task, isRegistered(task->id));
            if (!pause) {
                break;
            }
            if (!m_sleeper.sleepFor(*pause, task->cancellation)) {
                break;
            }
        }
    } catch (const std::exception& e) {
        Logger::instance().error("Progress updater error for {}: {}", task->id, e.what());
    }

    Logger::instance().debug("Progress reporter stopped for {}", task->id);
}

} // namespace courier::core::downloader

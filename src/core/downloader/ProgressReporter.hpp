#pragma once

/**
 * ProgressReporter.hpp
 *
 * Periodic loop that pushes a running task's progress text to the
 * presentation surface.
 */

#include "Clock.hpp"
#include "DownloadTask.hpp"
#include "PresentationSurface.hpp"

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace courier::core::downloader {

/**
 * Minimum spacing between two pushes, shared by every reporter so the
 * surface sees at most one progress update per interval overall.
 */
class UpdateThrottle {
public:
    explicit UpdateThrottle(std::chrono::milliseconds interval);

    /**
     * Claim the next push slot if the interval has elapsed since the last
     * claimed one.
     */
    bool tryAcquire(SteadyTime now);

    std::chrono::milliseconds interval() const { return m_interval; }

private:
    std::mutex m_mutex;
    std::chrono::milliseconds m_interval;
    std::optional<SteadyTime> m_last;
};

class ProgressReporter {
public:
    // Pause after the surface reported throttling
    static constexpr std::chrono::seconds kRateLimitPause{5};

    // Answers whether a task id is still in the registry
    using RegistryProbe = std::function<bool(const std::string&)>;

    ProgressReporter(PresentationSurface& surface,
                     UpdateThrottle& throttle,
                     const Clock& clock,
                     Sleeper& sleeper);

    /**
     * Report until the task leaves the registry, finishes or is cancelled.
     * Errors end the loop; they are logged, not rethrown.
     */
    void run(const DownloadTaskPtr& task, const RegistryProbe& isRegistered);

    /**
     * One loop iteration.
     * @param registered Whether the task is still in the registry
     * @return Pause before the next iteration, nullopt to stop
     */
    std::optional<std::chrono::milliseconds> step(DownloadTask& task, bool registered);

    /**
     * Refresh interval: 1s during the initial phase or below 100 MiB,
     * 2s up to 500 MiB, 3s above.
     */
    static std::chrono::milliseconds intervalFor(const DownloadTask& task);

private:
    PresentationSurface& m_surface;
    UpdateThrottle& m_throttle;
    const Clock& m_clock;
    Sleeper& m_sleeper;
};

} // namespace courier::core::downloader

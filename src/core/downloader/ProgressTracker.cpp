/**
 * ProgressTracker.cpp
 *
 * Significance filter and speed sampling.
 */

#include "ProgressTracker.hpp"

#include <algorithm>

namespace courier::core::downloader {

double ProgressTracker::minimumStep(std::uint64_t bytesTotal) {
    const double onePercent = static_cast<double>(bytesTotal > 0 ? bytesTotal : 1) * 0.01;
    return std::min(static_cast<double>(kMaxStepBytes), onePercent);
}

void ProgressTracker::beginAttempt(DownloadTask& task, SteadyTime now) const {
    task.speedSampleAt = now;
    task.speedSampleBytes = task.downloaded.load();
}

bool ProgressTracker::onProgress(DownloadTask& task, std::uint64_t bytesDone, std::uint64_t bytesTotal,
                                 SteadyTime now) const {
    if (task.status.load() == DownloadStatus::Cancelled) {
        return false;
    }

    const std::uint64_t recorded = task.downloaded.load();
    bool significant = false;

    if (recorded < kInitialWindowBytes) {
        significant = true;
        if (bytesDone > 0) {
            task.initialPhase = false;
        }
    } else {
        const std::uint64_t delta = bytesDone > recorded ? bytesDone - recorded : recorded - bytesDone;
        significant = static_cast<double>(delta) >= minimumStep(bytesTotal);
    }

    if (bytesTotal > 0 && bytesDone == bytesTotal) {
        significant = true;
    }

    if (!significant) {
        return false;
    }

    task.downloaded = bytesDone;
    if (bytesTotal > 0) {
        task.size = bytesTotal;
    }
    task.lastProgressAt = now;

    const double elapsed = secondsBetween(task.speedSampleAt, now);
    if (elapsed >= kSpeedSampleSeconds) {
        const double delta = static_cast<double>(bytesDone) - static_cast<double>(task.speedSampleBytes);
        task.speed = std::max(0.0, delta / elapsed);
        task.speedSampleAt = now;
        task.speedSampleBytes = bytesDone;
    }

    return true;
}

} // namespace courier::core::downloader

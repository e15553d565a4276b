#pragma once

/**
 * ProgressTracker.hpp
 *
 * Records transfer progress on a task, filtering out callbacks too small
 * to be worth recording.
 */

#include "DownloadTask.hpp"

#include <cstdint>

namespace courier::core::downloader {

class ProgressTracker {
public:
    // Every callback is recorded until this many bytes have been seen
    static constexpr std::uint64_t kInitialWindowBytes = 1024 * 1024;

    // Upper bound for the minimum delta after the initial window
    static constexpr std::uint64_t kMaxStepBytes = 256 * 1024;

    // Minimum spacing of speed samples, in seconds
    static constexpr double kSpeedSampleSeconds = 0.1;

    /**
     * Minimum byte delta for a callback to be significant past the
     * initial window: min(256 KiB, 1% of total).
     */
    static double minimumStep(std::uint64_t bytesTotal);

    /**
     * Apply one transfer callback to the task.
     * @param task Task being transferred (only its executor calls this)
     * @param bytesDone Bytes received so far
     * @param bytesTotal Total bytes, 0 when unknown
     * @param now Current monotonic time
     * @return true if the task state was updated
     */
    bool onProgress(DownloadTask& task, std::uint64_t bytesDone, std::uint64_t bytesTotal,
                    SteadyTime now) const;

    /**
     * Reset sampling state at the start of an attempt
     */
    void beginAttempt(DownloadTask& task, SteadyTime now) const;
};

} // namespace courier::core::downloader

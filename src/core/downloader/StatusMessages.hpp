#pragma once

/**
 * StatusMessages.hpp
 *
 * Text shown on the presentation surface for each download state.
 */

#include "DownloadTask.hpp"

#include <cstdint>
#include <string>

namespace courier::core::downloader {

class StatusMessages {
public:
    // Width of the progress bar in cells
    static constexpr int kBarWidth = 20;

    /**
     * Queue notice. The first notice also explains that the download starts
     * on its own; position updates leave that line out.
     */
    static std::string queued(const std::string& filename, size_t position,
                              const std::string& taskId, bool firstNotice);

    static std::string starting(const std::string& filename, const std::string& taskId);

    /**
     * Live progress text for a downloading task
     */
    static std::string progress(const DownloadTask& task);

    static std::string rateLimited(int waitSeconds, int attempt, int maxAttempts);

    /**
     * Completion summary. The date folder (first component of relativePath,
     * YYYYMMDD) is shown as YYYY-MM-DD.
     */
    static std::string completed(const std::string& relativePath, std::uint64_t size);

    static std::string cancelled(const std::string& filename);

    static std::string failed(const std::string& reason);

    /**
     * "YYYYMMDD" -> "YYYY-MM-DD"; anything else is returned unchanged
     */
    static std::string formatFolderDate(const std::string& folder);
};

} // namespace courier::core::downloader

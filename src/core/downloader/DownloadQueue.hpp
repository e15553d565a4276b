#pragma once

/**
 * DownloadQueue.hpp
 *
 * FIFO of admitted requests waiting for a free slot.
 * Not synchronized: the coordinator guards it with its registry mutex.
 */

#include "Clock.hpp"
#include "PresentationSurface.hpp"
#include "TransferClient.hpp"

#include <deque>
#include <optional>
#include <string>
#include <vector>

namespace courier::core::downloader {

/**
 * Download queue entry
 */
struct QueuedDownload {
    std::string id;
    TransferSource source;
    SurfaceRef surface;
    std::string filename;
    WallTime enqueuedAt{};
};

class DownloadQueue {
public:
    /**
     * Append to the tail
     * @return 1-based position of the new entry
     */
    size_t push(QueuedDownload entry);

    /**
     * Remove and return the head, nullopt when empty
     */
    std::optional<QueuedDownload> popFront();

    /**
     * Remove the entry with this id wherever it sits
     */
    std::optional<QueuedDownload> remove(const std::string& id);

    /**
     * 1-based position of id, nullopt if not queued
     */
    std::optional<size_t> positionOf(const std::string& id) const;

    bool contains(const std::string& id) const;

    /**
     * Entries in queue order; position of entries()[i] is i + 1
     */
    const std::deque<QueuedDownload>& entries() const { return m_entries; }

    size_t size() const { return m_entries.size(); }
    bool empty() const { return m_entries.empty(); }
    void clear() { m_entries.clear(); }

private:
    std::deque<QueuedDownload> m_entries;
};

} // namespace courier::core::downloader

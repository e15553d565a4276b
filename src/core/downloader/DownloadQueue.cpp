/**
 * DownloadQueue.cpp
 */

#include "DownloadQueue.hpp"

#include <algorithm>

namespace courier::core::downloader {

size_t DownloadQueue::push(QueuedDownload entry) {
    m_entries.push_back(std::move(entry));
    return m_entries.size();
}

std::optional<QueuedDownload> DownloadQueue::popFront() {
    if (m_entries.empty()) {
        return std::nullopt;
    }
    QueuedDownload head = std::move(m_entries.front());
    m_entries.pop_front();
    return head;
}

std::optional<QueuedDownload> DownloadQueue::remove(const std::string& id) {
    auto it = std::find_if(m_entries.begin(), m_entries.end(),
                           [&id](const QueuedDownload& entry) { return entry.id == id; });
    if (it == m_entries.end()) {
        return std::nullopt;
    }
    QueuedDownload removed = std::move(*it);
    m_entries.erase(it);
    return removed;
}

std::optional<size_t> DownloadQueue::positionOf(const std::string& id) const {
    for (size_t i = 0; i < m_entries.size(); ++i) {
        if (m_entries[i].id == id) {
            return i + 1;
        }
    }
    return std::nullopt;
}

bool DownloadQueue::contains(const std::string& id) const {
    return positionOf(id).has_value();
}

} // namespace courier::core::downloader

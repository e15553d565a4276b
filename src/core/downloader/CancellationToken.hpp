#pragma once

/**
 * CancellationToken.hpp
 *
 * Cooperative cancellation flag shared by a task's executor, its progress
 * reporter and the transfer callback. Waits on the token wake up as soon as
 * cancel() is called.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace courier::core::downloader {

class CancellationToken {
public:
    CancellationToken() = default;

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_cancelled = true;
        }
        m_condition.notify_all();
    }

    bool isCancelled() const {
        return m_cancelled.load();
    }

    /**
     * Block for up to timeout.
     * @return true if the token was cancelled before or during the wait
     */
    template<typename Rep, typename Period>
    bool waitFor(std::chrono::duration<Rep, Period> timeout) const {
        std::unique_lock<std::mutex> lock(m_mutex);
        return m_condition.wait_for(lock, timeout, [this] { return m_cancelled.load(); });
    }

private:
    mutable std::mutex m_mutex;
    mutable std::condition_variable m_condition;
    std::atomic<bool> m_cancelled{false};
};

} // namespace courier::core::downloader

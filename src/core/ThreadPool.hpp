#pragma once

/**
 * ThreadPool.hpp
 *
 * Fixed-size worker pool running transfer jobs and progress reporters.
 */

#include "Logger.hpp"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace courier::core {

/**
 * ThreadPool - FIFO pool of long-running jobs
 *
 * Jobs are fire-and-forget: they report through the objects they capture,
 * not through futures. A job that throws is logged and the worker moves on.
 * shutdown() runs what is still queued, then joins every worker.
 */
class ThreadPool {
public:
    using Job = std::function<void()>;

    /**
     * @param numThreads Number of workers (at least one)
     * @param name Label used in log messages
     */
    explicit ThreadPool(size_t numThreads, std::string name = "pool")
        : m_name(std::move(name)) {

        numThreads = numThreads > 0 ? numThreads : 1;
        m_workers.reserve(numThreads);
        for (size_t i = 0; i < numThreads; ++i) {
            m_workers.emplace_back([this, i] { workerLoop(i); });
        }

        LOG_DEBUG("{}: started {} workers", m_name, numThreads);
    }

    ~ThreadPool() {
        shutdown();
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * Queue a job
     * @throws std::runtime_error after shutdown()
     */
    void post(Job job) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_closed) {
                throw std::runtime_error(m_name + " is shut down");
            }
            m_jobs.push(std::move(job));
        }
        m_wake.notify_one();
    }

    /**
     * Stop accepting jobs, finish the queued ones and join the workers.
     * Must not be called from a worker. Idempotent.
     */
    void shutdown() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_closed && m_workers.empty()) {
                return;
            }
            m_closed = true;
        }
        m_wake.notify_all();

        for (auto& worker : m_workers) {
            if (worker.joinable()) {
                worker.join();
            }
        }
        m_workers.clear();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_workers.size();
    }

    // Jobs queued but not yet picked up
    size_t backlog() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_jobs.size();
    }

    size_t running() const {
        return m_running.load();
    }

private:
    void workerLoop(size_t index) {
        for (;;) {
            Job job;
            {
                std::unique_lock<std::mutex> lock(m_mutex);
                m_wake.wait(lock, [this] { return m_closed || !m_jobs.empty(); });
                if (m_jobs.empty()) {
                    return;
                }
                job = std::move(m_jobs.front());
                m_jobs.pop();
            }

            ++m_running;
            try {
                job();
            } catch (const std::exception& e) {
                LOG_ERROR("{}: job on worker {} failed: {}", m_name, index, e.what());
            }
            --m_running;
        }
    }

private:
    std::string m_name;
    std::vector<std::thread> m_workers;
    std::queue<Job> m_jobs;

    mutable std::mutex m_mutex;
    std::condition_variable m_wake;
    bool m_closed{false};
    std::atomic<size_t> m_running{0};
};

} // namespace courier::core

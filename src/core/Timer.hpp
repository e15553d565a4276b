#pragma once

/**
 * Timer.hpp
 *
 * Single-thread scheduler for delayed and periodic housekeeping callbacks.
 */

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace courier::core {

class Timer {
public:
    using Clock = std::chrono::steady_clock;

    Timer();
    ~Timer();

    Timer(const Timer&) = delete;
    Timer& operator=(const Timer&) = delete;

    /**
     * Run callback once after delay
     */
    void addOnceTask(std::chrono::milliseconds delay, std::function<void()> callback);

    /**
     * Run callback after delay, then every period until stop()
     */
    void addPeriodicTask(std::chrono::milliseconds delay,
                         std::chrono::milliseconds period,
                         std::function<void()> callback);

    void start();

    /**
     * Stop the timer thread. Pending callbacks are discarded.
     */
    void stop();

    bool isRunning() const;
    size_t pendingTasks() const;

private:
    struct TimerTask {
        Clock::time_point execTimestamp;
        std::function<void()> callback;
        bool isPeriodic{false};
        std::chrono::milliseconds period{0};

        bool operator>(const TimerTask& other) const {
            return execTimestamp > other.execTimestamp;
        }
    };

    void push(TimerTask task);
    void run();

private:
    std::priority_queue<TimerTask, std::vector<TimerTask>, std::greater<TimerTask>> m_tasks;
    mutable std::mutex m_mutex;
    std::condition_variable m_condition;
    std::thread m_thread;
    bool m_running{false};
};

} // namespace courier::core

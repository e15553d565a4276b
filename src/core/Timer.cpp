/**
 * Timer.cpp
 *
 * Priority-queue scheduler driven by one background thread.
 */

#include "Timer.hpp"
#include "Logger.hpp"

namespace courier::core {

Timer::Timer() = default;

Timer::~Timer() {
    stop();
}

void Timer::addOnceTask(std::chrono::milliseconds delay, std::function<void()> callback) {
    push(TimerTask{Clock::now() + delay, std::move(callback), false, std::chrono::milliseconds(0)});
}

void Timer::addPeriodicTask(std::chrono::milliseconds delay,
                            std::chrono::milliseconds period,
                            std::function<void()> callback) {
    if (period <= std::chrono::milliseconds::zero()) {
        period = std::chrono::milliseconds(1000);
    }
    push(TimerTask{Clock::now() + delay, std::move(callback), true, period});
}

void Timer::push(TimerTask task) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_tasks.push(std::move(task));
    }
    m_condition.notify_one();
}

void Timer::start() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_running) return;
    m_running = true;
    m_thread = std::thread([this] { run(); });
}

void Timer::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_running = false;
        m_tasks = {};
    }
    m_condition.notify_all();

    if (m_thread.joinable() && m_thread.get_id() != std::this_thread::get_id()) {
        m_thread.join();
    }
}

bool Timer::isRunning() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_running;
}

size_t Timer::pendingTasks() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_tasks.size();
}

void Timer::run() {
    std::unique_lock<std::mutex> lock(m_mutex);
    while (m_running) {
        if (m_tasks.empty()) {
            m_condition.wait(lock, [this] { return !m_tasks.empty() || !m_running; });
            continue;
        }

        auto due = m_tasks.top().execTimestamp;
        if (due > Clock::now()) {
            // Wake early when an earlier task is pushed or on stop
            m_condition.wait_until(lock, due, [this, due] {
                return !m_running || (!m_tasks.empty() && m_tasks.top().execTimestamp < due);
            });
            continue;
        }

        TimerTask next = m_tasks.top();
        m_tasks.pop();
        if (next.isPeriodic) {
            TimerTask again = next;
            again.execTimestamp += again.period;
            m_tasks.push(std::move(again));
        }

        lock.unlock();
        try {
            next.callback();
        } catch (const std::exception& e) {
            Logger::instance().error("Timer callback failed: {}", e.what());
        }
        lock.lock();
    }
}

} // namespace courier::core

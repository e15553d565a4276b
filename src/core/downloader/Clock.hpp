#pragma once

/**
 * Clock.hpp
 *
 * Time sources used by the coordinator. Production code uses the system
 * clocks and sleeps on the task's cancellation token; tests substitute
 * manual implementations.
 */

#include "CancellationToken.hpp"

#include <chrono>

namespace courier::core::downloader {

using SteadyTime = std::chrono::steady_clock::time_point;
using WallTime = std::chrono::system_clock::time_point;

class Clock {
public:
    virtual ~Clock() = default;

    /** Monotonic time for intervals and ages */
    virtual SteadyTime now() const = 0;

    /** Calendar time for timestamps shown to users */
    virtual WallTime wallNow() const = 0;
};

class SystemClock : public Clock {
public:
    SteadyTime now() const override { return std::chrono::steady_clock::now(); }
    WallTime wallNow() const override { return std::chrono::system_clock::now(); }
};

class Sleeper {
public:
    virtual ~Sleeper() = default;

    /**
     * Suspend for duration unless the token is cancelled first.
     * @return true if the full duration elapsed, false if cancelled
     */
    virtual bool sleepFor(std::chrono::milliseconds duration, const CancellationToken& token) = 0;
};

class TokenSleeper : public Sleeper {
public:
    bool sleepFor(std::chrono::milliseconds duration, const CancellationToken& token) override {
        return !token.waitFor(duration);
    }
};

/**
 * Seconds between two steady time points as a double
 */
inline double secondsBetween(SteadyTime from, SteadyTime to) {
    return std::chrono::duration<double>(to - from).count();
}

} // namespace courier::core::downloader

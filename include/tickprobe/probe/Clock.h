// SPDX-License-Identifier: BSD-2-Clause

#pragma once
/**
 * @file Clock.h
 * @brief Time source injected into the scheduler, role loops and transports.
 */

#include <chrono>
#include <mutex>

namespace tickprobe {

class Clock {
public:
    using time_point = std::chrono::steady_clock::time_point;
    using duration = std::chrono::steady_clock::duration;

    virtual ~Clock() = default;

    virtual time_point now() const = 0;
    virtual void sleep_for(duration d) = 0;
};

/**
 * @brief Wall-clock implementation backed by std::chrono::steady_clock.
 */
class SteadyClock final : public Clock {
public:
    time_point now() const override;
    void sleep_for(duration d) override;
};

/**
 * @brief Virtual clock for tests. sleep_for() advances time instead of blocking.
 *
 * Thread-safe so a simulated network and two role loops can share it.
 */
class ManualClock final : public Clock {
public:
    explicit ManualClock(time_point start = time_point{} + std::chrono::seconds(1))
        : now_(start) {}

    time_point now() const override;
    void sleep_for(duration d) override;

    void advance(duration d);

private:
    mutable std::mutex mtx_;
    time_point now_;
};

/// Process-wide steady clock used when nothing else is injected.
Clock& steady_clock();

} // namespace tickprobe

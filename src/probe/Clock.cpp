// SPDX-License-Identifier: BSD-2-Clause

#include "tickprobe/probe/Clock.h"

#include <thread>

namespace tickprobe {

Clock::time_point SteadyClock::now() const {
    return std::chrono::steady_clock::now();
}

void SteadyClock::sleep_for(duration d) {
    if (d > duration::zero()) std::this_thread::sleep_for(d);
}

Clock::time_point ManualClock::now() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return now_;
}

void ManualClock::sleep_for(duration d) {
    advance(d);
}

void ManualClock::advance(duration d) {
    if (d <= duration::zero()) return;
    std::lock_guard<std::mutex> lock(mtx_);
    now_ += d;
}

Clock& steady_clock() {
    static SteadyClock clock;
    return clock;
}

} // namespace tickprobe

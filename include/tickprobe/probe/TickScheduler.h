// SPDX-License-Identifier: BSD-2-Clause

#pragma once

#include "tickprobe/probe/Clock.h"

#include <cstdint>
#include <functional>

namespace tickprobe {

enum class TickAction {
    Continue,
    Stop
};

/**
 * @brief Fixed-cadence loop driving one role.
 *
 * Each iteration samples the tick start from the clock, runs the body and then
 * sleeps for whatever is left of the period. An overrunning tick is followed
 * immediately by the next one; missed ticks are not made up.
 */
class TickScheduler {
public:
    /// Body receives the zero-based tick index and the sampled tick start.
    using Body = std::function<TickAction(std::uint64_t tick, Clock::time_point tick_start)>;

    TickScheduler(Clock& clock, Clock::duration period);

    /**
     * @brief Run @p body until it returns TickAction::Stop.
     * @return Number of iterations executed (including the stopping one).
     */
    std::uint64_t run(const Body& body);

    Clock::duration period() const { return period_; }

private:
    Clock& clock_;
    Clock::duration period_;
};

} // namespace tickprobe

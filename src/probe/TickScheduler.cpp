// SPDX-License-Identifier: BSD-2-Clause

#include "tickprobe/probe/TickScheduler.h"

namespace tickprobe {

TickScheduler::TickScheduler(Clock& clock, Clock::duration period)
    : clock_(clock), period_(period) {}

std::uint64_t TickScheduler::run(const Body& body) {
    std::uint64_t iterations = 0;
    for (;;) {
        const auto tick_start = clock_.now();
        const auto action = body(iterations, tick_start);
        ++iterations;
        if (action == TickAction::Stop) break;

        const auto elapsed = clock_.now() - tick_start;
        if (elapsed < period_) {
            clock_.sleep_for(period_ - elapsed);
        }
    }
    return iterations;
}

} // namespace tickprobe

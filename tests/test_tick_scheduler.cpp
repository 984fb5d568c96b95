// SPDX-License-Identifier: BSD-2-Clause

#include "tickprobe/probe/Clock.h"
#include "tickprobe/probe/TickScheduler.h"

#include <cassert>
#include <chrono>
#include <cstdint>
#include <vector>

using namespace std::chrono;
using tickprobe::Clock;
using tickprobe::ManualClock;
using tickprobe::TickAction;
using tickprobe::TickScheduler;

int main() {
    // Body costs nothing: tick starts are exactly one period apart.
    {
        ManualClock clock;
        TickScheduler scheduler(clock, milliseconds(10));
        std::vector<Clock::time_point> starts;
        const auto n = scheduler.run([&](std::uint64_t tick, Clock::time_point ts) {
            assert(tick == starts.size());
            starts.push_back(ts);
            return tick == 4 ? TickAction::Stop : TickAction::Continue;
        });
        assert(n == 5);
        assert(starts.size() == 5);
        for (std::size_t i = 1; i < starts.size(); ++i) {
            assert(starts[i] - starts[i - 1] == milliseconds(10));
        }
    }

    // Body takes part of the period: the remainder is slept.
    {
        ManualClock clock;
        TickScheduler scheduler(clock, milliseconds(10));
        std::vector<Clock::time_point> starts;
        scheduler.run([&](std::uint64_t tick, Clock::time_point ts) {
            starts.push_back(ts);
            clock.advance(milliseconds(3));
            return tick == 2 ? TickAction::Stop : TickAction::Continue;
        });
        assert(starts[1] - starts[0] == milliseconds(10));
        assert(starts[2] - starts[1] == milliseconds(10));
    }

    // Overrun: the next tick starts at once and missed ticks are not replayed.
    {
        ManualClock clock;
        TickScheduler scheduler(clock, milliseconds(10));
        std::vector<Clock::time_point> starts;
        scheduler.run([&](std::uint64_t tick, Clock::time_point ts) {
            starts.push_back(ts);
            if (tick == 0) clock.advance(milliseconds(35));
            return tick == 2 ? TickAction::Stop : TickAction::Continue;
        });
        assert(starts.size() == 3);
        assert(starts[1] - starts[0] == milliseconds(35));
        assert(starts[2] - starts[1] == milliseconds(10));
    }

    // Stopping on the first tick still counts one iteration.
    {
        ManualClock clock;
        const auto before = clock.now();
        TickScheduler scheduler(clock, milliseconds(10));
        const auto n = scheduler.run([](std::uint64_t, Clock::time_point) { return TickAction::Stop; });
        assert(n == 1);
        assert(scheduler.period() == milliseconds(10));
        assert(clock.now() - before <= milliseconds(10));
    }

    return 0;
}

// SPDX-License-Identifier: BSD-2-Clause

#pragma once

#include "tickprobe/app/core/ClientRunner.h"
#include "tickprobe/app/core/ServerRunner.h"
#include "tickprobe/probe/Clock.h"

#include <cstdint>

// Drive both roles on one ManualClock: client first, then server, then one
// period forward. A role that returned Stop is not ticked again.
inline std::uint64_t run_lockstep(tickprobe::ManualClock& clock,
                                  tickprobe::app::ClientRunner& client,
                                  tickprobe::app::ServerRunner& server,
                                  tickprobe::Clock::duration period,
                                  std::uint64_t max_ticks = 100000) {
    using tickprobe::TickAction;
    client.start(clock.now());
    server.start(clock.now());

    bool client_done = false;
    bool server_done = false;
    std::uint64_t ticks = 0;
    while ((!client_done || !server_done) && ticks < max_ticks) {
        const auto ts = clock.now();
        if (!client_done) client_done = client.tick(ts) == TickAction::Stop;
        if (!server_done) server_done = server.tick(ts) == TickAction::Stop;
        clock.advance(period);
        ++ticks;
    }
    return ticks;
}

inline tickprobe::LoggerPtr silent_logger(const char* tag) {
    return tickprobe::make_logger({tickprobe::LogLevel::ERROR, tickprobe::LogMode::Silent, {}}, tag);
}

// SPDX-License-Identifier: BSD-2-Clause

#pragma once

#include "tickprobe/config/Config.h"
#include "tickprobe/log/Log.h"
#include "tickprobe/net/Transport.h"
#include "tickprobe/probe/Clock.h"
#include "tickprobe/probe/ConnectionTracker.h"
#include "tickprobe/probe/SequencedExchange.h"
#include "tickprobe/probe/StatsCollector.h"
#include "tickprobe/probe/TickScheduler.h"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>

namespace tickprobe::app {

/**
 * Runs the client role.
 *
 * Waits for AllowConnection, sends the handshake, then emits one sequenced
 * PlayerMove per send interval and counts the echoes. The first transport
 * error aborts the run.
 */
class ClientRunner {
public:
    ClientRunner(const Config& cfg, net::ClientTransport& transport, Clock& clock, LoggerPtr log);

    /**
     * Run to completion on the tick scheduler.
     *
     * @return ClientStats, or std::nullopt when a transport error aborted the run.
     */
    std::optional<ClientStats> run();

    void start(Clock::time_point at);

    TickAction tick(Clock::time_point tick_start);

    ClientStats finish() const;

    void set_should_stop(std::function<bool()> should_stop) { should_stop_ = std::move(should_stop); }

    bool connected() const { return gate_.connected(); }
    bool aborted() const { return aborted_; }
    const std::string& abort_reason() const { return abort_reason_; }
    std::uint32_t sent() const { return sequencer_.sent(); }
    std::uint64_t connected_ticks() const { return connected_ticks_; }

private:
    Config cfg_;
    net::ClientTransport& transport_;
    Clock& clock_;
    LoggerPtr log_;

    ClientConnectionGate gate_;
    ClientSequencer sequencer_;
    ClientRecorder recorder_;

    Clock::time_point test_end_{};
    std::uint64_t connected_ticks_ = 0;
    bool aborted_ = false;
    std::string abort_reason_;
    std::function<bool()> should_stop_;
};

} // namespace tickprobe::app

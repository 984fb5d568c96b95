// SPDX-License-Identifier: BSD-2-Clause

#pragma once

#include "tickprobe/config/Config.h"
#include "tickprobe/log/Log.h"
#include "tickprobe/net/Transport.h"
#include "tickprobe/probe/Clock.h"
#include "tickprobe/probe/ConnectionTracker.h"
#include "tickprobe/probe/StatsCollector.h"
#include "tickprobe/probe/TickScheduler.h"

#include <cstdint>
#include <functional>
#include <utility>

namespace tickprobe::app {

/**
 * Runs the server role.
 *
 * Per tick: step the transport, log its errors, apply connection events,
 * echo every PlayerMove from the tracked client and record one tick count.
 * The loop ends once the run duration elapsed and a client is connected.
 */
class ServerRunner {
public:
    /**
     * @param cfg       Probe parameters (duration, tick rate).
     * @param transport Listening transport; must outlive the runner.
     * @param clock     Time source shared with the scheduler.
     * @param log       Role logger.
     */
    ServerRunner(const Config& cfg, net::ServerTransport& transport, Clock& clock, LoggerPtr log);

    /**
     * Run to completion on the tick scheduler.
     *
     * Transport errors are logged and never end the run.
     */
    ServerStats run();

    /** Fix the end of the run at @p at + duration. Called by run(). */
    void start(Clock::time_point at);

    /** One scheduler iteration. */
    TickAction tick(Clock::time_point tick_start);

    /** Cooperative cancellation polled once per tick. */
    void set_should_stop(std::function<bool()> should_stop) { should_stop_ = std::move(should_stop); }

    /** Derive statistics from what was recorded so far. */
    ServerStats finish() const;

    const ServerConnectionTracker& tracker() const { return tracker_; }
    std::uint64_t iterations() const { return iterations_; }
    std::uint64_t connected_ticks() const { return connected_ticks_; }
    std::uint64_t transport_errors() const { return transport_errors_; }

private:
    void process_client_messages(const net::ServerConnectionPtr& conn, Clock::time_point tick_start);

    Config cfg_;
    net::ServerTransport& transport_;
    Clock& clock_;
    LoggerPtr log_;

    ServerConnectionTracker tracker_;
    ServerRecorder recorder_;

    Clock::time_point test_end_{};
    std::uint64_t iterations_ = 0;
    std::uint64_t connected_ticks_ = 0;
    std::uint64_t echoes_sent_ = 0;
    std::uint64_t transport_errors_ = 0;
    bool waiting_warned_ = false;
    std::function<bool()> should_stop_;
};

} // namespace tickprobe::app

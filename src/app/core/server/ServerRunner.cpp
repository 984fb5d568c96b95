// SPDX-License-Identifier: BSD-2-Clause

#include "tickprobe/app/core/ServerRunner.h"

#include "tickprobe/probe/SequencedExchange.h"

#include <type_traits>
#include <utility>
#include <variant>

namespace tickprobe::app {

ServerRunner::ServerRunner(const Config& cfg, net::ServerTransport& transport, Clock& clock, LoggerPtr log)
    : cfg_(cfg),
      transport_(transport),
      clock_(clock),
      log_(log),
      tracker_(std::move(log)) {}

void ServerRunner::start(Clock::time_point at) {
    test_end_ = at + cfg_.run_duration();
}

ServerStats ServerRunner::run() {
    TPLOG_INFO(log_, "Server starting on %s", cfg_.probe.address.c_str());
    TPLOG_INFO(log_, "Waiting for client connection...");
    start(clock_.now());

    TickScheduler scheduler(clock_, cfg_.tick_period());
    scheduler.run([this](std::uint64_t, Clock::time_point tick_start) {
        return tick(tick_start);
    });
    return finish();
}

TickAction ServerRunner::tick(Clock::time_point tick_start) {
    ++iterations_;
    transport_.step(cfg_.tick_period());

    for (const auto& error : transport_.drain_errors()) {
        ++transport_errors_;
        TPLOG_ERROR(log_, "Server error: %s", error.c_str());
    }

    for (const auto& ev : transport_.drain_connections()) {
        tracker_.on_event(ev);
    }

    if (tracker_.connected()) {
        // Copy: message handling must not see the slot change under it.
        auto conn = tracker_.connection();
        process_client_messages(conn, tick_start);
    }

    if (should_stop_ && should_stop_()) {
        TPLOG_INFO(log_, "Stop requested");
        return TickAction::Stop;
    }

    if (clock_.now() >= test_end_) {
        if (tracker_.connected()) return TickAction::Stop;
        if (!waiting_warned_) {
            waiting_warned_ = true;
            TPLOG_WARN(log_, "Run duration elapsed without a connected client; still waiting");
        }
    }
    return TickAction::Continue;
}

void ServerRunner::process_client_messages(const net::ServerConnectionPtr& conn, Clock::time_point tick_start) {
    std::size_t count = 0;
    const auto now = clock_.now();

    for (const auto& msg : conn->drain_client_messages()) {
        std::visit([&](const auto& m) {
            using T = std::decay_t<decltype(m)>;
            if constexpr (std::is_same_v<T, net::PlayerMove>) {
                ++count;
                recorder_.record(ServerObservation{now, sequence_of(m.position)});
                const auto since_start = std::chrono::duration<float>(clock_.now() - tick_start).count();
                conn->send_message(net::DeliveryClass::Unreliable, make_echo(m, since_start));
                ++echoes_sent_;
            } else if constexpr (std::is_same_v<T, net::ConnectionInfo>) {
                TPLOG_INFO(log_, "Client sent ConnectionInfo: login=%s version=%s",
                           m.login.c_str(), m.version.c_str());
            }
        }, msg);
    }

    recorder_.record_tick(count);
    ++connected_ticks_;
}

ServerStats ServerRunner::finish() const {
    return derive_server_stats(recorder_, echoes_sent_);
}

} // namespace tickprobe::app

// SPDX-License-Identifier: BSD-2-Clause

#include "tickprobe/app/core/ClientRunner.h"

#include <type_traits>
#include <variant>

namespace tickprobe::app {
namespace {

net::ConnectionInfo handshake_from(const Config::ProbeConfig& probe) {
    return net::ConnectionInfo{probe.login, probe.version, probe.architecture, probe.rendering_device};
}

} // namespace

ClientRunner::ClientRunner(const Config& cfg, net::ClientTransport& transport, Clock& clock, LoggerPtr log)
    : cfg_(cfg),
      transport_(transport),
      clock_(clock),
      log_(log),
      gate_(log, handshake_from(cfg.probe)),
      sequencer_(cfg.send_interval()) {}

void ClientRunner::start(Clock::time_point at) {
    test_end_ = at + cfg_.run_duration();
}

std::optional<ClientStats> ClientRunner::run() {
    TPLOG_INFO(log_, "Client connecting to %s", cfg_.probe.address.c_str());
    start(clock_.now());

    TickScheduler scheduler(clock_, cfg_.tick_period());
    scheduler.run([this](std::uint64_t, Clock::time_point tick_start) {
        return tick(tick_start);
    });

    if (aborted_) return std::nullopt;
    return finish();
}

TickAction ClientRunner::tick(Clock::time_point tick_start) {
    transport_.step(cfg_.tick_period());

    auto errors = transport_.drain_errors();
    if (!errors.empty()) {
        TPLOG_ERROR(log_, "Client error: %s", errors.front().c_str());
        aborted_ = true;
        abort_reason_ = errors.front();
        return TickAction::Stop;
    }

    std::size_t count = 0;
    const auto now = clock_.now();
    for (const auto& msg : transport_.drain_server_messages()) {
        std::visit([&](const auto& m) {
            using T = std::decay_t<decltype(m)>;
            if constexpr (std::is_same_v<T, net::AllowConnection>) {
                if (gate_.on_allow_connection(transport_)) {
                    sequencer_.on_connected(now);
                }
            } else if constexpr (std::is_same_v<T, net::EntityMove>) {
                ++count;
                recorder_.record(ClientObservation{now, sequence_of(m.position), m.timestamp});
            }
        }, msg);
    }

    if (gate_.connected()) {
        recorder_.record_tick(count);
        ++connected_ticks_;
        if (auto seq = sequencer_.maybe_send(tick_start, transport_)) {
            TPLOG_TRACE(log_, "PlayerMove #%u sent", *seq);
        }
    }

    if (should_stop_ && should_stop_()) {
        TPLOG_INFO(log_, "Stop requested");
        return TickAction::Stop;
    }

    if (clock_.now() >= test_end_ && gate_.connected()) {
        return TickAction::Stop;
    }
    return TickAction::Continue;
}

ClientStats ClientRunner::finish() const {
    return derive_client_stats(recorder_, sequencer_.sent());
}

} // namespace tickprobe::app

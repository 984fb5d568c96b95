// SPDX-License-Identifier: BSD-2-Clause

#include "lockstep_harness.h"

#include "tickprobe/config/Config.h"
#include "tickprobe/net/SimulatedTransport.h"
#include "tickprobe/probe/StatsCollector.h"

#include <cassert>
#include <cmath>
#include <cstdint>
#include <memory>

namespace {

void check_distribution(const tickprobe::TickSummary& t) {
    assert(t.total_ticks > 0);
    double percent = 0.0;
    std::uint64_t ticks = 0;
    for (const auto& e : t.distribution) {
        percent += e.percent;
        ticks += e.ticks;
    }
    assert(std::fabs(percent - 100.0) < 1e-9);
    assert(ticks == t.total_ticks);
    for (std::size_t i = 1; i < t.distribution.size(); ++i) {
        assert(t.distribution[i - 1].messages_per_tick < t.distribution[i].messages_per_tick);
    }
}

} // namespace

int main() {
    tickprobe::Config cfg;
    cfg.probe.duration_seconds = 5.0;

    tickprobe::net::LinkConditions lossy;
    lossy.latency_ms = 30.0;
    lossy.jitter_ms = 25.0;
    lossy.loss_percent = 20.0;

    for (std::uint64_t seed : {1ULL, 7ULL, 42ULL}) {
        tickprobe::ManualClock clock;
        auto net = std::make_shared<tickprobe::net::SimulatedNetwork>(clock, lossy, lossy, seed);
        auto server_transport = net->server_transport();
        auto client_transport = net->connect_client();

        tickprobe::app::ServerRunner server(cfg, *server_transport, clock, silent_logger("server"));
        tickprobe::app::ClientRunner client(cfg, *client_transport, clock, silent_logger("client"));
        run_lockstep(clock, client, server, cfg.tick_period());
        assert(client.connected());

        const auto s = server.finish();
        const auto c = client.finish();
        assert(net->client_to_server().dropped > 0);
        assert(s.has_data && c.has_data);

        check_distribution(s.ticks);
        check_distribution(c.ticks);

        assert(c.lost > 0);
        assert(c.loss_percent > 0.0 && c.loss_percent < 100.0);
    }

    return 0;
}

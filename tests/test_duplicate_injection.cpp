// SPDX-License-Identifier: BSD-2-Clause

#include "lockstep_harness.h"

#include "tickprobe/config/Config.h"
#include "tickprobe/net/SimulatedTransport.h"

#include <cassert>
#include <memory>

int main() {
    tickprobe::Config cfg;
    cfg.probe.duration_seconds = 2.0;

    tickprobe::net::LinkConditions to_server;
    to_server.duplicate_every = 3;
    tickprobe::net::LinkConditions to_client;

    tickprobe::ManualClock clock;
    auto net = std::make_shared<tickprobe::net::SimulatedNetwork>(clock, to_server, to_client, 7);
    auto server_transport = net->server_transport();
    auto client_transport = net->connect_client();

    tickprobe::app::ServerRunner server(cfg, *server_transport, clock, silent_logger("server"));
    tickprobe::app::ClientRunner client(cfg, *client_transport, clock, silent_logger("client"));

    run_lockstep(clock, client, server, cfg.tick_period());

    const auto s = server.finish();
    const auto c = client.finish();
    const auto c2s = net->client_to_server();

    // Only PlayerMove travels unreliably towards the server.
    assert(c2s.unreliable_sent == c.messages_sent);
    assert(c2s.duplicated == c.messages_sent / 3);
    assert(c2s.duplicated > 0);

    // Each copy lands right behind its original: one out-of-order pair per copy.
    assert(s.out_of_order == c2s.duplicated);
    assert(s.ticks.messages_received == c.messages_sent + c2s.duplicated);
    assert(s.ticks.max_batch == 2);
    assert(s.ticks.batched_ticks == c2s.duplicated);

    // More received than expected: loss clamps at zero.
    assert(s.lost == 0);
    assert(s.loss_percent == 0.0);

    // The echoes carry the duplicates back.
    assert(s.echoes_sent == s.ticks.messages_received);
    assert(c.echo_out_of_order > 0);
    assert(c.lost == 0);

    return 0;
}

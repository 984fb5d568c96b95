// SPDX-License-Identifier: BSD-2-Clause

#include "lockstep_harness.h"

#include "tickprobe/config/Config.h"
#include "tickprobe/net/SimulatedTransport.h"

#include <cassert>
#include <memory>
#include <string>

int main() {
    tickprobe::Config cfg;
    cfg.probe.duration_seconds = 5.0;

    // Error before anything happened: run() aborts on the first tick.
    {
        tickprobe::ManualClock clock;
        auto net = std::make_shared<tickprobe::net::SimulatedNetwork>(clock, cfg.transport.simulated);
        auto client_transport = net->connect_client();
        net->inject_client_error(client_transport->client_id(), "socket reset");

        auto log = tickprobe::make_logger({tickprobe::LogLevel::INFO, tickprobe::LogMode::Buffer, {}}, "client");
        tickprobe::app::ClientRunner client(cfg, *client_transport, clock, log);
        const auto result = client.run();
        assert(!result);
        assert(client.aborted());
        assert(client.abort_reason() == "socket reset");

        bool logged = false;
        for (const auto& line : log->lines()) {
            if (line.find("Client error: socket reset") != std::string::npos) logged = true;
        }
        assert(logged);
    }

    // Error mid-run: the client stops, the server keeps its data and ends on request.
    {
        tickprobe::ManualClock clock;
        auto net = std::make_shared<tickprobe::net::SimulatedNetwork>(clock, cfg.transport.simulated);
        auto server_transport = net->server_transport();
        auto client_transport = net->connect_client();

        tickprobe::app::ServerRunner server(cfg, *server_transport, clock, silent_logger("server"));
        tickprobe::app::ClientRunner client(cfg, *client_transport, clock, silent_logger("client"));

        client.start(clock.now());
        server.start(clock.now());
        for (int i = 0; i < 20; ++i) {
            const auto ts = clock.now();
            assert(client.tick(ts) == tickprobe::TickAction::Continue);
            server.tick(ts);
            clock.advance(cfg.tick_period());
        }
        assert(client.sent() > 0);

        net->inject_client_error(client_transport->client_id(), "connection lost");
        assert(client.tick(clock.now()) == tickprobe::TickAction::Stop);
        assert(client.aborted());
        const auto sent_before = client.sent();

        server.set_should_stop([] { return true; });
        assert(server.tick(clock.now()) == tickprobe::TickAction::Stop);
        const auto s = server.finish();
        assert(s.has_data);
        assert(s.ticks.messages_received == sent_before);

        // Server-side errors are only logged.
        net->inject_server_error("bad datagram");
        server.set_should_stop({});
        server.tick(clock.now());
        assert(server.transport_errors() == 1);
    }

    return 0;
}

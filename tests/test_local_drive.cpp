// SPDX-License-Identifier: BSD-2-Clause

#include "tickprobe/app/core/ProbeDriver.h"
#include "tickprobe/config/Config.h"
#include "tickprobe/log/Log.h"
#include "tickprobe/net/SimulatedTransport.h"
#include "tickprobe/net/TransportFactory.h"

#include <atomic>
#include <cassert>
#include <string>

int main() {
    auto silent = [](const char* tag) {
        return tickprobe::make_logger({tickprobe::LogLevel::ERROR, tickprobe::LogMode::Silent, {}}, tag);
    };

    // Both roles in one process over the simulated link, on the real clock.
    {
        tickprobe::Config cfg;
        cfg.transport.kind = "simulated";
        cfg.probe.duration_seconds = 0.25;

        tickprobe::ProbeOptions opts;
        opts.role = tickprobe::ProbeOptions::Role::Local;
        opts.server_log = silent("server");
        opts.client_log = silent("client");

        const auto summary = tickprobe::drive_probe(cfg, opts);
        assert(summary.ok());
        assert(summary.server && summary.client);
        assert(summary.client->messages_sent > 0);
        assert(summary.server->has_data);
        assert(summary.server->ticks.messages_received <= summary.client->messages_sent);
        assert(summary.server->out_of_order == 0);
        assert(summary.server->lost == 0);
        assert(summary.server->sequence_first && *summary.server->sequence_first == 1);
    }

    // A client error in local mode stops the server as well.
    {
        tickprobe::Config cfg;
        cfg.probe.duration_seconds = 30.0;

        tickprobe::net::SimulatedTransportFactory factory;
        tickprobe::ProbeOptions opts;
        opts.role = tickprobe::ProbeOptions::Role::Local;
        opts.transport_factory = &factory;
        opts.server_log = silent("server");
        opts.client_log = silent("client");
        std::atomic<int> polls{0};
        opts.should_stop = [&] {
            // Polled by both role threads.
            if (++polls == 10 && factory.network()) {
                factory.network()->inject_client_error(1, "link down");
            }
            return false;
        };

        const auto summary = tickprobe::drive_probe(cfg, opts);
        assert(!summary.ok());
        assert(summary.client_aborted);
        assert(summary.client_error == "link down");
        assert(!summary.client);
        assert(summary.server);
    }

    // Setup failures.
    {
        tickprobe::Config cfg;
        cfg.transport.kind = "carrier-pigeon";
        tickprobe::ProbeOptions opts;
        opts.server_log = silent("server");
        const auto summary = tickprobe::drive_probe(cfg, opts);
        assert(!summary.setup_error.empty());
        assert(!summary.server);
    }

    assert(tickprobe::parse_role("LOCAL") == tickprobe::ProbeOptions::Role::Local);
    assert(!tickprobe::parse_role("observer"));
    assert(std::string(tickprobe::to_string(tickprobe::ProbeOptions::Role::Client)) == "client");

    return 0;
}

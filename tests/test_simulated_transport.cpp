// SPDX-License-Identifier: BSD-2-Clause

#include "tickprobe/net/SimulatedTransport.h"
#include "tickprobe/net/TransportFactory.h"
#include "tickprobe/probe/Clock.h"

#include <cassert>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <variant>
#include <vector>

using namespace std::chrono;
using namespace tickprobe::net;

namespace {

PlayerMove move(float x) {
    return PlayerMove{Vector3{x, 0.0f, 0.0f}, Rotation{}};
}

} // namespace

int main() {
    // Latency: nothing arrives early; reliable traffic keeps its order.
    {
        tickprobe::ManualClock clock;
        LinkConditions slow;
        slow.latency_ms = 20.0;
        auto net = std::make_shared<SimulatedNetwork>(clock, slow, slow, 1);
        auto server = net->server_transport();
        auto client = net->connect_client();

        server->step(Duration::zero());
        auto events = server->drain_connections();
        assert(events.size() == 1);
        auto conn = events[0].connection;
        assert(conn && conn->client_id() == client->client_id());
        assert(net->connected_clients() == 1);

        client->send_message(DeliveryClass::ReliableOrdered, ConnectionInfo{"a", "b", "c", "d"});
        client->send_message(DeliveryClass::Unreliable, move(1.0f));

        clock.advance(milliseconds(19));
        server->step(Duration::zero());
        assert(conn->drain_client_messages().empty());

        clock.advance(milliseconds(1));
        server->step(Duration::zero());
        auto msgs = conn->drain_client_messages();
        assert(msgs.size() == 2);
        assert(std::holds_alternative<ConnectionInfo>(msgs[0]));
        assert(std::holds_alternative<PlayerMove>(msgs[1]));

        // Only one server facade per network.
        bool threw = false;
        try {
            net->server_transport();
        } catch (const std::logic_error&) {
            threw = true;
        }
        assert(threw);
    }

    // Full loss drops unreliable traffic only.
    {
        tickprobe::ManualClock clock;
        LinkConditions lossy;
        lossy.loss_percent = 100.0;
        auto net = std::make_shared<SimulatedNetwork>(clock, LinkConditions{}, lossy, 3);
        auto server = net->server_transport();
        auto client = net->connect_client();
        server->step(Duration::zero());
        auto conn = server->drain_connections().at(0).connection;

        conn->send_message(DeliveryClass::ReliableOrdered, AllowConnection{});
        for (int i = 0; i < 10; ++i) {
            EntityMove e;
            e.position = Vector3{static_cast<float>(i + 1), 0.0f, 0.0f};
            conn->send_message(DeliveryClass::Unreliable, e);
        }
        client->step(Duration::zero());
        auto msgs = client->drain_server_messages();
        assert(msgs.size() == 1);
        assert(std::holds_alternative<AllowConnection>(msgs[0]));

        const auto s2c = net->server_to_client();
        assert(s2c.unreliable_sent == 10);
        assert(s2c.dropped == 10);
        assert(s2c.reliable_sent == 1);
        assert(s2c.delivered == 1);
    }

    // Jitter may reorder unreliable deliveries; the same seed replays the same order.
    {
        auto run = [](std::uint64_t seed) {
            tickprobe::ManualClock clock;
            LinkConditions jittery;
            jittery.latency_ms = 10.0;
            jittery.jitter_ms = 10.0;
            auto net = std::make_shared<SimulatedNetwork>(clock, jittery, LinkConditions{}, seed);
            auto server = net->server_transport();
            auto client = net->connect_client();
            server->step(Duration::zero());
            auto conn = server->drain_connections().at(0).connection;
            for (int i = 1; i <= 50; ++i) {
                client->send_message(DeliveryClass::Unreliable, move(static_cast<float>(i)));
                clock.advance(milliseconds(1));
            }
            clock.advance(milliseconds(50));
            server->step(Duration::zero());
            std::vector<float> order;
            for (const auto& m : conn->drain_client_messages()) {
                order.push_back(std::get<PlayerMove>(m).position.x);
            }
            return order;
        };
        const auto a = run(42);
        const auto b = run(42);
        assert(a.size() == 50);
        assert(a == b);
        bool reordered = false;
        for (std::size_t i = 1; i < a.size(); ++i) {
            if (a[i] < a[i - 1]) reordered = true;
        }
        assert(reordered);
    }

    // Disconnect, errors and the factory.
    {
        tickprobe::ManualClock clock;
        auto net = std::make_shared<SimulatedNetwork>(clock, tickprobe::Config::SimulatedConfig{});
        auto server = net->server_transport();
        auto client = net->connect_client();
        const auto id = client->client_id();

        net->inject_server_error("boom");
        auto errors = server->drain_errors();
        assert(errors.size() == 1 && errors[0] == "boom");
        assert(server->drain_errors().empty());

        client->disconnect("bye");
        server->step(Duration::zero());
        auto events = server->drain_connections();
        assert(events.size() == 2);
        assert(events[1].kind == ConnectionEvent::Kind::Disconnect);
        assert(events[1].client_id == id);
        assert(events[1].reason == "bye");
        assert(net->connected_clients() == 0);

        tickprobe::Config cfg;
        cfg.transport.kind = "simulated";
        auto factory = make_transport_factory(cfg);
        assert(factory);
        cfg.transport.kind = "carrier-pigeon";
        assert(!make_transport_factory(cfg));

        SimulatedTransportFactory sim;
        assert(!sim.network());
        auto log = tickprobe::make_logger({tickprobe::LogLevel::ERROR, tickprobe::LogMode::Silent, {}});
        auto st = sim.create_server(cfg, clock, log);
        auto ct = sim.create_client(cfg, clock, log);
        assert(sim.network());
        st->step(Duration::zero());
        assert(st->drain_connections().size() == 1);
        (void)ct;
    }

    return 0;
}

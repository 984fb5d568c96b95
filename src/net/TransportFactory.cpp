// SPDX-License-Identifier: BSD-2-Clause

#include "tickprobe/net/TransportFactory.h"

#include "tickprobe/net/SimulatedTransport.h"
#include "tickprobe/net/UdpTransport.h"

#include <utility>

namespace tickprobe::net {

ServerTransportPtr UdpTransportFactory::create_server(const Config& cfg, Clock& clock, LoggerPtr log) {
    return std::make_unique<UdpServerTransport>(cfg.probe.address, cfg.transport.udp, clock, std::move(log));
}

ClientTransportPtr UdpTransportFactory::create_client(const Config& cfg, Clock& clock, LoggerPtr log) {
    return std::make_unique<UdpClientTransport>(cfg.probe.address, cfg.transport.udp, clock, std::move(log));
}

std::shared_ptr<SimulatedNetwork> SimulatedTransportFactory::ensure_network(const Config& cfg, Clock& clock) {
    if (!network_) {
        network_ = std::make_shared<SimulatedNetwork>(clock, cfg.transport.simulated);
    }
    return network_;
}

ServerTransportPtr SimulatedTransportFactory::create_server(const Config& cfg, Clock& clock, LoggerPtr log) {
    TPLOG_DEBUG(log, "Using simulated transport (latency=%.1fms loss=%.1f%% duplicate_every=%u)",
                cfg.transport.simulated.latency_ms,
                cfg.transport.simulated.loss_percent,
                cfg.transport.simulated.duplicate_every);
    return ensure_network(cfg, clock)->server_transport();
}

ClientTransportPtr SimulatedTransportFactory::create_client(const Config& cfg, Clock& clock, LoggerPtr log) {
    auto client = ensure_network(cfg, clock)->connect_client();
    TPLOG_DEBUG(log, "Attached simulated client %llu",
                static_cast<unsigned long long>(client->client_id()));
    return client;
}

std::unique_ptr<ITransportFactory> make_transport_factory(const Config& cfg) {
    if (cfg.transport.kind == "udp") return std::make_unique<UdpTransportFactory>();
    if (cfg.transport.kind == "simulated") return std::make_unique<SimulatedTransportFactory>();
    return nullptr;
}

} // namespace tickprobe::net

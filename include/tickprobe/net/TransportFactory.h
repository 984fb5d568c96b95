// SPDX-License-Identifier: BSD-2-Clause

#pragma once

#include "tickprobe/config/Config.h"
#include "tickprobe/log/Log.h"
#include "tickprobe/net/Transport.h"
#include "tickprobe/probe/Clock.h"

#include <memory>

namespace tickprobe::net {

class SimulatedNetwork;

class ITransportFactory {
public:
    virtual ~ITransportFactory() = default;
    virtual ServerTransportPtr create_server(const Config& cfg, Clock& clock, LoggerPtr log) = 0;
    virtual ClientTransportPtr create_client(const Config& cfg, Clock& clock, LoggerPtr log) = 0;
};

// Real sockets; server binds cfg.probe.address, client connects to it.
class UdpTransportFactory : public ITransportFactory {
public:
    ServerTransportPtr create_server(const Config& cfg, Clock& clock, LoggerPtr log) override;
    ClientTransportPtr create_client(const Config& cfg, Clock& clock, LoggerPtr log) override;
};

// Every transport created by one factory instance shares one in-process network.
class SimulatedTransportFactory : public ITransportFactory {
public:
    ServerTransportPtr create_server(const Config& cfg, Clock& clock, LoggerPtr log) override;
    ClientTransportPtr create_client(const Config& cfg, Clock& clock, LoggerPtr log) override;

    /// Network created on first use (nullptr before).
    std::shared_ptr<SimulatedNetwork> network() const { return network_; }

private:
    std::shared_ptr<SimulatedNetwork> ensure_network(const Config& cfg, Clock& clock);

    std::shared_ptr<SimulatedNetwork> network_;
};

// Factory for cfg.transport.kind; nullptr when the kind is unknown.
std::unique_ptr<ITransportFactory> make_transport_factory(const Config& cfg);

} // namespace tickprobe::net

// SPDX-License-Identifier: BSD-2-Clause

#pragma once
/**
 * @file Transport.h
 * @brief Backend-agnostic transport facade consumed by the probe roles.
 *
 * Contract shared by all backends:
 *  - step() advances transport-internal processing (socket reads, resends,
 *    simulated deliveries) and never blocks longer than @p max_duration.
 *  - drain_*() hand over everything queued since the previous call, in arrival
 *    order, and leave the queue empty.
 *  - send_message() never blocks; failures surface through drain_errors().
 *
 * Backends (UDP, simulated) hide their details behind these interfaces.
 */

#include "tickprobe/net/Messages.h"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace tickprobe::net {

using Duration = std::chrono::steady_clock::duration;

/**
 * @brief Server-side handle of one connected client.
 */
class ServerConnection {
public:
    virtual ~ServerConnection() = default;

    /// Opaque identifier assigned by the transport on admission.
    virtual std::uint64_t client_id() const = 0;

    /// Messages received from this client since the last call.
    virtual std::vector<ClientMessage> drain_client_messages() = 0;

    /// Queue @p msg towards this client with the requested guarantee.
    virtual void send_message(DeliveryClass cls, const ServerMessage& msg) = 0;
};

using ServerConnectionPtr = std::shared_ptr<ServerConnection>;

/**
 * @brief Connection lifecycle notification produced by a server transport.
 */
struct ConnectionEvent {
    enum class Kind {
        Connect,
        Disconnect
    };

    Kind kind{Kind::Connect};
    ServerConnectionPtr connection;  ///< Set for Connect.
    std::uint64_t client_id{0};      ///< Set for both kinds.
    std::string reason;              ///< Set for Disconnect.

    static ConnectionEvent connect(ServerConnectionPtr conn) {
        ConnectionEvent ev;
        ev.kind = Kind::Connect;
        ev.client_id = conn ? conn->client_id() : 0;
        ev.connection = std::move(conn);
        return ev;
    }

    static ConnectionEvent disconnect(std::uint64_t id, std::string why) {
        ConnectionEvent ev;
        ev.kind = Kind::Disconnect;
        ev.client_id = id;
        ev.reason = std::move(why);
        return ev;
    }
};

/**
 * @brief Listening side of the transport.
 */
class ServerTransport {
public:
    virtual ~ServerTransport() = default;

    virtual void step(Duration max_duration) = 0;
    virtual std::vector<std::string> drain_errors() = 0;
    virtual std::vector<ConnectionEvent> drain_connections() = 0;
};

/**
 * @brief Connecting side of the transport.
 */
class ClientTransport {
public:
    virtual ~ClientTransport() = default;

    virtual void step(Duration max_duration) = 0;
    virtual std::vector<std::string> drain_errors() = 0;
    virtual std::vector<ServerMessage> drain_server_messages() = 0;
    virtual void send_message(DeliveryClass cls, const ClientMessage& msg) = 0;
};

using ServerTransportPtr = std::unique_ptr<ServerTransport>;
using ClientTransportPtr = std::unique_ptr<ClientTransport>;

} // namespace tickprobe::net

// SPDX-License-Identifier: BSD-2-Clause

#pragma once
/**
 * @file ConnectionTracker.h
 * @brief Single logical peer connection per role instance.
 */

#include "tickprobe/log/Log.h"
#include "tickprobe/net/Transport.h"

#include <cstdint>

namespace tickprobe {

/**
 * @brief Server side: one optional connection slot.
 *
 * A Connect overwrites whatever is stored (the replacement is logged) and is
 * answered with AllowConnection on the reliable-ordered channel. A Disconnect
 * clears the slot only when its client id matches the tracked connection.
 */
class ServerConnectionTracker {
public:
    explicit ServerConnectionTracker(LoggerPtr log);

    void on_event(const net::ConnectionEvent& ev);

    bool connected() const { return static_cast<bool>(connection_); }
    const net::ServerConnectionPtr& connection() const { return connection_; }

    /// True once any client was admitted during the run.
    bool ever_connected() const { return ever_connected_; }

    std::uint64_t connects() const { return connects_; }
    std::uint64_t disconnects() const { return disconnects_; }

private:
    LoggerPtr log_;
    net::ServerConnectionPtr connection_;
    bool ever_connected_ = false;
    std::uint64_t connects_ = 0;
    std::uint64_t disconnects_ = 0;
};

/**
 * @brief Client side: the connected flag flipped by AllowConnection.
 *
 * The raw transport connection does not gate sending; only AllowConnection
 * does. The handshake is sent once.
 */
class ClientConnectionGate {
public:
    ClientConnectionGate(LoggerPtr log, net::ConnectionInfo handshake);

    /**
     * @brief Handle AllowConnection.
     * @return true if this call flipped the gate (the handshake was sent).
     */
    bool on_allow_connection(net::ClientTransport& transport);

    bool connected() const { return connected_; }

private:
    LoggerPtr log_;
    net::ConnectionInfo handshake_;
    bool connected_ = false;
};

} // namespace tickprobe

// SPDX-License-Identifier: BSD-2-Clause

#include "tickprobe/probe/ConnectionTracker.h"

#include <utility>

namespace tickprobe {

ServerConnectionTracker::ServerConnectionTracker(LoggerPtr log)
    : log_(std::move(log)) {}

void ServerConnectionTracker::on_event(const net::ConnectionEvent& ev) {
    using Kind = net::ConnectionEvent::Kind;

    if (ev.kind == Kind::Connect) {
        if (!ev.connection) return;
        ++connects_;
        if (connection_) {
            TPLOG_WARN(log_, "Client %llu replaces tracked client %llu",
                       static_cast<unsigned long long>(ev.client_id),
                       static_cast<unsigned long long>(connection_->client_id()));
        }
        TPLOG_INFO(log_, "Client connected: id=%llu", static_cast<unsigned long long>(ev.client_id));
        connection_ = ev.connection;
        ever_connected_ = true;
        connection_->send_message(net::DeliveryClass::ReliableOrdered, net::AllowConnection{});
        return;
    }

    // Any Disconnect empties the single slot, whichever client it names.
    ++disconnects_;
    TPLOG_INFO(log_, "Client disconnected: id=%llu reason=%s",
               static_cast<unsigned long long>(ev.client_id), ev.reason.c_str());
    connection_.reset();
}

ClientConnectionGate::ClientConnectionGate(LoggerPtr log, net::ConnectionInfo handshake)
    : log_(std::move(log)), handshake_(std::move(handshake)) {}

bool ClientConnectionGate::on_allow_connection(net::ClientTransport& transport) {
    if (connected_) {
        TPLOG_DEBUG(log_, "Repeated AllowConnection ignored");
        return false;
    }
    TPLOG_INFO(log_, "Connection allowed, starting test...");
    transport.send_message(net::DeliveryClass::ReliableOrdered, handshake_);
    connected_ = true;
    return true;
}

} // namespace tickprobe

// SPDX-License-Identifier: BSD-2-Clause

#include "tickprobe/net/UdpTransport.h"

#include "tickprobe/net/ReliableChannel.h"
#include "tickprobe/net/WireCodec.h"

#include "tickprobe_wire.pb.h"

#include <system_error>
#include <utility>

namespace tickprobe::net {
namespace detail {

/**
 * @brief Datagram session with one remote endpoint.
 *
 * Shared by both sides: the server keeps one per admitted peer, the client
 * keeps one towards the server.
 */
class UdpLink {
public:
    UdpLink(std::shared_ptr<UdpSocket> socket,
            const sockaddr_in& remote,
            const Config::UdpConfig& cfg,
            Clock::time_point now)
        : socket_(std::move(socket)),
          remote_(remote),
          cfg_(cfg),
          reliable_(std::chrono::milliseconds(cfg.resend_interval_ms)),
          last_heard_(now),
          last_sent_(now) {}

    void send_control(wire::Datagram::Kind kind,
                      Clock::time_point now,
                      std::uint64_t client_id = 0,
                      const std::string& reason = {}) {
        wire::Datagram dg;
        dg.set_kind(kind);
        dg.set_client_id(client_id);
        if (!reason.empty()) dg.set_reason(reason);
        transmit(dg, now);
    }

    void send_unreliable(std::string payload, Clock::time_point now) {
        wire::Datagram dg;
        dg.set_kind(wire::Datagram::UNRELIABLE);
        dg.set_payload(std::move(payload));
        transmit(dg, now);
    }

    void queue_reliable(std::string payload) {
        reliable_.enqueue(std::move(payload));
    }

    /// Put due reliable payloads on the wire.
    void flush_reliable(Clock::time_point now) {
        for (auto& out : reliable_.collect_due(now)) {
            wire::Datagram dg;
            dg.set_kind(wire::Datagram::RELIABLE);
            dg.set_reliable_id(out.id);
            dg.set_payload(std::move(out.payload));
            transmit(dg, now);
        }
    }

    /// Resends plus a keepalive when nothing was sent for a while.
    void service(Clock::time_point now) {
        flush_reliable(now);
        if (now - last_sent_ >= seconds_to_duration(cfg_.keepalive_interval_seconds)) {
            send_control(wire::Datagram::KEEPALIVE, now);
        }
    }

    /**
     * @brief Process a payload-carrying or ack datagram from the remote.
     * @return Application payloads now deliverable, in order.
     */
    std::vector<std::string> on_datagram(wire::Datagram& dg, Clock::time_point now) {
        last_heard_ = now;
        std::vector<std::string> out;
        switch (dg.kind()) {
        case wire::Datagram::UNRELIABLE:
            out.push_back(std::move(*dg.mutable_payload()));
            break;
        case wire::Datagram::RELIABLE: {
            reliable_.on_receive(dg.reliable_id(), std::move(*dg.mutable_payload()));
            wire::Datagram ack;
            ack.set_kind(wire::Datagram::ACK);
            ack.set_ack(reliable_.cumulative_ack());
            transmit(ack, now);
            out = reliable_.drain_ordered();
            break;
        }
        case wire::Datagram::ACK:
            reliable_.on_ack(dg.ack());
            break;
        default:
            break;
        }
        return out;
    }

    void touch(Clock::time_point now) { last_heard_ = now; }
    Clock::time_point last_heard() const { return last_heard_; }

    std::vector<std::string> take_errors() {
        std::vector<std::string> out;
        out.swap(errors_);
        return out;
    }

    const sockaddr_in& remote() const { return remote_; }

private:
    void transmit(const wire::Datagram& dg, Clock::time_point now) {
        const std::string bytes = dg.SerializeAsString();
        if (bytes.size() > cfg_.max_datagram_bytes) {
            errors_.push_back("datagram of " + std::to_string(bytes.size()) +
                              " bytes exceeds max_datagram_bytes");
            return;
        }
        std::string error;
        if (!socket_->send_to(remote_, bytes, error)) {
            errors_.push_back(std::move(error));
            return;
        }
        last_sent_ = now;
    }

    std::shared_ptr<UdpSocket> socket_;
    sockaddr_in remote_{};
    Config::UdpConfig cfg_;
    ReliableChannel reliable_;
    Clock::time_point last_heard_;
    Clock::time_point last_sent_;
    std::vector<std::string> errors_;
};

/**
 * @brief ServerConnection handed to the server role for one admitted peer.
 */
class UdpPeerConnection final : public ServerConnection {
public:
    UdpPeerConnection(std::uint64_t id,
                      std::shared_ptr<UdpSocket> socket,
                      const sockaddr_in& remote,
                      const Config::UdpConfig& cfg,
                      Clock& clock)
        : id_(id), clock_(clock), link_(std::move(socket), remote, cfg, clock.now()) {}

    std::uint64_t client_id() const override { return id_; }

    std::vector<ClientMessage> drain_client_messages() override {
        std::vector<ClientMessage> out;
        out.swap(inbox_);
        return out;
    }

    void send_message(DeliveryClass cls, const ServerMessage& msg) override {
        if (closed_) return;
        const auto now = clock_.now();
        auto bytes = encode_server_message(msg);
        if (cls == DeliveryClass::ReliableOrdered) {
            link_.queue_reliable(std::move(bytes));
            link_.flush_reliable(now);
        } else {
            link_.send_unreliable(std::move(bytes), now);
        }
    }

    void deliver(ClientMessage msg) { inbox_.push_back(std::move(msg)); }
    void close() { closed_ = true; }
    bool closed() const { return closed_; }
    UdpLink& link() { return link_; }

private:
    std::uint64_t id_;
    Clock& clock_;
    UdpLink link_;
    std::vector<ClientMessage> inbox_;
    bool closed_ = false;
};

} // namespace detail

namespace {

bool same_endpoint(const sockaddr_in& a, const sockaddr_in& b) {
    return a.sin_addr.s_addr == b.sin_addr.s_addr && a.sin_port == b.sin_port;
}

} // namespace

// -----------------------------------------------------------------------------
// Server
// -----------------------------------------------------------------------------

UdpServerTransport::UdpServerTransport(const std::string& address,
                                       const Config::UdpConfig& cfg,
                                       Clock& clock,
                                       LoggerPtr log)
    : socket_(std::make_shared<UdpSocket>(UdpSocket::bind_to(address))),
      cfg_(cfg),
      clock_(clock),
      log_(std::move(log)) {
    TPLOG_INFO(log_, "UDP server listening on %s",
               endpoint_to_string(socket_->local_endpoint()).c_str());
}

UdpServerTransport::~UdpServerTransport() {
    const auto now = clock_.now();
    for (auto& [key, peer] : peers_) {
        peer->link().send_control(wire::Datagram::DISCONNECT, now, peer->client_id(), "server shutting down");
        peer->close();
    }
}

void UdpServerTransport::step(Duration max_duration) {
    if (socket_->wait_readable(max_duration)) {
        for (;;) {
            std::string error;
            auto rx = socket_->receive(cfg_.max_datagram_bytes, error);
            if (!rx) {
                if (!error.empty()) errors_.push_back(std::move(error));
                break;
            }
            handle_datagram(*rx, clock_.now());
        }
    }
    service_peers(clock_.now());
}

void UdpServerTransport::handle_datagram(const UdpSocket::Received& rx, Clock::time_point now) {
    wire::Datagram dg;
    if (!dg.ParseFromString(rx.bytes)) {
        TPLOG_WARN(log_, "Ignoring malformed datagram from %s", endpoint_to_string(rx.from).c_str());
        return;
    }

    const std::string key = endpoint_to_string(rx.from);
    auto it = peers_.find(key);

    if (dg.kind() == wire::Datagram::CONNECT) {
        if (it != peers_.end()) {
            // Our ACCEPT was lost; repeat it.
            it->second->link().touch(now);
            it->second->link().send_control(wire::Datagram::ACCEPT, now, it->second->client_id());
            return;
        }
        const auto id = next_client_id_++;
        auto peer = std::make_shared<detail::UdpPeerConnection>(id, socket_, rx.from, cfg_, clock_);
        peer->link().send_control(wire::Datagram::ACCEPT, now, id);
        peers_.emplace(key, peer);
        TPLOG_DEBUG(log_, "Admitted %s as client %llu", key.c_str(), static_cast<unsigned long long>(id));
        events_.push_back(ConnectionEvent::connect(peer));
        return;
    }

    if (it == peers_.end()) {
        TPLOG_DEBUG(log_, "Ignoring datagram kind=%d from unknown endpoint %s",
                    static_cast<int>(dg.kind()), key.c_str());
        return;
    }

    if (dg.kind() == wire::Datagram::DISCONNECT) {
        drop_peer(key, dg.reason().empty() ? "disconnected" : dg.reason());
        return;
    }

    auto& peer = *it->second;
    for (auto& payload : peer.link().on_datagram(dg, now)) {
        auto msg = decode_client_message(payload);
        if (!msg) {
            TPLOG_WARN(log_, "Undecodable payload from client %llu",
                       static_cast<unsigned long long>(peer.client_id()));
            continue;
        }
        peer.deliver(std::move(*msg));
    }
}

void UdpServerTransport::service_peers(Clock::time_point now) {
    const auto timeout = seconds_to_duration(cfg_.peer_timeout_seconds);
    std::vector<std::string> expired;
    for (auto& [key, peer] : peers_) {
        if (now - peer->link().last_heard() > timeout) {
            expired.push_back(key);
            continue;
        }
        peer->link().service(now);
        for (auto& err : peer->link().take_errors()) {
            errors_.push_back("client " + std::to_string(peer->client_id()) + ": " + err);
        }
    }
    for (const auto& key : expired) {
        drop_peer(key, "timeout");
    }
}

void UdpServerTransport::drop_peer(const std::string& key, const std::string& reason) {
    auto it = peers_.find(key);
    if (it == peers_.end()) return;
    it->second->close();
    events_.push_back(ConnectionEvent::disconnect(it->second->client_id(), reason));
    peers_.erase(it);
}

std::vector<std::string> UdpServerTransport::drain_errors() {
    std::vector<std::string> out;
    out.swap(errors_);
    return out;
}

std::vector<ConnectionEvent> UdpServerTransport::drain_connections() {
    std::vector<ConnectionEvent> out;
    out.swap(events_);
    return out;
}

// -----------------------------------------------------------------------------
// Client
// -----------------------------------------------------------------------------

UdpClientTransport::UdpClientTransport(const std::string& server_address,
                                       const Config::UdpConfig& cfg,
                                       Clock& clock,
                                       LoggerPtr log)
    : socket_(std::make_shared<UdpSocket>(UdpSocket::open())),
      cfg_(cfg),
      clock_(clock),
      log_(std::move(log)) {
    auto endpoint = resolve_endpoint(server_address);
    if (!endpoint) {
        throw std::system_error(std::make_error_code(std::errc::invalid_argument),
                                "cannot resolve address " + server_address);
    }
    server_ = *endpoint;

    const auto now = clock_.now();
    link_ = std::make_unique<detail::UdpLink>(socket_, server_, cfg_, now);
    connect_started_ = now;
    last_connect_attempt_ = now;
    link_->send_control(wire::Datagram::CONNECT, now);
    TPLOG_DEBUG(log_, "Sent CONNECT to %s", server_address.c_str());
}

UdpClientTransport::~UdpClientTransport() {
    if (state_ == State::Connected) {
        link_->send_control(wire::Datagram::DISCONNECT, clock_.now(), client_id_, "client closed");
    }
}

void UdpClientTransport::fail(std::string error) {
    state_ = State::Failed;
    errors_.push_back(std::move(error));
}

void UdpClientTransport::step(Duration max_duration) {
    if (state_ == State::Failed) return;

    if (socket_->wait_readable(max_duration)) {
        for (;;) {
            std::string error;
            auto rx = socket_->receive(cfg_.max_datagram_bytes, error);
            if (!rx) {
                if (!error.empty()) fail(std::move(error));
                break;
            }
            handle_datagram(*rx, clock_.now());
            if (state_ == State::Failed) return;
        }
    }

    const auto now = clock_.now();
    if (state_ == State::Connecting) {
        if (now - connect_started_ >= seconds_to_duration(cfg_.connect_timeout_seconds)) {
            fail("connection timed out");
            return;
        }
        if (now - last_connect_attempt_ >= std::chrono::milliseconds(cfg_.resend_interval_ms)) {
            last_connect_attempt_ = now;
            link_->send_control(wire::Datagram::CONNECT, now);
        }
    } else if (state_ == State::Connected) {
        if (now - link_->last_heard() > seconds_to_duration(cfg_.peer_timeout_seconds)) {
            fail("server timed out");
            return;
        }
        link_->service(now);
    }

    for (auto& err : link_->take_errors()) {
        fail(std::move(err));
    }
}

void UdpClientTransport::handle_datagram(const UdpSocket::Received& rx, Clock::time_point now) {
    if (!same_endpoint(rx.from, server_)) {
        TPLOG_DEBUG(log_, "Ignoring datagram from %s", endpoint_to_string(rx.from).c_str());
        return;
    }
    wire::Datagram dg;
    if (!dg.ParseFromString(rx.bytes)) {
        TPLOG_WARN(log_, "Ignoring malformed datagram from server");
        return;
    }

    switch (dg.kind()) {
    case wire::Datagram::ACCEPT:
        if (state_ == State::Connecting) {
            state_ = State::Connected;
            client_id_ = dg.client_id();
            link_->touch(now);
            link_->flush_reliable(now);
            TPLOG_INFO(log_, "Connected to %s as client %llu",
                       endpoint_to_string(server_).c_str(),
                       static_cast<unsigned long long>(client_id_));
        }
        return;
    case wire::Datagram::DISCONNECT:
        fail("disconnected by server: " + (dg.reason().empty() ? std::string("no reason") : dg.reason()));
        return;
    default:
        break;
    }

    if (state_ != State::Connected) return;
    for (auto& payload : link_->on_datagram(dg, now)) {
        auto msg = decode_server_message(payload);
        if (!msg) {
            TPLOG_WARN(log_, "Undecodable payload from server");
            continue;
        }
        inbox_.push_back(std::move(*msg));
    }
}

std::vector<std::string> UdpClientTransport::drain_errors() {
    std::vector<std::string> out;
    out.swap(errors_);
    return out;
}

std::vector<ServerMessage> UdpClientTransport::drain_server_messages() {
    std::vector<ServerMessage> out;
    out.swap(inbox_);
    return out;
}

void UdpClientTransport::send_message(DeliveryClass cls, const ClientMessage& msg) {
    if (state_ == State::Failed) return;
    auto bytes = encode_client_message(msg);
    const auto now = clock_.now();
    if (cls == DeliveryClass::ReliableOrdered) {
        link_->queue_reliable(std::move(bytes));
        if (state_ == State::Connected) link_->flush_reliable(now);
        return;
    }
    if (state_ != State::Connected) {
        TPLOG_DEBUG(log_, "Dropping unreliable message sent before the connection was accepted");
        return;
    }
    link_->send_unreliable(std::move(bytes), now);
}

} // namespace tickprobe::net

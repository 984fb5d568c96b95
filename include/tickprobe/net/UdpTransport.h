// SPDX-License-Identifier: BSD-2-Clause

#pragma once
/**
 * @file UdpTransport.h
 * @brief Transport facade over plain UDP datagrams.
 *
 * Every datagram is a protobuf Datagram envelope (tickprobe_wire.proto).
 * Admission is a CONNECT/ACCEPT exchange, reliable-ordered traffic goes
 * through a per-peer ReliableChannel and idle links send KEEPALIVE.
 */

#include "tickprobe/config/Config.h"
#include "tickprobe/log/Log.h"
#include "tickprobe/net/Transport.h"
#include "tickprobe/net/UdpSocket.h"
#include "tickprobe/probe/Clock.h"

#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace tickprobe::net {

namespace detail {
class UdpLink;
class UdpPeerConnection;
}

class UdpServerTransport final : public ServerTransport {
public:
    /**
     * @brief Bind the listening socket.
     * @throws std::system_error when @p address cannot be resolved or bound.
     */
    UdpServerTransport(const std::string& address,
                       const Config::UdpConfig& cfg,
                       Clock& clock,
                       LoggerPtr log);
    ~UdpServerTransport() override;

    void step(Duration max_duration) override;
    std::vector<std::string> drain_errors() override;
    std::vector<ConnectionEvent> drain_connections() override;

    sockaddr_in local_endpoint() const { return socket_->local_endpoint(); }
    std::size_t peer_count() const { return peers_.size(); }

private:
    void handle_datagram(const UdpSocket::Received& rx, Clock::time_point now);
    void service_peers(Clock::time_point now);
    void drop_peer(const std::string& key, const std::string& reason);

    std::shared_ptr<UdpSocket> socket_;
    Config::UdpConfig cfg_;
    Clock& clock_;
    LoggerPtr log_;

    std::unordered_map<std::string, std::shared_ptr<detail::UdpPeerConnection>> peers_;
    std::uint64_t next_client_id_{1};

    std::vector<std::string> errors_;
    std::vector<ConnectionEvent> events_;
};

class UdpClientTransport final : public ClientTransport {
public:
    /**
     * @brief Open a socket and start the CONNECT handshake with @p server_address.
     * @throws std::system_error when the address does not resolve or the socket fails.
     */
    UdpClientTransport(const std::string& server_address,
                       const Config::UdpConfig& cfg,
                       Clock& clock,
                       LoggerPtr log);
    ~UdpClientTransport() override;

    void step(Duration max_duration) override;
    std::vector<std::string> drain_errors() override;
    std::vector<ServerMessage> drain_server_messages() override;
    void send_message(DeliveryClass cls, const ClientMessage& msg) override;

    bool connected() const { return state_ == State::Connected; }
    std::uint64_t client_id() const { return client_id_; }

private:
    enum class State {
        Connecting,
        Connected,
        Failed
    };

    void handle_datagram(const UdpSocket::Received& rx, Clock::time_point now);
    void fail(std::string error);

    std::shared_ptr<UdpSocket> socket_;
    sockaddr_in server_{};
    Config::UdpConfig cfg_;
    Clock& clock_;
    LoggerPtr log_;
    std::unique_ptr<detail::UdpLink> link_;

    State state_{State::Connecting};
    std::uint64_t client_id_{0};
    Clock::time_point connect_started_{};
    Clock::time_point last_connect_attempt_{};

    std::vector<std::string> errors_;
    std::vector<ServerMessage> inbox_;
};

} // namespace tickprobe::net
